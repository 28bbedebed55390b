// Repository: avpipe
// Component: PacketCollector
// Purpose: In-memory packet sink, and a source replaying collected packets.
// Copyright (c) 2025 RetroVue

#include "avpipe/io/PacketCollector.hpp"

#include <utility>

namespace avpipe::io {

util::MediaError PacketCollector::WritePacket(buffer::Packet packet) {
  if (!packet.HasNative()) return util::MediaError::kInvalidBuffer;
  total_bytes_ += static_cast<int64_t>(packet.Size());
  packets_.push_back(std::move(packet));
  return util::MediaError::kOk;
}

void PacketCollector::Clear() {
  packets_.clear();
  total_bytes_ = 0;
}

PacketReplay::PacketReplay(const StreamDescriptor& descriptor,
                           const std::vector<buffer::Packet>& packets)
    : descriptor_(descriptor), packets_(packets) {}

util::MediaError PacketReplay::ReadPacket(buffer::Packet& out) {
  if (next_ >= packets_.size()) return util::MediaError::kEndOfStream;
  return packets_[next_++].Clone(out);
}

}  // namespace avpipe::io
