// Repository: avpipe
// Component: PacketCollector
// Purpose: In-memory packet sink, and a source replaying collected packets.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_IO_PACKET_COLLECTOR_HPP_
#define AVPIPE_IO_PACKET_COLLECTOR_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "avpipe/buffer/Packet.hpp"
#include "avpipe/io/PacketStream.hpp"
#include "avpipe/io/StreamDescriptor.hpp"

namespace avpipe::io {

// Keeps every packet written to it, in arrival order.
class PacketCollector : public IPacketSink {
 public:
  util::MediaError WritePacket(buffer::Packet packet) override;

  const std::vector<buffer::Packet>& Packets() const { return packets_; }
  size_t Count() const { return packets_.size(); }
  int64_t TotalBytes() const { return total_bytes_; }
  void Clear();

 private:
  std::vector<buffer::Packet> packets_;
  int64_t total_bytes_ = 0;
};

// Hands out clones of a packet list; the list itself is not consumed, so the
// same collected stream can be decoded more than once.
class PacketReplay : public IPacketSource {
 public:
  PacketReplay(const StreamDescriptor& descriptor, const std::vector<buffer::Packet>& packets);

  const StreamDescriptor& Descriptor() const override { return descriptor_; }
  util::MediaError ReadPacket(buffer::Packet& out) override;

 private:
  StreamDescriptor descriptor_;
  const std::vector<buffer::Packet>& packets_;
  size_t next_ = 0;
};

}  // namespace avpipe::io

#endif  // AVPIPE_IO_PACKET_COLLECTOR_HPP_
