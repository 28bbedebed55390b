// Repository: avpipe
// Component: PacketStream
// Purpose: Packet source / sink interfaces at the demux and mux boundary.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_IO_PACKET_STREAM_HPP_
#define AVPIPE_IO_PACKET_STREAM_HPP_

#include "avpipe/buffer/Packet.hpp"
#include "avpipe/io/StreamDescriptor.hpp"
#include "avpipe/util/MediaError.hpp"

namespace avpipe::io {

// Supplies the compressed packets of one stream, in demux (decode) order.
// Implemented by MediaReader (file demux) and by test fixtures.
class IPacketSource {
 public:
  virtual ~IPacketSource() = default;

  virtual const StreamDescriptor& Descriptor() const = 0;

  // kOk with `out` filled, kEndOfStream once exhausted, or an error.
  virtual util::MediaError ReadPacket(buffer::Packet& out) = 0;
};

// Receives every packet an encoder emits, in strictly increasing DTS order.
// Ownership of the packet moves to the sink.
class IPacketSink {
 public:
  virtual ~IPacketSink() = default;

  virtual util::MediaError WritePacket(buffer::Packet packet) = 0;
};

}  // namespace avpipe::io

#endif  // AVPIPE_IO_PACKET_STREAM_HPP_
