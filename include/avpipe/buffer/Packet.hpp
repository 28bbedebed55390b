// Repository: avpipe
// Component: Packet
// Purpose: Owning wrapper around a reference-counted AVPacket.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_BUFFER_PACKET_HPP_
#define AVPIPE_BUFFER_PACKET_HPP_

#include <cstddef>
#include <cstdint>

#include "avpipe/time/Rational.hpp"
#include "avpipe/time/Time.hpp"
#include "avpipe/util/MediaError.hpp"

// Forward declaration (avoids pulling FFmpeg headers into every includer)
struct AVPacket;

namespace avpipe::buffer {

// Packet holds exactly one reference to a native AVPacket and releases it
// exactly once, in the destructor or when overwritten by a move.
//
// Ownership:
// - Move-only. Moving transfers the reference; the source becomes empty.
// - Clone() takes a second native reference (av_packet_ref). Both Packets
//   are then independent owners of the same refcounted payload.
// - MutableData() makes the payload private first (av_packet_make_writable)
//   so a write never shows through another owner.
//
// Timestamps are stored in the native packet in TimeBase() units.
// The wrapper is not internally synchronized; a Packet may be moved to
// another thread, the native refcount is atomic.
class Packet {
 public:
  Packet() noexcept = default;
  ~Packet();

  Packet(const Packet&) = delete;
  Packet& operator=(const Packet&) = delete;
  Packet(Packet&& other) noexcept;
  Packet& operator=(Packet&& other) noexcept;

  // Takes ownership of `raw_packet` (must come from av_packet_alloc).
  static Packet AttachRawPacket(AVPacket* raw_packet, const time::Rational& time_base);

  // Fresh packet without payload. kOutOfMemory on allocation failure.
  static util::MediaError Allocate(const time::Rational& time_base, Packet& out);

  // Packet owning a private copy of `size` bytes.
  static util::MediaError CopyFrom(const uint8_t* data, size_t size,
                                   const time::Rational& time_base, Packet& out);

  // Second owner of the same payload.
  util::MediaError Clone(Packet& out) const;

  bool HasNative() const { return raw_packet_ != nullptr; }
  // No native packet, or a native packet with no payload.
  bool IsEmpty() const;

  const uint8_t* Data() const;
  size_t Size() const;

  // Copy-on-write access to the payload.
  util::MediaError MutableData(uint8_t** data);

  int StreamIndex() const;
  void SetStreamIndex(int index);

  time::Time Pts() const;
  time::Time Dts() const;
  time::Time Duration() const;
  // Setters align the given Time with the packet's time base.
  void SetPts(const time::Time& pts);
  void SetDts(const time::Time& dts);
  void SetDuration(const time::Time& duration);

  bool IsKey() const;
  void SetKey(bool key);
  bool IsCorrupt() const;

  const time::Rational& TimeBase() const { return time_base_; }

  // Re-expresses PTS, DTS and duration in `time_base` (nearest tick).
  void RescaleTs(const time::Rational& time_base);

  // Native refcount of the payload buffer; 0 when there is none.
  int ReferenceCount() const;

  AVPacket* RawPacketPtr() { return raw_packet_; }
  const AVPacket* RawPacketPtr() const { return raw_packet_; }

 private:
  Packet(AVPacket* raw_packet, const time::Rational& time_base) noexcept;
  void Reset() noexcept;

  AVPacket* raw_packet_ = nullptr;
  time::Rational time_base_;
};

}  // namespace avpipe::buffer

#endif  // AVPIPE_BUFFER_PACKET_HPP_
