// Repository: avpipe
// Component: Packet
// Purpose: Owning wrapper around a reference-counted AVPacket.
// Copyright (c) 2025 RetroVue

#include "avpipe/buffer/Packet.hpp"

#include <cstring>
#include <utility>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/buffer.h>
}

#include "avpipe/time/NativeRational.hpp"

namespace avpipe::buffer {

namespace {

using util::MediaError;

time::Time NativeTs(int64_t ts, const time::Rational& tb) {
  if (ts == AV_NOPTS_VALUE) return time::Time(std::nullopt, tb);
  return time::Time(ts, tb);
}

int64_t ToNativeTs(const time::Time& t, const time::Rational& tb) {
  if (!t.HasValue()) return AV_NOPTS_VALUE;
  return *t.AlignedWith(tb).Value();
}

int64_t RescaleNativeTs(int64_t ts, const time::Rational& from, const time::Rational& to) {
  if (ts == AV_NOPTS_VALUE) return ts;
  return time::RescaleTicks(ts, from, to);
}

}  // namespace

Packet::Packet(AVPacket* raw_packet, const time::Rational& time_base) noexcept
    : raw_packet_(raw_packet), time_base_(time_base) {}

Packet::~Packet() {
  Reset();
}

Packet::Packet(Packet&& other) noexcept
    : raw_packet_(std::exchange(other.raw_packet_, nullptr)),
      time_base_(other.time_base_) {}

Packet& Packet::operator=(Packet&& other) noexcept {
  if (this != &other) {
    Reset();
    raw_packet_ = std::exchange(other.raw_packet_, nullptr);
    time_base_ = other.time_base_;
  }
  return *this;
}

void Packet::Reset() noexcept {
  if (raw_packet_) {
    av_packet_free(&raw_packet_);
  }
}

Packet Packet::AttachRawPacket(AVPacket* raw_packet, const time::Rational& time_base) {
  if (raw_packet) {
    raw_packet->time_base = time::ToAVRational(time_base);
  }
  return Packet(raw_packet, time_base);
}

MediaError Packet::Allocate(const time::Rational& time_base, Packet& out) {
  AVPacket* pkt = av_packet_alloc();
  if (!pkt) return MediaError::kOutOfMemory;
  out = AttachRawPacket(pkt, time_base);
  return MediaError::kOk;
}

MediaError Packet::CopyFrom(const uint8_t* data, size_t size,
                            const time::Rational& time_base, Packet& out) {
  if (size > static_cast<size_t>(INT32_MAX) || (size > 0 && !data)) {
    return MediaError::kInvalidBuffer;
  }
  Packet pkt;
  MediaError err = Allocate(time_base, pkt);
  if (err != MediaError::kOk) return err;
  if (size > 0) {
    int ret = av_new_packet(pkt.raw_packet_, static_cast<int>(size));
    if (ret < 0) return util::MapNativeError(ret, util::NativeContext::kBuffer);
    std::memcpy(pkt.raw_packet_->data, data, size);
  }
  out = std::move(pkt);
  return MediaError::kOk;
}

MediaError Packet::Clone(Packet& out) const {
  if (!raw_packet_) {
    out = Packet(nullptr, time_base_);
    return MediaError::kOk;
  }
  AVPacket* pkt = av_packet_alloc();
  if (!pkt) return MediaError::kOutOfMemory;
  int ret = av_packet_ref(pkt, raw_packet_);
  if (ret < 0) {
    av_packet_free(&pkt);
    return util::MapNativeError(ret, util::NativeContext::kBuffer);
  }
  out = AttachRawPacket(pkt, time_base_);
  return MediaError::kOk;
}

bool Packet::IsEmpty() const {
  return !raw_packet_ || raw_packet_->size == 0;
}

const uint8_t* Packet::Data() const {
  return raw_packet_ ? raw_packet_->data : nullptr;
}

size_t Packet::Size() const {
  return raw_packet_ ? static_cast<size_t>(raw_packet_->size) : 0;
}

MediaError Packet::MutableData(uint8_t** data) {
  if (!raw_packet_ || !data) return MediaError::kInvalidBuffer;
  int ret = av_packet_make_writable(raw_packet_);
  if (ret < 0) return util::MapNativeError(ret, util::NativeContext::kBuffer);
  *data = raw_packet_->data;
  return MediaError::kOk;
}

int Packet::StreamIndex() const {
  return raw_packet_ ? raw_packet_->stream_index : -1;
}

void Packet::SetStreamIndex(int index) {
  if (raw_packet_) raw_packet_->stream_index = index;
}

time::Time Packet::Pts() const {
  return NativeTs(raw_packet_ ? raw_packet_->pts : AV_NOPTS_VALUE, time_base_);
}

time::Time Packet::Dts() const {
  return NativeTs(raw_packet_ ? raw_packet_->dts : AV_NOPTS_VALUE, time_base_);
}

time::Time Packet::Duration() const {
  if (!raw_packet_) return time::Time(std::nullopt, time_base_);
  // FFmpeg uses 0 for "unknown duration".
  if (raw_packet_->duration <= 0) return time::Time(std::nullopt, time_base_);
  return time::Time(raw_packet_->duration, time_base_);
}

void Packet::SetPts(const time::Time& pts) {
  if (raw_packet_) raw_packet_->pts = ToNativeTs(pts, time_base_);
}

void Packet::SetDts(const time::Time& dts) {
  if (raw_packet_) raw_packet_->dts = ToNativeTs(dts, time_base_);
}

void Packet::SetDuration(const time::Time& duration) {
  if (!raw_packet_) return;
  raw_packet_->duration = duration.HasValue() ? *duration.AlignedWith(time_base_).Value() : 0;
}

bool Packet::IsKey() const {
  return raw_packet_ && (raw_packet_->flags & AV_PKT_FLAG_KEY) != 0;
}

void Packet::SetKey(bool key) {
  if (!raw_packet_) return;
  if (key) {
    raw_packet_->flags |= AV_PKT_FLAG_KEY;
  } else {
    raw_packet_->flags &= ~AV_PKT_FLAG_KEY;
  }
}

bool Packet::IsCorrupt() const {
  return raw_packet_ && (raw_packet_->flags & AV_PKT_FLAG_CORRUPT) != 0;
}

void Packet::RescaleTs(const time::Rational& time_base) {
  if (time_base == time_base_) return;
  if (raw_packet_) {
    raw_packet_->pts = RescaleNativeTs(raw_packet_->pts, time_base_, time_base);
    raw_packet_->dts = RescaleNativeTs(raw_packet_->dts, time_base_, time_base);
    if (raw_packet_->duration > 0) {
      raw_packet_->duration = time::RescaleTicks(raw_packet_->duration, time_base_, time_base);
    }
    raw_packet_->time_base = time::ToAVRational(time_base);
  }
  time_base_ = time_base;
}

int Packet::ReferenceCount() const {
  if (!raw_packet_ || !raw_packet_->buf) return 0;
  return av_buffer_get_ref_count(raw_packet_->buf);
}

}  // namespace avpipe::buffer
