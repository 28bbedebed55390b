// Repository: avpipe
// Component: Frame
// Purpose: Owning wrapper around a reference-counted AVFrame with
//          copy-on-write plane access.
// Copyright (c) 2025 RetroVue

#include "avpipe/buffer/Frame.hpp"

#include <cstring>
#include <utility>

extern "C" {
#include <libavutil/buffer.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libavutil/pixdesc.h>
}

#include "avpipe/time/NativeRational.hpp"

namespace avpipe::buffer {

namespace {

using util::MediaError;

struct PlaneGeometry {
  int row_bytes = 0;
  int rows = 0;
  int stride = 0;
  uint8_t* data = nullptr;
};

int CeilShift(int value, int shift) {
  return -((-value) >> shift);
}

int VideoPlaneCount(const AVFrame* f) {
  if (f->format < 0 || f->width <= 0 || f->height <= 0) return 0;
  int n = av_pix_fmt_count_planes(static_cast<AVPixelFormat>(f->format));
  return n < 0 ? 0 : n;
}

int AudioPlaneCount(const AVFrame* f) {
  if (f->format < 0 || f->nb_samples <= 0) return 0;
  const int channels = f->ch_layout.nb_channels;
  if (channels <= 0) return 0;
  return av_sample_fmt_is_planar(static_cast<AVSampleFormat>(f->format)) ? channels : 1;
}

bool ComputeGeometry(const AVFrame* f, MediaKind kind, int index, PlaneGeometry* g) {
  if (!f || index < 0) return false;
  if (kind == MediaKind::kVideo) {
    if (index >= VideoPlaneCount(f)) return false;
    const auto fmt = static_cast<AVPixelFormat>(f->format);
    const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(fmt);
    if (!desc) return false;
    const int row_bytes = av_image_get_linesize(fmt, f->width, index);
    if (row_bytes <= 0) return false;
    g->row_bytes = row_bytes;
    g->rows = (index == 1 || index == 2) ? CeilShift(f->height, desc->log2_chroma_h)
                                         : f->height;
    g->stride = f->linesize[index];
    g->data = f->data[index];
    return true;
  }
  if (kind == MediaKind::kAudio) {
    if (index >= AudioPlaneCount(f)) return false;
    const auto fmt = static_cast<AVSampleFormat>(f->format);
    const int bytes_per_sample = av_get_bytes_per_sample(fmt);
    if (bytes_per_sample <= 0) return false;
    const int per_plane_channels = av_sample_fmt_is_planar(fmt) ? 1 : f->ch_layout.nb_channels;
    g->row_bytes = f->nb_samples * bytes_per_sample * per_plane_channels;
    g->rows = 1;
    g->stride = f->linesize[0];
    g->data = f->extended_data ? f->extended_data[index] : nullptr;
    return true;
  }
  return false;
}

bool BufferCovers(const AVBufferRef* buf, const uint8_t* begin, size_t len) {
  if (!buf || !buf->data) return false;
  if (begin < buf->data) return false;
  const size_t offset = static_cast<size_t>(begin - buf->data);
  const size_t size = static_cast<size_t>(buf->size);
  return offset <= size && len <= size - offset;
}

bool InsideOwnBuffers(const AVFrame* f, const uint8_t* begin, size_t len) {
  for (int i = 0; i < AV_NUM_DATA_POINTERS; ++i) {
    if (BufferCovers(f->buf[i], begin, len)) return true;
  }
  for (int i = 0; i < f->nb_extended_buf; ++i) {
    if (BufferCovers(f->extended_buf[i], begin, len)) return true;
  }
  return false;
}

}  // namespace

const char* MediaKindName(MediaKind kind) {
  switch (kind) {
    case MediaKind::kVideo: return "video";
    case MediaKind::kAudio: return "audio";
    case MediaKind::kUnknown: break;
  }
  return "unknown";
}

Frame::Frame(AVFrame* raw_frame, MediaKind kind, const time::Rational& time_base) noexcept
    : raw_frame_(raw_frame), kind_(kind), time_base_(time_base) {}

Frame::~Frame() {
  Reset();
}

Frame::Frame(Frame&& other) noexcept
    : raw_frame_(std::exchange(other.raw_frame_, nullptr)),
      kind_(other.kind_),
      time_base_(other.time_base_) {}

Frame& Frame::operator=(Frame&& other) noexcept {
  if (this != &other) {
    Reset();
    raw_frame_ = std::exchange(other.raw_frame_, nullptr);
    kind_ = other.kind_;
    time_base_ = other.time_base_;
  }
  return *this;
}

void Frame::Reset() noexcept {
  if (raw_frame_) {
    av_frame_free(&raw_frame_);
  }
}

Frame Frame::AttachRawFrame(AVFrame* raw_frame, MediaKind kind,
                            const time::Rational& time_base) {
  if (raw_frame) {
    raw_frame->time_base = time::ToAVRational(time_base);
  }
  return Frame(raw_frame, kind, time_base);
}

MediaError Frame::AllocateVideo(AVPixelFormat format, int width, int height, Frame& out) {
  const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(format);
  if (!desc || (desc->flags & AV_PIX_FMT_FLAG_HWACCEL) != 0) {
    return MediaError::kInvalidBuffer;
  }
  if (width <= 0 || height <= 0 || av_image_check_size(width, height, 0, nullptr) < 0) {
    return MediaError::kInvalidBuffer;
  }

  AVFrame* raw = av_frame_alloc();
  if (!raw) return MediaError::kOutOfMemory;
  raw->format = format;
  raw->width = width;
  raw->height = height;
  int ret = av_frame_get_buffer(raw, 0);
  if (ret < 0) {
    av_frame_free(&raw);
    return util::MapNativeError(ret, util::NativeContext::kBuffer);
  }

  Frame frame = AttachRawFrame(raw, MediaKind::kVideo, time::kMicrosecondTimeBase);
  for (int i = 0; i < frame.PlaneCount(); ++i) {
    PlaneGeometry g;
    if (ComputeGeometry(raw, MediaKind::kVideo, i, &g)) {
      std::memset(g.data, 0, static_cast<size_t>(g.stride) * static_cast<size_t>(g.rows));
    }
  }
  out = std::move(frame);
  return MediaError::kOk;
}

MediaError Frame::AllocateAudio(AVSampleFormat format, int sample_rate,
                                const AVChannelLayout& layout, int samples, Frame& out) {
  if (av_get_bytes_per_sample(format) <= 0 || sample_rate <= 0 || samples <= 0) {
    return MediaError::kInvalidBuffer;
  }
  if (!av_channel_layout_check(&layout)) return MediaError::kInvalidBuffer;

  AVFrame* raw = av_frame_alloc();
  if (!raw) return MediaError::kOutOfMemory;
  raw->format = format;
  raw->sample_rate = sample_rate;
  raw->nb_samples = samples;
  int ret = av_channel_layout_copy(&raw->ch_layout, &layout);
  if (ret >= 0) ret = av_frame_get_buffer(raw, 0);
  if (ret < 0) {
    av_frame_free(&raw);
    return util::MapNativeError(ret, util::NativeContext::kBuffer);
  }
  av_samples_set_silence(raw->extended_data, 0, samples, raw->ch_layout.nb_channels, format);

  out = AttachRawFrame(raw, MediaKind::kAudio, time::Rational(1, sample_rate));
  return MediaError::kOk;
}

MediaError Frame::AllocateAudio(AVSampleFormat format, int sample_rate, int channels,
                                int samples, Frame& out) {
  if (channels <= 0) return MediaError::kInvalidBuffer;
  AVChannelLayout layout;
  av_channel_layout_default(&layout, channels);
  MediaError err = AllocateAudio(format, sample_rate, layout, samples, out);
  av_channel_layout_uninit(&layout);
  return err;
}

MediaError Frame::Clone(Frame& out) const {
  if (!raw_frame_) {
    out = Frame(nullptr, kind_, time_base_);
    return MediaError::kOk;
  }
  AVFrame* raw = av_frame_alloc();
  if (!raw) return MediaError::kOutOfMemory;
  int ret = av_frame_ref(raw, raw_frame_);
  if (ret < 0) {
    av_frame_free(&raw);
    return util::MapNativeError(ret, util::NativeContext::kBuffer);
  }
  out = AttachRawFrame(raw, kind_, time_base_);
  return MediaError::kOk;
}

int Frame::Width() const {
  return raw_frame_ && kind_ == MediaKind::kVideo ? raw_frame_->width : 0;
}

int Frame::Height() const {
  return raw_frame_ && kind_ == MediaKind::kVideo ? raw_frame_->height : 0;
}

AVPixelFormat Frame::PixelFormat() const {
  if (!raw_frame_ || kind_ != MediaKind::kVideo) return AV_PIX_FMT_NONE;
  return static_cast<AVPixelFormat>(raw_frame_->format);
}

AVSampleFormat Frame::SampleFormat() const {
  if (!raw_frame_ || kind_ != MediaKind::kAudio) return AV_SAMPLE_FMT_NONE;
  return static_cast<AVSampleFormat>(raw_frame_->format);
}

int Frame::SampleRate() const {
  return raw_frame_ && kind_ == MediaKind::kAudio ? raw_frame_->sample_rate : 0;
}

int Frame::Channels() const {
  return raw_frame_ && kind_ == MediaKind::kAudio ? raw_frame_->ch_layout.nb_channels : 0;
}

int Frame::SampleCount() const {
  return raw_frame_ && kind_ == MediaKind::kAudio ? raw_frame_->nb_samples : 0;
}

int Frame::PlaneCount() const {
  if (!raw_frame_) return 0;
  switch (kind_) {
    case MediaKind::kVideo: return VideoPlaneCount(raw_frame_);
    case MediaKind::kAudio: return AudioPlaneCount(raw_frame_);
    case MediaKind::kUnknown: break;
  }
  return 0;
}

PlaneView Frame::Plane(int index) const {
  PlaneView view;
  PlaneGeometry g;
  if (ComputeGeometry(raw_frame_, kind_, index, &g)) {
    view.data = g.data;
    view.stride = g.stride;
    view.row_bytes = g.row_bytes;
    view.rows = g.rows;
  }
  return view;
}

MediaError Frame::WritablePlane(int index, MutablePlaneView& out) {
  if (index < 0 || index >= PlaneCount()) return MediaError::kInvalidBuffer;
  MediaError err = MakeWritable();
  if (err != MediaError::kOk) return err;
  PlaneGeometry g;
  if (!ComputeGeometry(raw_frame_, kind_, index, &g)) return MediaError::kInvalidBuffer;
  out.data = g.data;
  out.stride = g.stride;
  out.row_bytes = g.row_bytes;
  out.rows = g.rows;
  return MediaError::kOk;
}

bool Frame::IsWritable() const {
  return raw_frame_ && av_frame_is_writable(raw_frame_) != 0;
}

MediaError Frame::MakeWritable() {
  if (!raw_frame_) return MediaError::kInvalidBuffer;
  if (av_frame_is_writable(raw_frame_)) return MediaError::kOk;
  int ret = av_frame_make_writable(raw_frame_);
  if (ret < 0) return util::MapNativeError(ret, util::NativeContext::kBuffer);
  return MediaError::kOk;
}

int Frame::ReferenceCount() const {
  if (!raw_frame_ || !raw_frame_->buf[0]) return 0;
  return av_buffer_get_ref_count(raw_frame_->buf[0]);
}

time::Time Frame::Pts() const {
  if (!raw_frame_ || raw_frame_->pts == AV_NOPTS_VALUE) {
    return time::Time(std::nullopt, time_base_);
  }
  return time::Time(raw_frame_->pts, time_base_);
}

void Frame::SetPts(const time::Time& pts) {
  if (!raw_frame_) return;
  raw_frame_->pts = pts.HasValue() ? *pts.AlignedWith(time_base_).Value() : AV_NOPTS_VALUE;
}

void Frame::RescaleTs(const time::Rational& time_base) {
  if (time_base == time_base_) return;
  if (raw_frame_) {
    if (raw_frame_->pts != AV_NOPTS_VALUE) {
      raw_frame_->pts = time::RescaleTicks(raw_frame_->pts, time_base_, time_base);
    }
    raw_frame_->time_base = time::ToAVRational(time_base);
  }
  time_base_ = time_base;
}

MediaError Frame::Validate() const {
  if (!raw_frame_) return MediaError::kInvalidBuffer;

  if (kind_ == MediaKind::kVideo) {
    const auto fmt = static_cast<AVPixelFormat>(raw_frame_->format);
    const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(fmt);
    if (!desc || (desc->flags & AV_PIX_FMT_FLAG_HWACCEL) != 0) return MediaError::kInvalidBuffer;
    if (raw_frame_->width <= 0 || raw_frame_->height <= 0 ||
        av_image_check_size(raw_frame_->width, raw_frame_->height, 0, nullptr) < 0) {
      return MediaError::kInvalidBuffer;
    }
  } else if (kind_ == MediaKind::kAudio) {
    if (av_get_bytes_per_sample(static_cast<AVSampleFormat>(raw_frame_->format)) <= 0 ||
        raw_frame_->nb_samples <= 0 || raw_frame_->ch_layout.nb_channels <= 0) {
      return MediaError::kInvalidBuffer;
    }
  } else {
    return MediaError::kInvalidBuffer;
  }

  const int planes = PlaneCount();
  if (planes <= 0) return MediaError::kInvalidBuffer;
  for (int i = 0; i < planes; ++i) {
    PlaneGeometry g;
    if (!ComputeGeometry(raw_frame_, kind_, i, &g)) return MediaError::kInvalidBuffer;
    if (!g.data || g.stride < g.row_bytes) return MediaError::kInvalidBuffer;
    const size_t span = static_cast<size_t>(g.stride) * static_cast<size_t>(g.rows - 1) +
                        static_cast<size_t>(g.row_bytes);
    if (!InsideOwnBuffers(raw_frame_, g.data, span)) return MediaError::kInvalidBuffer;
  }
  return MediaError::kOk;
}

}  // namespace avpipe::buffer
