// Repository: avpipe
// Component: NumericHandoff
// Purpose: Documented plane layout of a Frame, and packed export/import for
//          external numeric / image array libraries.
// Copyright (c) 2025 RetroVue

#include "avpipe/convert/NumericHandoff.hpp"

#include <cstring>
#include <utility>

extern "C" {
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libavutil/pixdesc.h>
#include <libavutil/samplefmt.h>
}

namespace avpipe::convert {

namespace {

using util::MediaError;

bool IsPaletted(AVPixelFormat fmt) {
  const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(fmt);
  return desc && (desc->flags & AV_PIX_FMT_FLAG_PAL) != 0;
}

}  // namespace

MediaError DescribeLayout(const buffer::Frame& frame, FrameLayout& out) {
  if (frame.Validate() != MediaError::kOk) return MediaError::kInvalidBuffer;

  FrameLayout layout;
  layout.kind = frame.Kind();
  if (frame.Kind() == buffer::MediaKind::kVideo) {
    if (IsPaletted(frame.PixelFormat())) return MediaError::kUnsupportedConversion;
    const char* name = av_get_pix_fmt_name(frame.PixelFormat());
    layout.format_name = name ? name : "";
    layout.width = frame.Width();
    layout.height = frame.Height();
  } else {
    const char* name = av_get_sample_fmt_name(frame.SampleFormat());
    layout.format_name = name ? name : "";
    layout.samples = frame.SampleCount();
    layout.channels = frame.Channels();
  }

  size_t offset = 0;
  for (int i = 0; i < frame.PlaneCount(); ++i) {
    const buffer::PlaneView view = frame.Plane(i);
    PlaneLayout plane;
    plane.data = view.data;
    plane.stride = view.stride;
    plane.row_bytes = view.row_bytes;
    plane.rows = view.rows;
    plane.packed_offset = offset;
    offset += static_cast<size_t>(view.row_bytes) * static_cast<size_t>(view.rows);
    layout.planes.push_back(plane);
  }
  layout.packed_size = offset;
  out = std::move(layout);
  return MediaError::kOk;
}

MediaError ExportPacked(const buffer::Frame& frame, std::vector<uint8_t>& bytes) {
  FrameLayout layout;
  MediaError err = DescribeLayout(frame, layout);
  if (err != MediaError::kOk) return err;

  bytes.assign(layout.packed_size, 0);
  if (layout.kind == buffer::MediaKind::kVideo) {
    const AVFrame* raw = frame.RawFramePtr();
    int ret = av_image_copy_to_buffer(bytes.data(), static_cast<int>(bytes.size()), raw->data,
                                      raw->linesize, frame.PixelFormat(), frame.Width(),
                                      frame.Height(), 1);
    if (ret < 0) return util::MapNativeError(ret, util::NativeContext::kBuffer);
    if (static_cast<size_t>(ret) != layout.packed_size) return MediaError::kInvalidBuffer;
    return MediaError::kOk;
  }

  for (const PlaneLayout& plane : layout.planes) {
    std::memcpy(bytes.data() + plane.packed_offset, plane.data,
                static_cast<size_t>(plane.row_bytes));
  }
  return MediaError::kOk;
}

MediaError ImportPacked(const uint8_t* data, size_t size, AVPixelFormat format,
                        int width, int height, buffer::Frame& out) {
  if (!data || IsPaletted(format)) return MediaError::kInvalidBuffer;
  const int expected = av_image_get_buffer_size(format, width, height, 1);
  if (expected < 0 || static_cast<size_t>(expected) != size) return MediaError::kInvalidBuffer;

  buffer::Frame frame;
  MediaError err = buffer::Frame::AllocateVideo(format, width, height, frame);
  if (err != MediaError::kOk) return err;

  uint8_t* planes[4] = {nullptr, nullptr, nullptr, nullptr};
  int linesizes[4] = {0, 0, 0, 0};
  int ret = av_image_fill_arrays(planes, linesizes, data, format, width, height, 1);
  if (ret < 0) return util::MapNativeError(ret, util::NativeContext::kBuffer);

  const uint8_t* src_planes[4] = {planes[0], planes[1], planes[2], planes[3]};
  AVFrame* raw = frame.RawFramePtr();
  av_image_copy(raw->data, raw->linesize, src_planes, linesizes, format, width, height);

  out = std::move(frame);
  return MediaError::kOk;
}

}  // namespace avpipe::convert
