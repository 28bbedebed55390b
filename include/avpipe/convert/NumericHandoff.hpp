// Repository: avpipe
// Component: NumericHandoff
// Purpose: Documented plane layout of a Frame, and packed export/import for
//          external numeric / image array libraries.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_CONVERT_NUMERIC_HANDOFF_HPP_
#define AVPIPE_CONVERT_NUMERIC_HANDOFF_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

extern "C" {
#include <libavutil/pixfmt.h>
}

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/util/MediaError.hpp"

namespace avpipe::convert {

// One plane, both in place and in the packed export.
//
// In place: `data` points into the Frame's own storage and stays valid while
// that Frame (or a clone sharing the storage) is alive. Row r starts at
// data + r * stride; the first `row_bytes` bytes of each row are pixels or
// samples, the rest is alignment padding.
//
// Packed: the same rows laid end to end without padding, starting at
// `packed_offset` in the ExportPacked() buffer.
struct PlaneLayout {
  const uint8_t* data = nullptr;
  int stride = 0;
  int row_bytes = 0;
  int rows = 0;
  size_t packed_offset = 0;
};

struct FrameLayout {
  buffer::MediaKind kind = buffer::MediaKind::kUnknown;
  std::string format_name;
  int width = 0;         // video
  int height = 0;        // video
  int samples = 0;       // audio, per channel
  int channels = 0;      // audio
  size_t packed_size = 0;
  std::vector<PlaneLayout> planes;
};

// Layout of `frame` without copying. Paletted pixel formats are rejected
// with kUnsupportedConversion (the palette is not a plane).
util::MediaError DescribeLayout(const buffer::Frame& frame, FrameLayout& out);

// All planes copied into one tightly packed buffer (1-byte alignment, planes
// in order), resized to FrameLayout::packed_size.
util::MediaError ExportPacked(const buffer::Frame& frame, std::vector<uint8_t>& bytes);

// Video Frame built from a packed buffer as produced by ExportPacked.
// `size` must equal the packed size for (format, width, height), else
// kInvalidBuffer.
util::MediaError ImportPacked(const uint8_t* data, size_t size, AVPixelFormat format,
                              int width, int height, buffer::Frame& out);

}  // namespace avpipe::convert

#endif  // AVPIPE_CONVERT_NUMERIC_HANDOFF_HPP_
