// Repository: avpipe
// Component: Resize
// Purpose: Output dimensions for decoded video: exact, or fitted inside a
//          bounding box with the source aspect ratio kept.
// Copyright (c) 2025 RetroVue

#include "avpipe/convert/Resize.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>

namespace avpipe::convert {

namespace {

// Scales `source` by min(box_w / src_w, box_h / src_h), rounding to the
// nearest pixel. Integer math keeps the result exact for common ratios.
Dimensions FitInside(const Dimensions& source, int box_w, int box_h) {
  const int64_t sw = source.width;
  const int64_t sh = source.height;
  // Width-limited when box_w / sw <= box_h / sh.
  if (static_cast<int64_t>(box_w) * sh <= static_cast<int64_t>(box_h) * sw) {
    const int64_t h = (static_cast<int64_t>(box_w) * sh * 2 + sw) / (sw * 2);
    return Dimensions{box_w, static_cast<int>(std::min<int64_t>(h, box_h))};
  }
  const int64_t w = (static_cast<int64_t>(box_h) * sw * 2 + sh) / (sh * 2);
  return Dimensions{static_cast<int>(std::min<int64_t>(w, box_w)), box_h};
}

}  // namespace

std::optional<Dimensions> Resize::ComputeFor(const Dimensions& source) const {
  if (width_ <= 0 || height_ <= 0 || source.width <= 0 || source.height <= 0) {
    return std::nullopt;
  }
  switch (mode_) {
    case Mode::kExact:
      return Dimensions{width_, height_};
    case Mode::kFit: {
      Dimensions fitted = FitInside(source, width_, height_);
      if (fitted.width < 1 || fitted.height < 1) return std::nullopt;
      return fitted;
    }
    case Mode::kFitEven: {
      Dimensions fitted = FitInside(source, width_, height_);
      fitted.width &= ~1;
      fitted.height &= ~1;
      if (fitted.width < 2 || fitted.height < 2) return std::nullopt;
      return fitted;
    }
  }
  return std::nullopt;
}

std::string Resize::ToString() const {
  std::ostringstream oss;
  switch (mode_) {
    case Mode::kExact: oss << "exact "; break;
    case Mode::kFit: oss << "fit "; break;
    case Mode::kFitEven: oss << "fit_even "; break;
  }
  oss << width_ << "x" << height_;
  return oss.str();
}

}  // namespace avpipe::convert
