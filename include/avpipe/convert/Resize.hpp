// Repository: avpipe
// Component: Resize
// Purpose: Output dimensions for decoded video: exact, or fitted inside a
//          bounding box with the source aspect ratio kept.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_CONVERT_RESIZE_HPP_
#define AVPIPE_CONVERT_RESIZE_HPP_

#include <optional>
#include <string>

namespace avpipe::convert {

struct Dimensions {
  int width = 0;
  int height = 0;

  bool operator==(const Dimensions& other) const {
    return width == other.width && height == other.height;
  }
  bool operator!=(const Dimensions& other) const { return !(*this == other); }
};

class Resize {
 public:
  enum class Mode {
    kExact,    // exactly width x height; the aspect ratio may change
    kFit,      // largest size inside width x height with the source aspect
    kFitEven,  // as kFit, then rounded down to even dimensions (4:2:0 chroma)
  };

  static Resize Exact(int width, int height) { return Resize(Mode::kExact, width, height); }
  static Resize Fit(int width, int height) { return Resize(Mode::kFit, width, height); }
  static Resize FitEven(int width, int height) { return Resize(Mode::kFitEven, width, height); }

  // Output size for a `source` frame; nullopt when either side has a
  // non-positive dimension or the fitted size collapses below the minimum
  // (1x1, or 2x2 for kFitEven).
  std::optional<Dimensions> ComputeFor(const Dimensions& source) const;

  Mode GetMode() const { return mode_; }
  int Width() const { return width_; }
  int Height() const { return height_; }
  std::string ToString() const;

 private:
  Resize(Mode mode, int width, int height) : mode_(mode), width_(width), height_(height) {}

  Mode mode_;
  int width_;
  int height_;
};

}  // namespace avpipe::convert

#endif  // AVPIPE_CONVERT_RESIZE_HPP_
