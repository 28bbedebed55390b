// Repository: avpipe
// Component: Test Fixtures
// Purpose: Builds small compressed streams in memory from synthetic frames,
//          so decoder tests need no media files.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_TESTS_FIXTURES_ENCODED_STREAMS_H_
#define AVPIPE_TESTS_FIXTURES_ENCODED_STREAMS_H_

#include <gtest/gtest.h>

extern "C" {
#include <libavcodec/avcodec.h>
}

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/encode/EncoderPipeline.hpp"
#include "avpipe/encode/EncoderSettings.hpp"
#include "avpipe/io/PacketCollector.hpp"
#include "avpipe/io/StreamDescriptor.hpp"
#include "avpipe/time/Time.hpp"
#include "fixtures/SyntheticFrames.h"

namespace avpipe::tests::fixtures {

inline bool EncoderAvailable(const char* name) {
  return avcodec_find_encoder_by_name(name) != nullptr;
}

// Encodes gradient frames 0..count-1, stamped at the settings' frame rate,
// into `collector`. `descriptor` receives the encoded stream description.
inline ::testing::AssertionResult EncodeGradientStream(const encode::EncoderSettings& settings,
                                                       int count,
                                                       io::PacketCollector& collector,
                                                       io::StreamDescriptor& descriptor) {
  encode::EncoderPipeline encoder;
  encode::OutputTarget target;
  target.sink = &collector;
  util::MediaError err = encoder.Open(target, settings);
  if (err != util::MediaError::kOk) {
    return ::testing::AssertionFailure() << "Open: " << util::MediaErrorName(err);
  }
  for (int i = 0; i < count; ++i) {
    buffer::Frame frame;
    err = MakeGradientFrame(settings.pixel_format, settings.width, settings.height, i, frame);
    if (err != util::MediaError::kOk) {
      return ::testing::AssertionFailure() << "frame " << i << ": " << util::MediaErrorName(err);
    }
    err = encoder.Encode(frame, time::Time::FromFrameCount(i, settings.frame_rate));
    if (err != util::MediaError::kOk) {
      return ::testing::AssertionFailure()
             << "Encode " << i << ": " << util::MediaErrorName(err);
    }
  }
  err = encoder.Finish();
  if (err != util::MediaError::kOk) {
    return ::testing::AssertionFailure() << "Finish: " << util::MediaErrorName(err);
  }
  descriptor = encoder.OutputDescriptor();
  return ::testing::AssertionSuccess();
}

}  // namespace avpipe::tests::fixtures

#endif  // AVPIPE_TESTS_FIXTURES_ENCODED_STREAMS_H_
