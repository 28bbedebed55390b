// Repository: avpipe
// Component: MediaDecoder Contract Tests
// Purpose: Seeking lands on a keyframe at or before the target and decoding
//          resumes from there; stream queries report the file's length and
//          rate; resize applies to file decoding.
// Copyright (c) 2025 RetroVue

#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/convert/Resize.hpp"
#include "avpipe/decode/MediaDecoder.hpp"
#include "avpipe/encode/EncoderPipeline.hpp"
#include "avpipe/encode/EncoderSettings.hpp"
#include "avpipe/time/Rational.hpp"
#include "avpipe/time/Time.hpp"
#include "fixtures/SyntheticFrames.h"

namespace {

using avpipe::buffer::Frame;
using avpipe::buffer::MediaKind;
using avpipe::convert::Resize;
using avpipe::decode::DecodedFrame;
using avpipe::decode::MediaDecoder;
using avpipe::decode::MediaDecoderConfig;
using avpipe::encode::EncoderPipeline;
using avpipe::encode::EncoderSettings;
using avpipe::encode::OutputTarget;
using avpipe::time::Rational;
using avpipe::time::Time;
using avpipe::util::MediaError;
using avpipe::tests::fixtures::MakeGradientFrame;
using avpipe::tests::fixtures::PlanesEqual;
using avpipe::tests::fixtures::ScopedTempFile;

constexpr int kWidth = 64;
constexpr int kHeight = 48;
constexpr int kFrames = 50;  // 2 s at 25 fps, every frame a keyframe

// Gradient frame i at 25 fps in a Matroska file, FFV1 so every decoded frame
// can be matched to its index.
class MediaDecoderContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    settings_ = avpipe::encode::PresetFfv1Lossless(kWidth, kHeight);
    EncoderPipeline encoder;
    ASSERT_EQ(encoder.Open(OutputTarget{file_.path(), "", nullptr}, settings_),
              MediaError::kOk);
    for (int i = 0; i < kFrames; ++i) {
      Frame frame;
      ASSERT_EQ(MakeGradientFrame(settings_.pixel_format, kWidth, kHeight, i, frame),
                MediaError::kOk);
      ASSERT_EQ(encoder.Encode(frame, Time::FromFrameCount(i, settings_.frame_rate)),
                MediaError::kOk);
    }
    ASSERT_EQ(encoder.Finish(), MediaError::kOk);
  }

  MediaDecoderConfig Config() const {
    MediaDecoderConfig config;
    config.reader.input_uri = file_.path();
    config.reader.kind = MediaKind::kVideo;
    return config;
  }

  // Frame index of a decoded frame, from its PTS at 25 fps.
  static int64_t IndexOf(const DecodedFrame& decoded) {
    return decoded.pts.Rescale(Rational(1, 25)).ValueOr(-1);
  }

  // Decodes to the end; returns the indices seen and checks the pixels.
  static std::vector<int64_t> DrainIndices(MediaDecoder& decoder) {
    std::vector<int64_t> indices;
    DecodedFrame decoded;
    while (decoder.Next(decoded) == MediaError::kOk) {
      const int64_t index = IndexOf(decoded);
      Frame expected;
      EXPECT_EQ(MakeGradientFrame(AV_PIX_FMT_YUV420P, kWidth, kHeight, static_cast<int>(index),
                                  expected),
                MediaError::kOk);
      EXPECT_TRUE(PlanesEqual(decoded.frame, expected)) << "frame " << index;
      indices.push_back(index);
    }
    return indices;
  }

  static std::vector<int64_t> Range(int64_t first, int64_t end) {
    std::vector<int64_t> out;
    for (int64_t i = first; i < end; ++i) out.push_back(i);
    return out;
  }

  ScopedTempFile file_{".mkv"};
  EncoderSettings settings_;
};

TEST_F(MediaDecoderContractTest, DecodesTheWholeFile) {
  MediaDecoder decoder(Config());
  ASSERT_EQ(decoder.Open(), MediaError::kOk);
  EXPECT_EQ(DrainIndices(decoder), Range(0, kFrames));
  EXPECT_EQ(decoder.FramesYielded(), kFrames);
  DecodedFrame decoded;
  EXPECT_EQ(decoder.Next(decoded), MediaError::kEndOfStream);
}

TEST_F(MediaDecoderContractTest, SeekResumesAtOrBeforeTheTarget) {
  MediaDecoder decoder(Config());
  ASSERT_EQ(decoder.Open(), MediaError::kOk);

  ASSERT_EQ(decoder.Seek(Time(1, Rational(1, 1))), MediaError::kOk);
  const std::vector<int64_t> indices = DrainIndices(decoder);
  ASSERT_FALSE(indices.empty());
  // Every frame is a keyframe, so the frame at 1 s itself is where decoding
  // resumes.
  EXPECT_LE(indices.front(), 25);
  EXPECT_EQ(indices, Range(indices.front(), kFrames));
}

TEST_F(MediaDecoderContractTest, SeekToFrameUsesTheFrameRate) {
  MediaDecoder decoder(Config());
  ASSERT_EQ(decoder.Open(), MediaError::kOk);
  EXPECT_EQ(decoder.FrameRate(), Rational(25, 1));

  ASSERT_EQ(decoder.SeekToFrame(40), MediaError::kOk);
  const std::vector<int64_t> indices = DrainIndices(decoder);
  ASSERT_FALSE(indices.empty());
  EXPECT_LE(indices.front(), 40);
  EXPECT_EQ(indices.back(), kFrames - 1);
}

TEST_F(MediaDecoderContractTest, SeekToStartAfterTheEndDecodesAgain) {
  MediaDecoder decoder(Config());
  ASSERT_EQ(decoder.Open(), MediaError::kOk);
  ASSERT_EQ(DrainIndices(decoder).size(), static_cast<size_t>(kFrames));

  ASSERT_EQ(decoder.SeekToStart(), MediaError::kOk);
  EXPECT_EQ(DrainIndices(decoder), Range(0, kFrames));
  EXPECT_EQ(decoder.FramesYielded(), 2 * kFrames);
  EXPECT_EQ(decoder.GetStats().resets, 1u);
}

TEST_F(MediaDecoderContractTest, BackwardSeekAfterPartialDecode) {
  MediaDecoder decoder(Config());
  ASSERT_EQ(decoder.Open(), MediaError::kOk);
  DecodedFrame decoded;
  for (int i = 0; i < 30; ++i) ASSERT_EQ(decoder.Next(decoded), MediaError::kOk);

  ASSERT_EQ(decoder.Seek(Time(400, Rational(1, 1000))), MediaError::kOk);
  const std::vector<int64_t> indices = DrainIndices(decoder);
  ASSERT_FALSE(indices.empty());
  EXPECT_LE(indices.front(), 10);
  EXPECT_EQ(indices, Range(indices.front(), kFrames));
}

TEST_F(MediaDecoderContractTest, ValuelessSeekTargetIsRejected) {
  MediaDecoder decoder(Config());
  ASSERT_EQ(decoder.Open(), MediaError::kOk);
  EXPECT_EQ(decoder.Seek(Time()), MediaError::kInvalidTimeBase);
  // The read position is unchanged.
  EXPECT_EQ(DrainIndices(decoder), Range(0, kFrames));
}

TEST_F(MediaDecoderContractTest, SeekBeforeOpenIsClosed) {
  MediaDecoder decoder(Config());
  EXPECT_EQ(decoder.Seek(Time::Zero()), MediaError::kPipelineClosed);
  EXPECT_EQ(decoder.SeekToStart(), MediaError::kPipelineClosed);
  DecodedFrame decoded;
  EXPECT_EQ(decoder.Next(decoded), MediaError::kPipelineClosed);
}

TEST_F(MediaDecoderContractTest, DurationAndFrameCount) {
  MediaDecoder decoder(Config());
  ASSERT_EQ(decoder.Open(), MediaError::kOk);

  const Time duration = decoder.Duration();
  ASSERT_TRUE(duration.HasValue());
  EXPECT_NEAR(duration.ToSeconds(), 2.0, 0.1);

  EXPECT_GE(decoder.FrameCount(), kFrames - 1);
  EXPECT_LE(decoder.FrameCount(), kFrames);
}

TEST_F(MediaDecoderContractTest, ResizeAppliesToFileDecoding) {
  MediaDecoderConfig config = Config();
  config.decoder.resize = Resize::FitEven(33, 100);
  MediaDecoder decoder(config);
  ASSERT_EQ(decoder.Open(), MediaError::kOk);
  EXPECT_EQ(decoder.SourceWidth(), kWidth);
  EXPECT_EQ(decoder.SourceHeight(), kHeight);
  // 64x48 fitted to width 33 is 33x25, rounded down to 32x24.
  EXPECT_EQ(decoder.OutputWidth(), 32);
  EXPECT_EQ(decoder.OutputHeight(), 24);

  DecodedFrame decoded;
  int count = 0;
  while (decoder.Next(decoded) == MediaError::kOk) {
    EXPECT_EQ(decoded.frame.Width(), 32);
    EXPECT_EQ(decoded.frame.Height(), 24);
    ++count;
  }
  EXPECT_EQ(count, kFrames);
}

TEST_F(MediaDecoderContractTest, MissingFileFailsOpen) {
  MediaDecoderConfig config;
  config.reader.input_uri = file_.path() + ".missing";
  MediaDecoder decoder(config);
  EXPECT_EQ(decoder.Open(), MediaError::kInitializationFailed);
  EXPECT_FALSE(decoder.IsOpen());
}

}  // namespace
