// Repository: avpipe
// Component: Lossless Round Trip Contract Tests
// Purpose: Frames encoded with a lossless preset decode back bit-exact,
//          both from memory and through a container file.
// Copyright (c) 2025 RetroVue

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/decode/DecodeSequence.hpp"
#include "avpipe/decode/DecoderPipeline.hpp"
#include "avpipe/encode/EncoderPipeline.hpp"
#include "avpipe/encode/EncoderSettings.hpp"
#include "avpipe/io/MediaReader.hpp"
#include "avpipe/io/PacketCollector.hpp"
#include "avpipe/time/Time.hpp"
#include "fixtures/EncodedStreams.h"
#include "fixtures/SyntheticFrames.h"

namespace {

using avpipe::buffer::Frame;
using avpipe::buffer::MediaKind;
using avpipe::decode::DecodedFrame;
using avpipe::decode::DecoderPipeline;
using avpipe::decode::DecodeSequence;
using avpipe::encode::EncoderPipeline;
using avpipe::encode::EncoderSettings;
using avpipe::encode::OutputTarget;
using avpipe::io::IPacketSource;
using avpipe::io::MediaReader;
using avpipe::io::MediaReaderConfig;
using avpipe::io::PacketCollector;
using avpipe::io::PacketReplay;
using avpipe::io::StreamDescriptor;
using avpipe::time::Time;
using avpipe::util::MediaError;
using avpipe::tests::fixtures::EncodeGradientStream;
using avpipe::tests::fixtures::EncoderAvailable;
using avpipe::tests::fixtures::MakeGradientFrame;
using avpipe::tests::fixtures::MakeRampAudioS16;
using avpipe::tests::fixtures::PlanesEqual;
using avpipe::tests::fixtures::ScopedTempFile;

constexpr int kWidth = 64;
constexpr int kHeight = 48;
constexpr int kFrames = 12;

// Decodes `source` and checks frame i against gradient frame i.
void ExpectGradientFrames(const StreamDescriptor& descriptor, IPacketSource& source,
                          AVPixelFormat format, int expected_count) {
  DecoderPipeline decoder;
  ASSERT_EQ(decoder.Open(descriptor), MediaError::kOk);
  DecodeSequence sequence(decoder, source);

  DecodedFrame decoded;
  int index = 0;
  while (sequence.Next(decoded) == MediaError::kOk) {
    Frame expected;
    ASSERT_EQ(MakeGradientFrame(format, kWidth, kHeight, index, expected), MediaError::kOk);
    EXPECT_EQ(decoded.frame.PixelFormat(), format);
    EXPECT_TRUE(PlanesEqual(decoded.frame, expected)) << "frame " << index;
    ++index;
  }
  EXPECT_EQ(index, expected_count);
  EXPECT_EQ(sequence.PacketErrors(), 0);
}

void EncodeToFile(const EncoderSettings& settings, const std::string& path, int count) {
  EncoderPipeline encoder;
  ASSERT_EQ(encoder.Open(OutputTarget{path, "", nullptr}, settings), MediaError::kOk);
  for (int i = 0; i < count; ++i) {
    Frame frame;
    ASSERT_EQ(MakeGradientFrame(settings.pixel_format, settings.width, settings.height, i,
                                frame),
              MediaError::kOk);
    ASSERT_EQ(encoder.Encode(frame, Time::FromFrameCount(i, settings.frame_rate)),
              MediaError::kOk);
  }
  ASSERT_EQ(encoder.Finish(), MediaError::kOk);
}

TEST(LosslessRoundTripContract, Ffv1InMemory) {
  PacketCollector collector;
  StreamDescriptor descriptor;
  ASSERT_TRUE(EncodeGradientStream(avpipe::encode::PresetFfv1Lossless(kWidth, kHeight), kFrames,
                                   collector, descriptor));
  EXPECT_EQ(descriptor.CodecName(), "ffv1");

  PacketReplay replay(descriptor, collector.Packets());
  ExpectGradientFrames(descriptor, replay, AV_PIX_FMT_YUV420P, kFrames);

  // The collected stream is not consumed; a second pass decodes the same.
  PacketReplay again(descriptor, collector.Packets());
  ExpectGradientFrames(descriptor, again, AV_PIX_FMT_YUV420P, kFrames);
}

TEST(LosslessRoundTripContract, Ffv1ThroughMatroskaFile) {
  ScopedTempFile file(".mkv");
  EncodeToFile(avpipe::encode::PresetFfv1Lossless(kWidth, kHeight), file.path(), kFrames);

  MediaReaderConfig config;
  config.input_uri = file.path();
  config.kind = MediaKind::kVideo;
  MediaReader reader(config);
  ASSERT_EQ(reader.Open(), MediaError::kOk);
  EXPECT_EQ(reader.Descriptor().CodecName(), "ffv1");
  EXPECT_EQ(reader.Descriptor().Width(), kWidth);
  EXPECT_EQ(reader.Descriptor().Height(), kHeight);

  ExpectGradientFrames(reader.Descriptor(), reader, AV_PIX_FMT_YUV420P, kFrames);
  EXPECT_EQ(reader.GetStats().packets_read, kFrames);
}

TEST(LosslessRoundTripContract, RawVideoRgbInMemory) {
  PacketCollector collector;
  StreamDescriptor descriptor;
  ASSERT_TRUE(EncodeGradientStream(
      avpipe::encode::PresetRawVideo(kWidth, kHeight, AV_PIX_FMT_RGB24), kFrames, collector,
      descriptor));
  PacketReplay replay(descriptor, collector.Packets());
  ExpectGradientFrames(descriptor, replay, AV_PIX_FMT_RGB24, kFrames);
}

TEST(LosslessRoundTripContract, H264LosslessInMemory) {
  if (!EncoderAvailable("libx264")) GTEST_SKIP() << "libx264 not built into FFmpeg";

  PacketCollector collector;
  StreamDescriptor descriptor;
  ASSERT_TRUE(EncodeGradientStream(avpipe::encode::PresetH264Lossless(kWidth, kHeight), kFrames,
                                   collector, descriptor));
  PacketReplay replay(descriptor, collector.Packets());
  ExpectGradientFrames(descriptor, replay, AV_PIX_FMT_YUV420P, kFrames);
}

TEST(LosslessRoundTripContract, PcmThroughWavFile) {
  ScopedTempFile file(".wav");
  const EncoderSettings settings = avpipe::encode::PresetPcmS16(44100, 2);
  constexpr int kSamples = 441;
  {
    EncoderPipeline encoder;
    ASSERT_EQ(encoder.Open(OutputTarget{file.path(), "", nullptr}, settings), MediaError::kOk);
    for (int i = 0; i < 10; ++i) {
      Frame frame;
      ASSERT_EQ(MakeRampAudioS16(44100, 2, kSamples, i, frame), MediaError::kOk);
      ASSERT_EQ(encoder.Encode(frame, frame.Pts()), MediaError::kOk);
    }
    ASSERT_EQ(encoder.Finish(), MediaError::kOk);
  }

  MediaReaderConfig config;
  config.input_uri = file.path();
  config.kind = MediaKind::kAudio;
  MediaReader reader(config);
  ASSERT_EQ(reader.Open(), MediaError::kOk);
  EXPECT_EQ(reader.Descriptor().SampleRate(), 44100);
  EXPECT_EQ(reader.Descriptor().Channels(), 2);

  // The WAV demuxer re-chunks samples, so compare the concatenated stream.
  std::vector<int16_t> expected;
  for (int i = 0; i < 10; ++i) {
    Frame frame;
    ASSERT_EQ(MakeRampAudioS16(44100, 2, kSamples, i, frame), MediaError::kOk);
    const auto* pcm = reinterpret_cast<const int16_t*>(frame.Plane(0).data);
    expected.insert(expected.end(), pcm, pcm + kSamples * 2);
  }

  DecoderPipeline decoder;
  ASSERT_EQ(decoder.Open(reader.Descriptor()), MediaError::kOk);
  DecodeSequence sequence(decoder, reader);
  std::vector<int16_t> decoded_pcm;
  DecodedFrame decoded;
  while (sequence.Next(decoded) == MediaError::kOk) {
    ASSERT_EQ(decoded.frame.SampleFormat(), AV_SAMPLE_FMT_S16);
    const auto* pcm = reinterpret_cast<const int16_t*>(decoded.frame.Plane(0).data);
    decoded_pcm.insert(decoded_pcm.end(), pcm, pcm + decoded.frame.SampleCount() * 2);
  }
  EXPECT_EQ(decoded_pcm, expected);
}

TEST(LosslessRoundTripContract, ReaderRejectsMissingFileAndMissingStream) {
  MediaReaderConfig missing;
  missing.input_uri = "/nonexistent-dir/avpipe/none.mkv";
  MediaReader reader(missing);
  EXPECT_EQ(reader.Open(), MediaError::kInitializationFailed);
  EXPECT_FALSE(reader.IsOpen());

  ScopedTempFile file(".wav");
  {
    EncoderPipeline encoder;
    ASSERT_EQ(encoder.Open(OutputTarget{file.path(), "", nullptr},
                           avpipe::encode::PresetPcmS16(8000, 1)),
              MediaError::kOk);
    Frame frame;
    ASSERT_EQ(MakeRampAudioS16(8000, 1, 80, 0, frame), MediaError::kOk);
    ASSERT_EQ(encoder.Encode(frame, frame.Pts()), MediaError::kOk);
    ASSERT_EQ(encoder.Finish(), MediaError::kOk);
  }
  MediaReaderConfig video_from_wav;
  video_from_wav.input_uri = file.path();
  video_from_wav.kind = MediaKind::kVideo;
  MediaReader no_video(video_from_wav);
  EXPECT_EQ(no_video.Open(), MediaError::kUnsupportedCodec);
}

}  // namespace
