// Repository: avpipe
// Component: Packet Contract Tests
// Purpose: Shared ownership, copy-on-write isolation and timestamp
//          handling of the Packet wrapper.
// Copyright (c) 2025 RetroVue

#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

extern "C" {
#include <libavcodec/packet.h>
#include <libavutil/avutil.h>
}

#include "avpipe/buffer/Packet.hpp"
#include "avpipe/time/Rational.hpp"
#include "avpipe/time/Time.hpp"

namespace {

using avpipe::buffer::Packet;
using avpipe::time::Rational;
using avpipe::time::Time;
using avpipe::util::MediaError;

const std::vector<uint8_t> kPayload = {0x00, 0x00, 0x01, 0xB6, 0x10, 0x20, 0x30, 0x40};

Packet MakePacket(const Rational& tb) {
  Packet pkt;
  EXPECT_EQ(Packet::CopyFrom(kPayload.data(), kPayload.size(), tb, pkt), MediaError::kOk);
  return pkt;
}

TEST(PacketContract, CopyFromOwnsItsBytes) {
  std::vector<uint8_t> source = kPayload;
  Packet pkt;
  ASSERT_EQ(Packet::CopyFrom(source.data(), source.size(), Rational(1, 25), pkt), MediaError::kOk);
  source[0] = 0xFF;

  ASSERT_EQ(pkt.Size(), kPayload.size());
  EXPECT_EQ(std::memcmp(pkt.Data(), kPayload.data(), kPayload.size()), 0);
  EXPECT_EQ(pkt.ReferenceCount(), 1);
  EXPECT_FALSE(pkt.IsEmpty());
}

TEST(PacketContract, CopyFromRejectsMissingData) {
  Packet pkt;
  EXPECT_EQ(Packet::CopyFrom(nullptr, 16, Rational(1, 25), pkt), MediaError::kInvalidBuffer);
  EXPECT_FALSE(pkt.HasNative());
}

TEST(PacketContract, CloneSharesBytesUntilWritten) {
  Packet original = MakePacket(Rational(1, 25));
  Packet clone;
  ASSERT_EQ(original.Clone(clone), MediaError::kOk);

  EXPECT_EQ(original.Data(), clone.Data());
  EXPECT_EQ(original.ReferenceCount(), 2);
  EXPECT_EQ(clone.ReferenceCount(), 2);

  uint8_t* data = nullptr;
  ASSERT_EQ(clone.MutableData(&data), MediaError::kOk);
  data[3] = 0xB3;

  EXPECT_NE(original.Data(), clone.Data());
  EXPECT_EQ(original.Data()[3], 0xB6);
  EXPECT_EQ(clone.Data()[3], 0xB3);
  EXPECT_EQ(original.ReferenceCount(), 1);
  EXPECT_EQ(clone.ReferenceCount(), 1);
}

TEST(PacketContract, UniqueOwnerWritesInPlace) {
  Packet pkt = MakePacket(Rational(1, 25));
  const uint8_t* before = pkt.Data();
  uint8_t* data = nullptr;
  ASSERT_EQ(pkt.MutableData(&data), MediaError::kOk);
  EXPECT_EQ(data, before);
}

TEST(PacketContract, DroppingCloneReleasesReference) {
  Packet original = MakePacket(Rational(1, 25));
  {
    Packet clone;
    ASSERT_EQ(original.Clone(clone), MediaError::kOk);
    EXPECT_EQ(original.ReferenceCount(), 2);
  }
  EXPECT_EQ(original.ReferenceCount(), 1);
}

TEST(PacketContract, MoveTransfersOwnership) {
  Packet a = MakePacket(Rational(1, 25));
  const uint8_t* data = a.Data();
  Packet b = std::move(a);
  EXPECT_FALSE(a.HasNative());  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(b.Data(), data);
  EXPECT_EQ(b.ReferenceCount(), 1);
}

TEST(PacketContract, TimestampsAlignWithPacketBase) {
  Packet pkt = MakePacket(avpipe::time::kMpegTsTimeBase);
  pkt.SetPts(Time(2, Rational(1, 25)));
  pkt.SetDts(Time(1, Rational(1, 25)));
  pkt.SetDuration(Time(1, Rational(1, 25)));

  EXPECT_EQ(pkt.Pts().Value(), 7200);
  EXPECT_EQ(pkt.Dts().Value(), 3600);
  EXPECT_EQ(pkt.Duration().Value(), 3600);
  EXPECT_EQ(pkt.RawPacketPtr()->pts, 7200);
}

TEST(PacketContract, MissingTimestampIsValueless) {
  Packet pkt = MakePacket(Rational(1, 25));
  pkt.SetPts(Time(std::nullopt, Rational(1, 25)));
  EXPECT_FALSE(pkt.Pts().HasValue());
  EXPECT_EQ(pkt.RawPacketPtr()->pts, AV_NOPTS_VALUE);

  pkt.RescaleTs(avpipe::time::kMpegTsTimeBase);
  EXPECT_FALSE(pkt.Pts().HasValue());
  EXPECT_EQ(pkt.RawPacketPtr()->pts, AV_NOPTS_VALUE);
  EXPECT_FALSE(pkt.Duration().HasValue());
}

TEST(PacketContract, RescaleTsMovesEveryField) {
  Packet pkt = MakePacket(Rational(1, 25));
  pkt.SetPts(Time(3, Rational(1, 25)));
  pkt.SetDts(Time(2, Rational(1, 25)));
  pkt.SetDuration(Time(1, Rational(1, 25)));

  pkt.RescaleTs(Rational(1, 1000));
  EXPECT_EQ(pkt.TimeBase(), Rational(1, 1000));
  EXPECT_EQ(pkt.Pts().Value(), 120);
  EXPECT_EQ(pkt.Dts().Value(), 80);
  EXPECT_EQ(pkt.Duration().Value(), 40);
  EXPECT_EQ(pkt.RawPacketPtr()->time_base.den, 1000);
}

TEST(PacketContract, KeyFlag) {
  Packet pkt = MakePacket(Rational(1, 25));
  EXPECT_FALSE(pkt.IsKey());
  pkt.SetKey(true);
  EXPECT_TRUE(pkt.IsKey());
  EXPECT_TRUE((pkt.RawPacketPtr()->flags & AV_PKT_FLAG_KEY) != 0);
  pkt.SetKey(false);
  EXPECT_FALSE(pkt.IsKey());
  EXPECT_FALSE(pkt.IsCorrupt());
}

TEST(PacketContract, EmptyPacketAccessorsAreSafe) {
  Packet pkt;
  EXPECT_TRUE(pkt.IsEmpty());
  EXPECT_EQ(pkt.Data(), nullptr);
  EXPECT_EQ(pkt.Size(), 0u);
  EXPECT_EQ(pkt.ReferenceCount(), 0);
  EXPECT_EQ(pkt.StreamIndex(), -1);
  uint8_t* data = nullptr;
  EXPECT_EQ(pkt.MutableData(&data), MediaError::kInvalidBuffer);

  Packet clone;
  EXPECT_EQ(pkt.Clone(clone), MediaError::kOk);
  EXPECT_FALSE(clone.HasNative());
}

}  // namespace
