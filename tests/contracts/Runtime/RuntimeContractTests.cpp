// Repository: avpipe
// Component: Runtime Contract Tests
// Purpose: Idempotent native init with log routing, and the bounded worker
//          pool used for parallel post-processing.
// Copyright (c) 2025 RetroVue

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

extern "C" {
#include <libavutil/log.h>
}

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/convert/FrameConverter.hpp"
#include "avpipe/convert/NumericHandoff.hpp"
#include "avpipe/runtime/Init.hpp"
#include "avpipe/runtime/WorkerPool.hpp"
#include "avpipe/util/Logger.hpp"
#include "fixtures/SyntheticFrames.h"

namespace {

using avpipe::buffer::Frame;
using avpipe::convert::ExportPacked;
using avpipe::convert::FrameConverter;
using avpipe::convert::VideoTarget;
using avpipe::runtime::InitOptions;
using avpipe::runtime::WorkerPool;
using avpipe::util::Logger;
using avpipe::util::MediaError;
using avpipe::tests::fixtures::MakeGradientFrame;

TEST(RuntimeContract, InitializeIsIdempotent) {
  avpipe::runtime::Initialize();
  EXPECT_TRUE(avpipe::runtime::IsInitialized());
  const int level = av_log_get_level();

  InitOptions other;
  other.native_log_level = "debug";
  avpipe::runtime::Initialize(other);
  EXPECT_EQ(av_log_get_level(), level);
}

TEST(RuntimeContract, InitializeFromManyThreads) {
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([]() { avpipe::runtime::Initialize(); });
  }
  for (auto& t : threads) t.join();
  EXPECT_TRUE(avpipe::runtime::IsInitialized());
}

TEST(RuntimeContract, NativeErrorsReachTheLogger) {
  avpipe::runtime::Initialize();
  std::vector<std::string> lines;
  Logger::SetErrorSink([&lines](const std::string& line) { lines.push_back(line); });
  av_log(nullptr, AV_LOG_ERROR, "native failure %d\n", 42);
  Logger::SetErrorSink(nullptr);

  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "[FFmpeg] native failure 42");
}

TEST(RuntimeContract, OverlongNativeLineDoesNotSwallowTheNext) {
  avpipe::runtime::Initialize();
  std::vector<std::string> lines;
  Logger::SetErrorSink([&lines](const std::string& line) { lines.push_back(line); });
  const std::string overlong(2000, 'x');
  av_log(nullptr, AV_LOG_ERROR, "%s\n", overlong.c_str());
  av_log(nullptr, AV_LOG_ERROR, "next line\n");
  Logger::SetErrorSink(nullptr);

  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0].rfind("[FFmpeg] xxxx", 0), 0u);
  EXPECT_LT(lines[0].size(), overlong.size());
  EXPECT_EQ(lines[1], "[FFmpeg] next line");
}

TEST(RuntimeContract, ParseNativeLogLevel) {
  int level = -1;
  EXPECT_TRUE(avpipe::runtime::ParseNativeLogLevel("quiet", level));
  EXPECT_EQ(level, AV_LOG_QUIET);
  EXPECT_TRUE(avpipe::runtime::ParseNativeLogLevel("warning", level));
  EXPECT_EQ(level, AV_LOG_WARNING);
  EXPECT_TRUE(avpipe::runtime::ParseNativeLogLevel("debug", level));
  EXPECT_EQ(level, AV_LOG_DEBUG);
  EXPECT_FALSE(avpipe::runtime::ParseNativeLogLevel("loud", level));
  EXPECT_EQ(level, AV_LOG_DEBUG);
}

TEST(RuntimeContract, PoolConvertsFramesInParallel) {
  constexpr int kFrames = 16;
  const VideoTarget target{AV_PIX_FMT_RGB24, 48, 36};

  std::vector<std::vector<uint8_t>> expected(kFrames);
  {
    FrameConverter converter;
    for (int i = 0; i < kFrames; ++i) {
      Frame source;
      ASSERT_EQ(MakeGradientFrame(AV_PIX_FMT_YUV420P, 64, 48, i, source), MediaError::kOk);
      Frame out;
      ASSERT_EQ(converter.Convert(source, target, out), MediaError::kOk);
      ASSERT_EQ(ExportPacked(out, expected[i]), MediaError::kOk);
    }
  }

  std::vector<std::vector<uint8_t>> results(kFrames);
  std::vector<MediaError> errors(kFrames, MediaError::kOk);
  WorkerPool pool(4, 2);
  EXPECT_EQ(pool.WorkerCount(), 4u);
  for (int i = 0; i < kFrames; ++i) {
    Frame source;
    ASSERT_EQ(MakeGradientFrame(AV_PIX_FMT_YUV420P, 64, 48, i, source), MediaError::kOk);
    auto shared = std::make_shared<Frame>(std::move(source));
    ASSERT_EQ(pool.Submit([i, shared, &target, &results, &errors]() {
                // One converter per task; converters are not shared.
                FrameConverter converter;
                Frame out;
                errors[i] = converter.Convert(*shared, target, out);
                if (errors[i] == MediaError::kOk) errors[i] = ExportPacked(out, results[i]);
              }),
              MediaError::kOk);
  }
  pool.WaitIdle();
  EXPECT_EQ(pool.CompletedTasks(), static_cast<uint64_t>(kFrames));

  for (int i = 0; i < kFrames; ++i) {
    EXPECT_EQ(errors[i], MediaError::kOk) << "frame " << i;
    EXPECT_EQ(results[i], expected[i]) << "frame " << i;
  }
}

TEST(RuntimeContract, PoolSubmitBlocksWhenQueueIsFull) {
  WorkerPool pool(1, 1);
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::promise<void> started;

  ASSERT_EQ(pool.Submit([gate, &started]() {
              started.set_value();
              gate.wait();
            }),
            MediaError::kOk);
  started.get_future().wait();
  ASSERT_EQ(pool.Submit([]() {}), MediaError::kOk);  // fills the queue
  EXPECT_EQ(pool.PendingTasks(), 1u);

  std::atomic<bool> third_submitted{false};
  std::thread submitter([&pool, &third_submitted]() {
    EXPECT_EQ(pool.Submit([]() {}), MediaError::kOk);
    third_submitted.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(third_submitted.load());

  release.set_value();
  submitter.join();
  EXPECT_TRUE(third_submitted.load());
  pool.WaitIdle();
  EXPECT_EQ(pool.CompletedTasks(), 3u);
}

TEST(RuntimeContract, PoolSurvivesAThrowingTask) {
  std::vector<std::string> errors;
  Logger::SetErrorSink([&errors](const std::string& line) { errors.push_back(line); });
  std::atomic<int> ran{0};
  {
    WorkerPool pool(1, 4);
    ASSERT_EQ(pool.Submit([]() { throw std::runtime_error("conversion failed"); }),
              MediaError::kOk);
    ASSERT_EQ(pool.Submit([&ran]() { ran.fetch_add(1); }), MediaError::kOk);
    pool.WaitIdle();
    EXPECT_EQ(ran.load(), 1);
    EXPECT_EQ(pool.CompletedTasks(), 2u);
    EXPECT_EQ(pool.FailedTasks(), 1u);
  }
  Logger::SetErrorSink(nullptr);

  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("conversion failed"), std::string::npos);
}

TEST(RuntimeContract, PoolRunsQueuedTasksThenRejects) {
  std::atomic<int> ran{0};
  WorkerPool pool(2, 8);
  for (int i = 0; i < 8; ++i) {
    ASSERT_EQ(pool.Submit([&ran]() { ran.fetch_add(1); }), MediaError::kOk);
  }
  pool.Shutdown();
  EXPECT_EQ(ran.load(), 8);
  EXPECT_EQ(pool.Submit([&ran]() { ran.fetch_add(1); }), MediaError::kPipelineClosed);
  EXPECT_EQ(pool.Submit(WorkerPool::Task()), MediaError::kInvalidSettings);
  pool.Shutdown();
  EXPECT_EQ(ran.load(), 8);
}

}  // namespace
