// Repository: avpipe
// Component: WorkerPool
// Purpose: Fixed set of worker threads draining a bounded task queue, for
//          post-processing decoded frames off the pipeline thread.
// Copyright (c) 2025 RetroVue

#include "avpipe/runtime/WorkerPool.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <sstream>
#include <utility>

#include "avpipe/util/Logger.hpp"

namespace avpipe::runtime {

using util::Logger;
using util::MediaError;

WorkerPool::WorkerPool(size_t worker_count, size_t queue_capacity)
    : capacity_(std::max<size_t>(queue_capacity, 1)) {
  const size_t count = std::max<size_t>(worker_count, 1);
  workers_.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this, i]() { WorkerLoop(i); });
  }
  std::ostringstream oss;
  oss << "[WorkerPool] Started workers=" << count << " queue_capacity=" << capacity_;
  Logger::Debug(oss.str());
}

WorkerPool::~WorkerPool() {
  Shutdown();
}

MediaError WorkerPool::Submit(Task task) {
  if (!task) return MediaError::kInvalidSettings;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() { return stopping_ || tasks_.size() < capacity_; });
    if (stopping_) {
      Logger::Warn("[WorkerPool] Submit() after Shutdown(); task dropped");
      return MediaError::kPipelineClosed;
    }
    tasks_.push_back(std::move(task));
  }
  not_empty_.notify_one();
  return MediaError::kOk;
}

void WorkerPool::WaitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_.wait(lock, [this]() { return tasks_.empty() && active_ == 0; });
}

void WorkerPool::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) return;
    stopping_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream oss;
  oss << "[WorkerPool] Stopped completed=" << completed_;
  Logger::Debug(oss.str());
}

size_t WorkerPool::PendingTasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

uint64_t WorkerPool::CompletedTasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_;
}

uint64_t WorkerPool::FailedTasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_;
}

void WorkerPool::WorkerLoop(size_t worker_id) {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      not_empty_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
      // Queued work still runs after Shutdown(); workers exit once it is gone.
      if (tasks_.empty()) return;
      task = std::move(tasks_.front());
      tasks_.pop_front();
      active_++;
    }
    not_full_.notify_one();

    // A throwing task is counted as failed; the worker keeps running.
    bool failed = false;
    try {
      task();
    } catch (const std::exception& e) {
      failed = true;
      Logger::Error("[WorkerPool] Task threw on worker " + std::to_string(worker_id) + ": " +
                    e.what());
    } catch (...) {
      failed = true;
      Logger::Error("[WorkerPool] Task threw a non-standard exception on worker " +
                    std::to_string(worker_id));
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      active_--;
      completed_++;
      if (failed) failed_++;
      if (tasks_.empty() && active_ == 0) idle_.notify_all();
    }
  }
}

}  // namespace avpipe::runtime
