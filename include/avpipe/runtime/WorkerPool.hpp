// Repository: avpipe
// Component: WorkerPool
// Purpose: Fixed set of worker threads draining a bounded task queue, for
//          post-processing decoded frames off the pipeline thread.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_RUNTIME_WORKER_POOL_HPP_
#define AVPIPE_RUNTIME_WORKER_POOL_HPP_

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "avpipe/util/MediaError.hpp"

namespace avpipe::runtime {

// Submit() blocks while the queue holds `queue_capacity` tasks, which is the
// backpressure that keeps a fast decoder from outrunning its consumers.
// Tasks run in submission order per worker; completion order across workers
// is unspecified. Pipelines are not shared between tasks; Frames and Packets
// may be moved into them.
class WorkerPool {
 public:
  using Task = std::function<void()>;

  WorkerPool(size_t worker_count, size_t queue_capacity);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // kPipelineClosed after Shutdown(); kInvalidSettings for an empty task.
  util::MediaError Submit(Task task);

  // Blocks until the queue is empty and no task is running.
  void WaitIdle();

  // Runs the queued tasks, then joins the workers. Idempotent.
  void Shutdown();

  size_t WorkerCount() const { return workers_.size(); }
  size_t QueueCapacity() const { return capacity_; }
  size_t PendingTasks() const;
  // Every task that ran, including the ones counted in FailedTasks().
  uint64_t CompletedTasks() const;
  // Tasks that exited with an exception.
  uint64_t FailedTasks() const;

 private:
  void WorkerLoop(size_t worker_id);

  const size_t capacity_;
  std::vector<std::thread> workers_;
  std::deque<Task> tasks_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::condition_variable idle_;
  size_t active_ = 0;
  uint64_t completed_ = 0;
  uint64_t failed_ = 0;
  bool stopping_ = false;
};

}  // namespace avpipe::runtime

#endif  // AVPIPE_RUNTIME_WORKER_POOL_HPP_
