// File: include/dw/core/util/worker_pool.hpp
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dw {

// Fixed set of threads over a bounded FIFO of jobs.
//
// try_submit() never blocks: with every worker busy and max_queued jobs waiting it returns
// false and the caller decides what to log. A job that throws std::exception is logged and the
// worker moves on.
//
// stop() discards jobs that have not started, waits for running ones, and joins. The
// destructor calls stop().
class WorkerPool {
 public:
  using Job = std::function<void()>;

  WorkerPool(std::string name, int workers, std::size_t max_queued);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  bool try_submit(Job job);

  // Blocks until the queue is empty and no job is running.
  void wait_idle();

  void stop();

  [[nodiscard]] std::size_t queued() const;
  [[nodiscard]] std::size_t active() const;

 private:
  void worker_loop_(int index);

  std::string name_;
  std::size_t max_queued_;

  mutable std::mutex mu_;
  std::condition_variable job_cv_;
  std::condition_variable idle_cv_;
  std::deque<Job> jobs_;
  std::size_t active_{0};
  bool shutdown_{false};

  std::vector<std::thread> threads_;
};

}  // namespace dw
