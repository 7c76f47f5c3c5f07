// File: src/core/util/worker_pool.cpp
#include "dw/core/util/worker_pool.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace dw {

WorkerPool::WorkerPool(std::string name, int workers, std::size_t max_queued)
    : name_(std::move(name)), max_queued_(max_queued) {
  if (workers < 1) workers = 1;
  threads_.reserve(static_cast<std::size_t>(workers));
  for (int i = 0; i < workers; ++i) {
    threads_.emplace_back(&WorkerPool::worker_loop_, this, i);
  }
  spdlog::debug("WorkerPool[{}]: {} workers, queue bound {}", name_, workers, max_queued_);
}

WorkerPool::~WorkerPool() { stop(); }

bool WorkerPool::try_submit(Job job) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_) return false;
    const bool worker_free = active_ + jobs_.size() < threads_.size();
    if (!worker_free && jobs_.size() >= max_queued_) return false;
    jobs_.push_back(std::move(job));
  }
  job_cv_.notify_one();
  return true;
}

void WorkerPool::wait_idle() {
  std::unique_lock<std::mutex> lock(mu_);
  idle_cv_.wait(lock, [this] { return jobs_.empty() && active_ == 0; });
}

void WorkerPool::stop() {
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_ && threads_.empty()) return;
    shutdown_ = true;
    dropped = jobs_.size();
    jobs_.clear();
  }
  job_cv_.notify_all();
  idle_cv_.notify_all();

  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();

  if (dropped > 0) spdlog::info("WorkerPool[{}]: dropped {} pending jobs on stop", name_, dropped);
}

std::size_t WorkerPool::queued() const {
  std::lock_guard<std::mutex> lock(mu_);
  return jobs_.size();
}

std::size_t WorkerPool::active() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_;
}

void WorkerPool::worker_loop_(int index) {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mu_);
      job_cv_.wait(lock, [this] { return shutdown_ || !jobs_.empty(); });
      if (shutdown_) break;
      job = std::move(jobs_.front());
      jobs_.pop_front();
      ++active_;
    }

    try {
      job();
    } catch (const std::exception& e) {
      spdlog::error("WorkerPool[{}]: worker {} job failed: {}", name_, index, e.what());
    }

    {
      std::lock_guard<std::mutex> lock(mu_);
      --active_;
      if (jobs_.empty() && active_ == 0) idle_cv_.notify_all();
    }
  }
}

}  // namespace dw
