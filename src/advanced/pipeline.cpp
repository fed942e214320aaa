#include "cachekit/pipeline.hpp"
#include "cachekit/logging.hpp"

#include <algorithm>
#include <atomic>

namespace cachekit {

bool run_bounded(const Context &ctx, const std::vector<BatchTask> &tasks,
                 std::size_t limit, std::string_view op, Error *err) {
  if (tasks.empty())
    return true;
  const auto workers = std::min(std::max<std::size_t>(limit, 1), tasks.size());

  const Context scope = ctx.with_cancel();
  std::atomic<std::size_t> next{0};
  std::once_flag first;
  Error first_err;
  std::atomic<bool> failed{false};

  auto record = [&](Error e) {
    std::call_once(first, [&] {
      first_err = std::move(e);
      failed.store(true, std::memory_order_release);
    });
    scope.cancel();
  };

  auto worker = [&] {
    for (;;) {
      const auto i = next.fetch_add(1, std::memory_order_relaxed);
      if (i >= tasks.size())
        return;
      Error e;
      if (!scope.check(op, {}, &e)) {
        record(std::move(e));
        continue;
      }
      if (!tasks[i](scope, &e)) {
        if (e.ok())
          e = make_error(ErrorCode::ComputeFailed, op);
        record(std::move(e));
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(workers - 1);
  for (std::size_t i = 1; i < workers; ++i)
    pool.emplace_back(worker);
  worker();
  for (auto &t : pool)
    t.join();

  if (!failed.load(std::memory_order_acquire))
    return true;
  if (err)
    *err = std::move(first_err);
  return false;
}

TaskPool::TaskPool(std::size_t threads, std::size_t max_queue)
    : max_queue_(max_queue) {
  threads = std::max<std::size_t>(threads, 1);
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i)
    workers_.emplace_back([this] { worker_loop(); });
  logger()->debug("task pool started: {} workers, queue {}", threads,
                  max_queue_);
}

TaskPool::~TaskPool() { shutdown(); }

bool TaskPool::submit(Job job, Duration budget) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_ || (max_queue_ > 0 && queue_.size() >= max_queue_)) {
      ++rejected_;
      return false;
    }
    queue_.push_back({std::move(job), Context::background().with_timeout(budget)});
  }
  work_cv_.notify_one();
  return true;
}

void TaskPool::wait_idle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void TaskPool::shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (stopping_ && workers_.empty())
      return;
    stopping_ = true;
  }
  work_cv_.notify_all();
  for (auto &w : workers_)
    if (w.joinable())
      w.join();
  workers_.clear();
}

std::size_t TaskPool::pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::uint64_t TaskPool::rejected() const {
  std::lock_guard lock(mutex_);
  return rejected_;
}

void TaskPool::worker_loop() {
  for (;;) {
    Pending p;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty())
        return;
      p = std::move(queue_.front());
      queue_.pop_front();
      ++running_;
    }
    p.job(p.ctx);
    {
      std::lock_guard lock(mutex_);
      --running_;
    }
    idle_cv_.notify_all();
  }
}

} // namespace cachekit
