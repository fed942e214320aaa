#pragma once

#include "cachekit/context.hpp"
#include "cachekit/error.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

namespace cachekit {

// A unit of batch work. Returns false and fills *err on failure.
using BatchTask = std::function<bool(const Context &ctx, Error *err)>;

inline constexpr std::size_t kDefaultPipelineConcurrency = 10;

// Runs every task with at most `limit` in flight. Tasks run under a child
// of ctx that is canceled on the first failure; tasks that have not
// started by then report the cancellation instead of running. The first
// error wins and is returned only after all workers have finished.
bool run_bounded(const Context &ctx, const std::vector<BatchTask> &tasks,
                 std::size_t limit, std::string_view op,
                 Error *err = nullptr);

// Fixed-size worker pool for work that must outlive the request that
// scheduled it. Each task gets its own timeout context, created at submit
// time and unrelated to any caller context.
class TaskPool {
public:
  using Job = std::function<void(const Context &ctx)>;

  TaskPool(std::size_t threads, std::size_t max_queue);
  ~TaskPool();

  TaskPool(const TaskPool &) = delete;
  TaskPool &operator=(const TaskPool &) = delete;

  // False when the pool is stopped or the queue is full.
  bool submit(Job job, Duration budget);

  // Blocks until the queue is empty and no job is running.
  void wait_idle();

  // Runs what is already queued, then joins the workers.
  void shutdown();

  std::size_t pending() const;
  std::uint64_t rejected() const;

private:
  struct Pending {
    Job job;
    Context ctx;
  };

  void worker_loop();

  const std::size_t max_queue_;
  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<Pending> queue_;
  std::vector<std::thread> workers_;
  std::size_t running_{0};
  std::uint64_t rejected_{0};
  bool stopping_{false};
};

} // namespace cachekit
