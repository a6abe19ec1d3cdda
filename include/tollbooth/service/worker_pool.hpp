#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace tollbooth::service {

/// Fixed set of threads draining one FIFO queue. Jobs posted before stop()
/// all run; a job that throws is logged and the worker moves on.
class worker_pool final {
 public:
  explicit worker_pool(std::size_t threads);
  ~worker_pool();

  worker_pool(const worker_pool&) = delete;
  worker_pool& operator=(const worker_pool&) = delete;

  /// False once stop() has begun; the job is dropped.
  bool post(std::function<void()> job);

  /// Refuses new jobs, runs what is queued and joins. Idempotent.
  void stop();

 private:
  void run();

  std::mutex mutex_;
  std::condition_variable wake_;
  std::deque<std::function<void()>> jobs_;
  bool stopping_{false};
  std::vector<std::thread> threads_;
};

}  // namespace tollbooth::service
