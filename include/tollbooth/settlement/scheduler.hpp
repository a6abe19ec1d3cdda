#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tollbooth::settlement {

/// Runs named tasks at fixed intervals, each on its own thread, until stop().
/// A task that throws is logged and runs again at its next tick.
class scheduler final {
 public:
  scheduler() = default;
  ~scheduler();

  scheduler(const scheduler&) = delete;
  scheduler& operator=(const scheduler&) = delete;

  void schedule(std::string name,
                std::chrono::milliseconds interval,
                std::function<void()> task);

  /// Wakes every task thread and joins it. Idempotent.
  void stop();

  bool stopping() const;

 private:
  void run(const std::string& name,
           std::chrono::milliseconds interval,
           const std::function<void()>& task);

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_{false};
  std::vector<std::thread> threads_;
};

}  // namespace tollbooth::settlement
