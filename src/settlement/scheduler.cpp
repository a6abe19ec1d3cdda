#include <tollbooth/settlement/scheduler.hpp>

#include <exception>

#include <spdlog/spdlog.h>

namespace tollbooth::settlement {

scheduler::~scheduler() {
  stop();
}

void scheduler::schedule(std::string name,
                         const std::chrono::milliseconds interval,
                         std::function<void()> task) {
  auto lock = std::scoped_lock{mutex_};
  if (stopping_) {
    return;
  }
  spdlog::info("scheduling '{}' every {}ms", name, interval.count());
  threads_.emplace_back([this, name = std::move(name), interval,
                         task = std::move(task)] { run(name, interval, task); });
}

void scheduler::run(const std::string& name,
                    const std::chrono::milliseconds interval,
                    const std::function<void()>& task) {
  while (true) {
    {
      auto lock = std::unique_lock{mutex_};
      if (wake_.wait_for(lock, interval, [this] { return stopping_; })) {
        return;
      }
    }
    try {
      task();
    } catch (const std::exception& e) {
      spdlog::error("task '{}' failed: {}", name, e.what());
    }
  }
}

void scheduler::stop() {
  auto threads = std::vector<std::thread>{};
  {
    auto lock = std::scoped_lock{mutex_};
    stopping_ = true;
    threads.swap(threads_);
  }
  wake_.notify_all();
  for (auto& thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

bool scheduler::stopping() const {
  auto lock = std::scoped_lock{mutex_};
  return stopping_;
}

}  // namespace tollbooth::settlement
