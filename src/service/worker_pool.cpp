#include <tollbooth/service/worker_pool.hpp>

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace tollbooth::service {

worker_pool::worker_pool(const std::size_t threads) {
  auto count = std::max<std::size_t>(threads, 1);
  threads_.reserve(count);
  for (auto i = std::size_t{0}; i < count; ++i) {
    threads_.emplace_back([this] { run(); });
  }
}

worker_pool::~worker_pool() {
  stop();
}

bool worker_pool::post(std::function<void()> job) {
  {
    auto lock = std::scoped_lock{mutex_};
    if (stopping_) {
      return false;
    }
    jobs_.push_back(std::move(job));
  }
  wake_.notify_one();
  return true;
}

void worker_pool::run() {
  while (true) {
    auto job = std::function<void()>{};
    {
      auto lock = std::unique_lock{mutex_};
      wake_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    try {
      job();
    } catch (const std::exception& e) {
      spdlog::error("worker job failed: {}", e.what());
    }
  }
}

void worker_pool::stop() {
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

}  // namespace tollbooth::service
