#include "tgassist/channels/dispatcher.hpp"

#include "tgassist/observability/global.hpp"

#include <exception>
#include <iostream>

namespace tgassist::channels {

UpdateDispatcher::UpdateDispatcher(const std::size_t workers, Handler handler)
    : worker_count_(workers == 0 ? 1 : workers), handler_(std::move(handler)) {}

UpdateDispatcher::~UpdateDispatcher() { stop(); }

void UpdateDispatcher::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  stopping_ = false;
  for (std::size_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back([this]() { worker_loop(); });
  }
}

void UpdateDispatcher::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
}

bool UpdateDispatcher::submit(ChatEvent event) {
  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || stopping_) {
      return false;
    }
    queue_.push_back(std::move(event));
    depth = queue_.size();
  }
  cv_.notify_one();
  observability::record_metric(
      observability::DispatchQueueDepthMetric{.depth = static_cast<std::uint64_t>(depth)});
  return true;
}

std::size_t UpdateDispatcher::queue_depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void UpdateDispatcher::worker_loop() {
  while (true) {
    ChatEvent event;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      event = std::move(queue_.front());
      queue_.pop_front();
    }

    try {
      handler_(event);
    } catch (const std::exception &ex) {
      observability::record_error("dispatcher", "handler threw for update_id=" +
                                                    std::to_string(event.update_id) + ": " +
                                                    ex.what());
      std::cerr << "[dispatcher] handler error: " << ex.what() << "\n";
    }
  }
}

} // namespace tgassist::channels
