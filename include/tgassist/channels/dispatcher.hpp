#pragma once

#include "tgassist/channels/chat.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace tgassist::channels {

/// Hands chat events to a fixed pool of worker threads so one slow assistant
/// turn never holds up polling. Events are processed in arrival order per
/// worker but with no ordering across workers.
class UpdateDispatcher {
public:
  using Handler = std::function<void(const ChatEvent &)>;

  UpdateDispatcher(std::size_t workers, Handler handler);
  ~UpdateDispatcher();

  UpdateDispatcher(const UpdateDispatcher &) = delete;
  UpdateDispatcher &operator=(const UpdateDispatcher &) = delete;

  void start();
  /// Finishes queued events, then joins the workers.
  void stop();

  /// Returns false once stopped.
  bool submit(ChatEvent event);

  [[nodiscard]] std::size_t queue_depth() const;

private:
  void worker_loop();

  std::size_t worker_count_;
  Handler handler_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ChatEvent> queue_;
  bool running_ = false;
  bool stopping_ = false;
  std::vector<std::thread> workers_;
};

} // namespace tgassist::channels
