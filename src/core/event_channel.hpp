#pragma once
#include "telemetry.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <variant>
#include <vector>

using Event = std::variant<TriggerEvent, PollHealthEvent, BlendProgressEvent>;

/**
 * @brief Bounded outbound event queue
 *
 * Pollers and blend operations push typed events; one consumer (the
 * publisher thread) drains them. Producers never block: when the queue is
 * full the oldest event is overwritten and counted as dropped, the same
 * policy as an overwrite-oldest ring buffer.
 *
 * Implements both sink interfaces so it can be handed to pollers and the
 * blend orchestrator directly.
 */
class EventChannel : public ITriggerSink, public ITelemetrySink {
private:
  std::deque<Event> queue_;
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::uint64_t pushed_{0};
  std::uint64_t dropped_{0};
  bool closed_{false};

public:
  explicit EventChannel(std::size_t capacity = 4096) : capacity_(capacity) {}

  void push(Event e) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return;
      if (queue_.size() >= capacity_) {
        queue_.pop_front();
        dropped_++;
      }
      queue_.push_back(std::move(e));
      pushed_++;
    }
    cv_.notify_one();
  }

  /**
   * @brief Take everything queued, waiting up to @p timeout for the first event
   * @return Events in push order (empty on timeout or after close)
   */
  std::vector<Event> drain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    std::vector<Event> out(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
  }

  /// Wake the consumer and refuse further events
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

  std::uint64_t pushed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushed_;
  }

  std::uint64_t dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

  // sink interfaces
  void on_register_changes(const std::vector<TriggerEvent>& changes) override {
    for (const auto& c : changes) push(c);
  }

  void on_poll_health(const PollHealthEvent& health) override { push(health); }

  void on_blend_progress(const BlendProgressEvent& progress) override { push(progress); }
};
