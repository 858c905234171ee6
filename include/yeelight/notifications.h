#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "yeelight/codec.h"

namespace yeelight {

namespace internal {
struct SubscriberQueue;
}  // namespace internal

/**
 * One subscriber's view of a session's notifications.
 *
 * Sees every notification published after it was created, in arrival order.
 * The buffer is bounded: when full, the oldest queued notification is
 * dropped so the publisher never blocks. The stream ends once the session's
 * read path ends and the buffer is drained.
 */
class NotificationStream {
 public:
  NotificationStream();
  ~NotificationStream();

  NotificationStream(NotificationStream&&) noexcept;
  NotificationStream& operator=(NotificationStream&&) noexcept;
  NotificationStream(const NotificationStream&) = delete;
  NotificationStream& operator=(const NotificationStream&) = delete;

  /// Block for the next notification. Returns false at end of stream.
  bool Next(Notification* out);
  /// Like Next, but gives up after `timeout`.
  bool NextFor(Notification* out, std::chrono::milliseconds timeout);

  /// True once the stream has ended and nothing is left to read.
  bool finished() const;
  /// Number of notifications dropped because the buffer was full.
  uint64_t dropped() const;
  /// Notifications currently buffered.
  size_t buffered() const;

  /// Stop receiving notifications.
  void Close();

 private:
  friend class NotificationDispatcher;
  explicit NotificationStream(std::shared_ptr<internal::SubscriberQueue> queue);

  std::shared_ptr<internal::SubscriberQueue> queue_;
};

/**
 * Fans notifications out to independent subscribers.
 */
class NotificationDispatcher {
 public:
  explicit NotificationDispatcher(size_t queue_capacity);

  NotificationDispatcher(const NotificationDispatcher&) = delete;
  NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

  /// New subscription. After End() the returned stream is already finished.
  NotificationStream Subscribe();

  /// Deliver to every open subscriber. Returns the number of drops caused.
  size_t Publish(const Notification& notification);

  /// Finish every subscription; later subscriptions start finished.
  void End();

  bool ended() const;
  size_t subscriber_count() const;

 private:
  size_t queue_capacity_;
  mutable std::mutex mutex_;
  bool ended_ = false;
  std::vector<std::weak_ptr<internal::SubscriberQueue>> subscribers_;
};

}  // namespace yeelight
