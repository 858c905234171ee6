#include "yeelight/notifications.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <utility>

namespace yeelight {
namespace internal {

struct SubscriberQueue {
  explicit SubscriberQueue(size_t capacity) : capacity(capacity) {}

  // Push without blocking; drop the oldest entry when full.
  bool Push(const Notification& notification) {
    bool dropped_one = false;
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (closed || ended) {
        return false;
      }
      if (items.size() >= capacity) {
        items.pop_front();
        ++dropped;
        dropped_one = true;
      }
      items.push_back(notification);
    }
    cv.notify_all();
    return dropped_one;
  }

  void Finish() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      ended = true;
    }
    cv.notify_all();
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      closed = true;
      items.clear();
    }
    cv.notify_all();
  }

  const size_t capacity;
  mutable std::mutex mutex;
  std::condition_variable cv;
  std::deque<Notification> items;
  uint64_t dropped = 0;
  bool ended = false;
  bool closed = false;
};

}  // namespace internal

NotificationStream::NotificationStream() = default;

NotificationStream::NotificationStream(
    std::shared_ptr<internal::SubscriberQueue> queue)
    : queue_(std::move(queue)) {}

NotificationStream::~NotificationStream() { Close(); }

NotificationStream::NotificationStream(NotificationStream&& other) noexcept
    : queue_(std::move(other.queue_)) {}

NotificationStream& NotificationStream::operator=(NotificationStream&& other) noexcept {
  if (this != &other) {
    Close();
    queue_ = std::move(other.queue_);
  }
  return *this;
}

bool NotificationStream::Next(Notification* out) {
  if (!queue_) {
    return false;
  }
  std::unique_lock<std::mutex> lock(queue_->mutex);
  queue_->cv.wait(lock, [this]() {
    return !queue_->items.empty() || queue_->ended || queue_->closed;
  });
  if (queue_->items.empty()) {
    return false;
  }
  if (out) {
    *out = std::move(queue_->items.front());
  }
  queue_->items.pop_front();
  return true;
}

bool NotificationStream::NextFor(Notification* out,
                                 std::chrono::milliseconds timeout) {
  if (!queue_) {
    return false;
  }
  std::unique_lock<std::mutex> lock(queue_->mutex);
  queue_->cv.wait_for(lock, timeout, [this]() {
    return !queue_->items.empty() || queue_->ended || queue_->closed;
  });
  if (queue_->items.empty()) {
    return false;
  }
  if (out) {
    *out = std::move(queue_->items.front());
  }
  queue_->items.pop_front();
  return true;
}

bool NotificationStream::finished() const {
  if (!queue_) {
    return true;
  }
  std::lock_guard<std::mutex> lock(queue_->mutex);
  return queue_->items.empty() && (queue_->ended || queue_->closed);
}

uint64_t NotificationStream::dropped() const {
  if (!queue_) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(queue_->mutex);
  return queue_->dropped;
}

size_t NotificationStream::buffered() const {
  if (!queue_) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(queue_->mutex);
  return queue_->items.size();
}

void NotificationStream::Close() {
  if (queue_) {
    queue_->Close();
  }
}

NotificationDispatcher::NotificationDispatcher(size_t queue_capacity)
    : queue_capacity_(std::max<size_t>(1, queue_capacity)) {}

NotificationStream NotificationDispatcher::Subscribe() {
  auto queue = std::make_shared<internal::SubscriberQueue>(queue_capacity_);
  std::lock_guard<std::mutex> lock(mutex_);
  if (ended_) {
    queue->Finish();
  } else {
    subscribers_.push_back(queue);
  }
  return NotificationStream(std::move(queue));
}

size_t NotificationDispatcher::Publish(const Notification& notification) {
  std::vector<std::shared_ptr<internal::SubscriberQueue>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) {
      return 0;
    }
    auto it = subscribers_.begin();
    while (it != subscribers_.end()) {
      auto queue = it->lock();
      if (!queue) {
        it = subscribers_.erase(it);
        continue;
      }
      targets.push_back(std::move(queue));
      ++it;
    }
  }
  size_t drops = 0;
  for (const auto& queue : targets) {
    if (queue->Push(notification)) {
      ++drops;
    }
  }
  return drops;
}

void NotificationDispatcher::End() {
  std::vector<std::weak_ptr<internal::SubscriberQueue>> subscribers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_) {
      return;
    }
    ended_ = true;
    subscribers.swap(subscribers_);
  }
  for (const auto& weak : subscribers) {
    if (auto queue = weak.lock()) {
      queue->Finish();
    }
  }
}

bool NotificationDispatcher::ended() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ended_;
}

size_t NotificationDispatcher::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& weak : subscribers_) {
    if (!weak.expired()) {
      ++count;
    }
  }
  return count;
}

}  // namespace yeelight
