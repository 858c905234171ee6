#include "yeelight/correlator.h"

#include <utility>
#include <vector>

namespace yeelight {
namespace {

CommandResult FailureFor(uint64_t id, const Error& error) {
  CommandResult result;
  result.id = id;
  result.error = error;
  return result;
}

}  // namespace

PendingCall::PendingCall(uint64_t id, std::future<CommandResult> result)
    : id_(id), result_(std::move(result)) {}

PendingCall PendingCall::Ready(CommandResult result) {
  std::promise<CommandResult> promise;
  const uint64_t id = result.id;
  promise.set_value(std::move(result));
  return PendingCall(id, promise.get_future());
}

bool PendingCall::WaitFor(std::chrono::milliseconds timeout) const {
  if (!result_.valid()) {
    return false;
  }
  return result_.wait_for(timeout) == std::future_status::ready;
}

CommandResult PendingCall::Get() {
  if (!result_.valid()) {
    CommandResult result;
    result.id = id_;
    result.error.code = ErrorCode::kInvalidState;
    result.error.message = "result already retrieved";
    return result;
  }
  return result_.get();
}

uint64_t RequestCorrelator::NextId() {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_id_++;
}

PendingCall RequestCorrelator::Register(uint64_t generation,
                                        Clock::time_point deadline) {
  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t id = next_id_++;
  Slot& slot = pending_[id];
  slot.generation = generation;
  slot.deadline = deadline;
  return PendingCall(id, slot.promise.get_future());
}

bool RequestCorrelator::Complete(CommandResult result) {
  std::promise<CommandResult> promise;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(result.id);
    if (it == pending_.end()) {
      return false;
    }
    promise = std::move(it->second.promise);
    pending_.erase(it);
  }
  promise.set_value(std::move(result));
  return true;
}

size_t RequestCorrelator::ExpireBefore(Clock::time_point now) {
  std::vector<std::pair<uint64_t, std::promise<CommandResult>>> expired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.begin();
    while (it != pending_.end()) {
      if (it->second.deadline <= now) {
        expired.emplace_back(it->first, std::move(it->second.promise));
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }
  }
  Error error;
  error.code = ErrorCode::kTimeout;
  error.message = "no response before deadline";
  for (auto& entry : expired) {
    entry.second.set_value(FailureFor(entry.first, error));
  }
  return expired.size();
}

size_t RequestCorrelator::FailGeneration(uint64_t generation, const Error& error) {
  std::vector<std::pair<uint64_t, std::promise<CommandResult>>> failed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.begin();
    while (it != pending_.end()) {
      if (it->second.generation == generation) {
        failed.emplace_back(it->first, std::move(it->second.promise));
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& entry : failed) {
    entry.second.set_value(FailureFor(entry.first, error));
  }
  return failed.size();
}

size_t RequestCorrelator::FailAll(const Error& error) {
  std::unordered_map<uint64_t, Slot> failed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    failed.swap(pending_);
  }
  for (auto& entry : failed) {
    entry.second.promise.set_value(FailureFor(entry.first, error));
  }
  return failed.size();
}

std::optional<RequestCorrelator::Clock::time_point> RequestCorrelator::NextDeadline()
    const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<Clock::time_point> earliest;
  for (const auto& entry : pending_) {
    if (!earliest.has_value() || entry.second.deadline < earliest.value()) {
      earliest = entry.second.deadline;
    }
  }
  return earliest;
}

size_t RequestCorrelator::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

bool RequestCorrelator::IsPending(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.count(id) != 0;
}

}  // namespace yeelight
