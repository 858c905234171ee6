#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "yeelight/codec.h"
#include "yeelight/error.h"

namespace yeelight {

/**
 * Handle to the eventual result of one issued command.
 */
class PendingCall {
 public:
  PendingCall() = default;
  PendingCall(uint64_t id, std::future<CommandResult> result);

  /// Build an already completed call.
  static PendingCall Ready(CommandResult result);

  PendingCall(PendingCall&&) = default;
  PendingCall& operator=(PendingCall&&) = default;

  uint64_t id() const { return id_; }
  bool valid() const { return result_.valid(); }

  /// Wait up to `timeout`; returns true once the result is available.
  bool WaitFor(std::chrono::milliseconds timeout) const;
  /// Block until the command completes, fails or times out. Single use.
  CommandResult Get();

 private:
  uint64_t id_ = 0;
  std::future<CommandResult> result_;
};

/**
 * Tracks commands awaiting a response.
 *
 * Each registered id owns one pending slot that is resolved exactly once:
 * by a matching response, by expiry of its deadline, or by failure of the
 * transport generation it was written to. Resolving an id that has no slot
 * is a no-op.
 */
class RequestCorrelator {
 public:
  using Clock = std::chrono::steady_clock;

  RequestCorrelator() = default;

  RequestCorrelator(const RequestCorrelator&) = delete;
  RequestCorrelator& operator=(const RequestCorrelator&) = delete;

  /// Allocate the next id (monotonic, starting at 1) without a pending slot.
  uint64_t NextId();

  /// Allocate an id and register a pending slot expiring at `deadline`.
  PendingCall Register(uint64_t generation, Clock::time_point deadline);

  /// Resolve the slot for `result.id`. Returns false if there is none.
  bool Complete(CommandResult result);

  /// Fail every slot whose deadline is at or before `now` with kTimeout.
  size_t ExpireBefore(Clock::time_point now);

  /// Fail slots registered for one transport generation.
  size_t FailGeneration(uint64_t generation, const Error& error);

  /// Fail every slot.
  size_t FailAll(const Error& error);

  /// Earliest deadline among pending slots.
  std::optional<Clock::time_point> NextDeadline() const;

  size_t pending_count() const;
  bool IsPending(uint64_t id) const;

 private:
  struct Slot {
    uint64_t generation = 0;
    Clock::time_point deadline;
    std::promise<CommandResult> promise;
  };

  mutable std::mutex mutex_;
  uint64_t next_id_ = 1;
  std::unordered_map<uint64_t, Slot> pending_;
};

}  // namespace yeelight
