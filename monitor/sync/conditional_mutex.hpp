#pragma once

#include <monitor/sync/detail/exclusion_core.hpp>
#include <monitor/sync/detail/wait_channel.hpp>

#include <monitor/sync/guard.hpp>
#include <monitor/sync/lock_result.hpp>
#include <monitor/sync/metrics.hpp>
#include <monitor/sync/poison.hpp>

#include <monitor/support/millis.hpp>

#include <wheels/core/assert.hpp>
#include <wheels/core/defer.hpp>

#include <chrono>
#include <concepts>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace monitor::sync {

template <typename P, typename T>
concept StatePredicate = std::predicate<P&, const T&>;

template <typename T>
using TimedGuard = std::pair<Guard<T>, WaitTimeoutResult>;

/*
 * Mutex with conditional critical sections, "wait until P(state)"
 *
 * Usage:
 *
 * sync::ConditionalMutex<std::deque<int>> queue;
 *
 * // consumer
 * auto guard = queue.LockWhen([](const auto& q) {
 *   return !q.empty();
 * }).value();
 * guard->pop_front();
 *
 * // producer
 * queue.Lock().value()->push_back(7);
 *
 * Every release of a guard wakes all waiters, each of them re-locks
 * and re-checks its own predicate. No fairness among waiters.
 */

template <typename T>
class ConditionalMutex {
  friend class Guard<T>;

 public:
  template <typename... Args>
  requires std::is_constructible_v<T, Args...>
  explicit ConditionalMutex(Args&&... args)
      : value_(std::forward<Args>(args)...) {
  }

  // Waiters suspended in LockWhen/Await hold guards too,
  // with the core released
  ~ConditionalMutex() {
    WHEELS_VERIFY(core_.TryLock(),
                  "ConditionalMutex destroyed while a guard is outstanding");
    WHEELS_VERIFY(!channel_.HasSleepers(),
                  "ConditionalMutex destroyed while a waiter is suspended");
    core_.Unlock();
  }

  // Pinned
  ConditionalMutex(const ConditionalMutex&) = delete;
  ConditionalMutex& operator=(const ConditionalMutex&) = delete;

  ConditionalMutex(ConditionalMutex&&) = delete;
  ConditionalMutex& operator=(ConditionalMutex&&) = delete;

  LockResult<Guard<T>> Lock() {
    core_.Lock();
    logger_.Increment("Acquisitions", 1);

    return Acquired(Guard<T>(*this));
  }

  // nullopt iff the mutex is held right now
  std::optional<LockResult<Guard<T>>> TryLock() {
    if (!core_.TryLock()) {
      return std::nullopt;
    }
    logger_.Increment("Acquisitions", 1);

    return Acquired(Guard<T>(*this));
  }

  // Returned guard proves that pred held at the moment of return
  template <StatePredicate<T> Predicate>
  LockResult<Guard<T>> LockWhen(Predicate pred) {
    core_.Lock();
    logger_.Increment("Conditional acquisitions", 1);

    Guard<T> guard(*this);

    // Do not run predicates over a state left half-done
    if (poison_.Get()) {
      return result::Poisoned(std::move(guard));
    }

    return Await(std::move(guard), std::move(pred));
  }

  // Waits for pred in the middle of a critical section, the section
  // is left while suspended, so anything observed before may change
  template <StatePredicate<T> Predicate>
  LockResult<Guard<T>> Await(Guard<T> guard, Predicate pred) {
    VerifyOwnership(guard);

    while (!Check(pred)) {
      Suspend();

      if (poison_.Get()) {
        return result::Poisoned(std::move(guard));
      }
    }

    return result::Ok(std::move(guard));
  }

  template <StatePredicate<T> Predicate, typename Rep, typename Period>
  LockResult<TimedGuard<T>> LockWhenFor(
      Predicate pred, std::chrono::duration<Rep, Period> timeout) {
    const auto deadline = support::DeadlineAfter(timeout);

    core_.Lock();
    logger_.Increment("Conditional acquisitions", 1);

    Guard<T> guard(*this);

    if (poison_.Get()) {
      return result::Poisoned(
          TimedGuard<T>{std::move(guard), WaitTimeoutResult{false}});
    }

    return AwaitUntil(std::move(guard), pred, deadline);
  }

  // Guard is handed back in any case, check TimedOut() before
  // relying on pred
  template <StatePredicate<T> Predicate, typename Rep, typename Period>
  LockResult<TimedGuard<T>> AwaitFor(
      Guard<T> guard, Predicate pred,
      std::chrono::duration<Rep, Period> timeout) {
    VerifyOwnership(guard);

    return AwaitUntil(std::move(guard), pred, support::DeadlineAfter(timeout));
  }

  bool IsPoisoned() const {
    return poison_.Get();
  }

  // Caller vouches for the state being consistent again
  void ClearPoison() {
    poison_.Clear();
  }

  Logger::Metrics Metrics() {
    core_.Lock();
    wheels::Defer unlock([this] {
      core_.Unlock();
    });

    return logger_.GatherMetrics();
  }

 private:
  LockResult<Guard<T>> Acquired(Guard<T> guard) {
    if (poison_.Get()) {
      return result::Poisoned(std::move(guard));
    }
    return result::Ok(std::move(guard));
  }

  template <typename Predicate, typename TimePoint>
  LockResult<TimedGuard<T>> AwaitUntil(Guard<T> guard, Predicate& pred,
                                       TimePoint deadline) {
    while (!Check(pred)) {
      const auto now = support::SteadyClock::now();

      if (now >= deadline) {
        logger_.Increment("Timeouts", 1);
        return result::Ok(
            TimedGuard<T>{std::move(guard), WaitTimeoutResult{true}});
      }

      logger_.Increment("Suspensions", 1);
      channel_.WaitTimed(core_, support::CeilMillis(deadline - now));

      if (poison_.Get()) {
        return result::Poisoned(
            TimedGuard<T>{std::move(guard), WaitTimeoutResult{false}});
      }
    }

    return result::Ok(
        TimedGuard<T>{std::move(guard), WaitTimeoutResult{false}});
  }

  // Exceptions from pred propagate to the caller,
  // the guard being unwound poisons the mutex
  template <typename Predicate>
  bool Check(Predicate& pred) {
    logger_.Increment("Predicate checks", 1);

    if (std::invoke(pred, std::as_const(value_))) {
      return true;
    }

    logger_.Increment("Failed predicate checks", 1);
    return false;
  }

  void Suspend() {
    logger_.Increment("Suspensions", 1);
    channel_.Wait(core_);
  }

  void VerifyOwnership(const Guard<T>& guard) const {
    WHEELS_VERIFY(guard.mutex_ == this,
                  "Await requires a held guard of the same mutex");
  }

  // Broadcast while still holding the core: a woken waiter
  // can only get in after the whole section is published
  void Release(PoisonFlag::Entry entry) noexcept {
    if (poison_.Done(entry)) {
      logger_.Increment("Poisonings", 1);
    }

    if (channel_.Broadcast()) {
      logger_.Increment("Wakeup broadcasts", 1);
    }

    core_.Unlock();
  }

 private:
  T value_;

  detail::ExclusionCore core_;
  detail::WaitChannel channel_;  // bound to core_, never exposed

  PoisonFlag poison_;

  Logger logger_{kMetrics};  // guarded by core_
};

template <typename T>
ConditionalMutex(T) -> ConditionalMutex<T>;

}  // namespace monitor::sync
