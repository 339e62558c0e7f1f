#pragma once

#include <expected>
#include <utility>

namespace monitor::sync {

// Lock was acquired, but some previous holder failed mid-section.
// Holds the acquired guard, so the caller may still decide to go on.

template <typename Guard>
class PoisonError {
 public:
  explicit PoisonError(Guard guard)
      : guard_(std::move(guard)) {
  }

  // Non-copyable
  PoisonError(const PoisonError&) = delete;
  PoisonError& operator=(const PoisonError&) = delete;

  // Movable
  PoisonError(PoisonError&&) = default;
  PoisonError& operator=(PoisonError&&) = default;

  const Guard& GetRef() const {
    return guard_;
  }

  Guard& GetMut() {
    return guard_;
  }

  // Acknowledge the poisoning and take the guard
  Guard IntoInner() && {
    return std::move(guard_);
  }

 private:
  Guard guard_;
};

template <typename Guard>
using LockResult = std::expected<Guard, PoisonError<Guard>>;

//////////////////////////////////////////////////////////////////////

class WaitTimeoutResult {
 public:
  explicit WaitTimeoutResult(bool timed_out)
      : timed_out_(timed_out) {
  }

  // Deadline elapsed and the predicate still did not hold
  bool TimedOut() const {
    return timed_out_;
  }

 private:
  bool timed_out_;
};

//////////////////////////////////////////////////////////////////////

namespace result {

/*
 * Usage:
 *
 * core_.Lock();
 * return result::Ok(Guard<T>(*this));
 *
 */

template <typename Guard>
LockResult<Guard> Ok(Guard guard) {
  return LockResult<Guard>{std::in_place, std::move(guard)};
}

template <typename Guard>
LockResult<Guard> Poisoned(Guard guard) {
  return LockResult<Guard>{std::unexpect, std::move(guard)};
}

}  // namespace result

}  // namespace monitor::sync
