#pragma once

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/wait/futex.hpp>

#include <cstdint>

namespace monitor::sync::detail {

// Plain futex mutex, the leaf of ConditionalMutex

class ExclusionCore {
  enum State : uint32_t { Unlocked = 0, Locked = 1, Contended = 2 };

 public:
  ExclusionCore() = default;

  // Pinned
  ExclusionCore(const ExclusionCore&) = delete;
  ExclusionCore& operator=(const ExclusionCore&) = delete;

  ExclusionCore(ExclusionCore&&) = delete;
  ExclusionCore& operator=(ExclusionCore&&) = delete;

  void Lock();

  // Leaves the core Contended on success: costs at most
  // one spare wake on the matching Unlock
  bool TryLock() {
    return CompareExchange(State::Unlocked, State::Contended) ==
           State::Unlocked;
  }

  void Unlock();

  // Racy, only meaningful when no other thread can touch the core
  bool IsLocked() const {
    return state_.load(std::memory_order::relaxed) != State::Unlocked;
  }

  // BasicLockable

  void lock() {  // NOLINT
    Lock();
  }

  void unlock() {  // NOLINT
    Unlock();
  }

 private:
  uint32_t CompareExchange(uint32_t expected, uint32_t desired) {
    state_.compare_exchange_strong(expected, desired,
                                   std::memory_order::acquire,
                                   std::memory_order::relaxed);
    return expected;
  }

 private:
  twist::ed::stdlike::atomic<uint32_t> state_{State::Unlocked};
};

}  // namespace monitor::sync::detail
