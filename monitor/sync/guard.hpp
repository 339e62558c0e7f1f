#pragma once

#include <monitor/sync/poison.hpp>

#include <wheels/core/assert.hpp>

#include <utility>

namespace monitor::sync {

template <typename T>
class ConditionalMutex;

// Scoped exclusive access to the state of a ConditionalMutex.
// Releasing it (Unlock or destructor) wakes every waiter of the mutex.

template <typename T>
class Guard {
  friend class ConditionalMutex<T>;

 public:
  // Non-copyable
  Guard(const Guard&) = delete;
  Guard& operator=(const Guard&) = delete;

  // Movable
  Guard(Guard&& that) noexcept
      : mutex_(std::exchange(that.mutex_, nullptr)),
        entry_(that.entry_) {
  }

  Guard& operator=(Guard&& that) noexcept {
    if (this != &that) {
      Release();
      mutex_ = std::exchange(that.mutex_, nullptr);
      entry_ = that.entry_;
    }
    return *this;
  }

  ~Guard() {
    Release();
  }

  // Early release, the guard is empty afterwards
  void Unlock() {
    WHEELS_VERIFY(mutex_ != nullptr, "Guard is already unlocked");
    Release();
  }

  bool OwnsLock() const {
    return mutex_ != nullptr;
  }

  T& operator*() {
    return Owner().value_;
  }

  const T& operator*() const {
    return Owner().value_;
  }

  T* operator->() {
    return &Owner().value_;
  }

  const T* operator->() const {
    return &Owner().value_;
  }

 private:
  // Core must be already locked by the caller
  explicit Guard(ConditionalMutex<T>& mutex)
      : mutex_(&mutex),
        entry_(mutex.poison_.Borrow()) {
  }

  ConditionalMutex<T>& Owner() const {
    WHEELS_ASSERT(mutex_ != nullptr, "Access through a released guard");
    return *mutex_;
  }

  void Release() noexcept {
    if (auto* mutex = std::exchange(mutex_, nullptr)) {
      mutex->Release(entry_);
    }
  }

 private:
  ConditionalMutex<T>* mutex_;
  PoisonFlag::Entry entry_;
};

}  // namespace monitor::sync
