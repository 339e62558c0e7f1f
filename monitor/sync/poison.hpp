#pragma once

#include <twist/ed/stdlike/atomic.hpp>

#include <exception>

namespace monitor::sync {

// Remembers that some holder left its critical section by an exception

class PoisonFlag {
 public:
  // Taken when a guard is created, checked when it is released
  struct Entry {
    int uncaught_exceptions;
  };

  PoisonFlag() = default;

  // Pinned
  PoisonFlag(const PoisonFlag&) = delete;
  PoisonFlag& operator=(const PoisonFlag&) = delete;

  PoisonFlag(PoisonFlag&&) = delete;
  PoisonFlag& operator=(PoisonFlag&&) = delete;

  Entry Borrow() const {
    return Entry{std::uncaught_exceptions()};
  }

  // true iff this release poisoned the flag
  bool Done(Entry entry) noexcept {
    if (std::uncaught_exceptions() > entry.uncaught_exceptions) {
      failed_.store(true, std::memory_order::relaxed);
      return true;
    }
    return false;
  }

  bool Get() const {
    return failed_.load(std::memory_order::relaxed);
  }

  void Clear() {
    failed_.store(false, std::memory_order::relaxed);
  }

 private:
  twist::ed::stdlike::atomic<bool> failed_{false};
};

}  // namespace monitor::sync
