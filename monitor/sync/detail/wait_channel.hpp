#pragma once

#include <monitor/sync/detail/exclusion_core.hpp>

#include <monitor/support/millis.hpp>

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/wait/futex.hpp>

#include <cstddef>
#include <cstdint>

namespace monitor::sync::detail {

// Payload-free condition variable bound to a single ExclusionCore
// Every method must be called with that core held

class WaitChannel {
  using Epoch = uint32_t;

 public:
  WaitChannel() = default;

  // Pinned
  WaitChannel(const WaitChannel&) = delete;
  WaitChannel& operator=(const WaitChannel&) = delete;

  WaitChannel(WaitChannel&&) = delete;
  WaitChannel& operator=(WaitChannel&&) = delete;

  void Wait(ExclusionCore& core) {
    Epoch entry_epoch = Enter();
    core.Unlock();

    twist::ed::futex::Wait(epoch_, entry_epoch, std::memory_order::relaxed);

    Leave(core);
  }

  // Returns on broadcast, on timeout or spuriously,
  // the caller tells them apart by itself
  void WaitTimed(ExclusionCore& core, support::Millis timeout) {
    Epoch entry_epoch = Enter();
    core.Unlock();

    twist::ed::futex::WaitTimed(epoch_, entry_epoch, timeout);

    Leave(core);
  }

  bool HasSleepers() const {
    return sleepers_ > 0;
  }

  // Wakes every sleeper, returns false if there was nobody to wake
  bool Broadcast() {
    if (sleepers_ == 0) {
      return false;
    }

    auto wake_key = twist::ed::futex::PrepareWake(epoch_);

    epoch_.fetch_add(1, std::memory_order::relaxed);
    twist::ed::futex::WakeAll(wake_key);

    return true;
  }

 private:
  Epoch Enter() {
    ++sleepers_;
    return epoch_.load(std::memory_order::relaxed);
  }

  void Leave(ExclusionCore& core) {
    core.Lock();
    --sleepers_;
  }

 private:
  twist::ed::stdlike::atomic<Epoch> epoch_{0};
  size_t sleepers_{0};  // guarded by the core
};

// No missed wakeups:
// The epoch is read under the core and Broadcast bumps it under the core,
// so any broadcast issued after Enter changes the epoch before the futex
// compares it, and the sleeper either returns at once or gets woken.
// Happens-before for the protected state comes from the core itself -> relaxed.

}  // namespace monitor::sync::detail
