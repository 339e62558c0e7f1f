#include <monitor/sync/detail/exclusion_core.hpp>

namespace monitor::sync::detail {

void ExclusionCore::Lock() {
  if (CompareExchange(State::Unlocked, State::Locked) == State::Unlocked) {
    // fast path, nobody around
    return;
  }

  do {
    // announce ourselves before going to sleep
    CompareExchange(State::Locked, State::Contended);
    twist::ed::futex::Wait(state_, State::Contended,
                           std::memory_order::relaxed);

  } while (!TryLock());
}

void ExclusionCore::Unlock() {
  auto wake_key = twist::ed::futex::PrepareWake(state_);
  if (state_.exchange(State::Unlocked, std::memory_order::release) ==
      State::Contended) {
    twist::ed::futex::WakeOne(wake_key);
  }
}

// MO proof:
// Every successful acquisition is a CAS with acquire, every release is an
// exchange with release, so each critical section is in hb with the next one.
// Failed CASes and the futex wait only decide whether to sleep -> relaxed.

}  // namespace monitor::sync::detail
