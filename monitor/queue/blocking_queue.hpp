#pragma once

#include <monitor/sync/conditional_mutex.hpp>

#include <array>
#include <cstddef>
#include <deque>
#include <optional>
#include <type_traits>
#include <utility>

namespace monitor::queue {

// Unbounded blocking multi-producers/multi-consumers (MPMC) queue
// on top of conditional critical sections: no condition variables
// to pick and notify by hand

template <typename T>
class BlockingQueue {
  struct State {
    std::deque<T> items;
    bool is_open{true};
  };

 public:
  BlockingQueue() = default;

  // Pinned
  BlockingQueue(const BlockingQueue&) = delete;
  BlockingQueue& operator=(const BlockingQueue&) = delete;

  BlockingQueue(BlockingQueue&&) = delete;
  BlockingQueue& operator=(BlockingQueue&&) = delete;

  // returns true if object was put
  // returns false if queue was closed
  bool Push(T object) {
    auto state = Enter(state_.Lock());

    if (state->is_open) {
      state->items.push_back(std::move(object));
    }

    return state->is_open;
  }

  // Poppers see the whole batch at once
  template <size_t N>
  bool PushN(std::array<T, N> objects) {
    auto state = Enter(state_.Lock());

    if (!state->is_open) {
      return false;
    }

    for (auto& object : objects) {
      state->items.push_back(std::move(object));
    }

    return true;
  }

  // returns nullopt iff the queue is closed and drained
  std::optional<T> Pop() {
    auto state = EnterWhen([](const State& s) {
      return !s.is_open || !s.items.empty();
    });

    if (state->items.empty()) {
      return std::nullopt;
    }

    return TakeFront(state);
  }

  // Waits for N items at once, items of a batch are consecutive.
  // returns nullopt iff the queue got closed with less than N items left
  template <size_t N>
  std::optional<std::array<T, N>> PopN() {
    static_assert(N > 0, "Empty batch");
    // A throwing move halfway through the batch would lose items
    static_assert(std::is_nothrow_move_constructible_v<T>,
                  "PopN requires nothrow movable items");

    auto state = EnterWhen([](const State& s) {
      return !s.is_open || s.items.size() >= N;
    });

    if (state->items.size() < N) {
      return std::nullopt;
    }

    return [&state]<size_t... I>(std::index_sequence<I...>) {
      // braced init list is evaluated left to right
      return std::array<T, N>{((void)I, TakeFront(state))...};
    }(std::make_index_sequence<N>{});
  }

  // Wakes every blocked Pop/PopN
  void Close() {
    Enter(state_.Lock())->is_open = false;
  }

 private:
  using Guard = sync::Guard<State>;

  // push_back and pop_front keep the deque intact if T throws,
  // so poisoning is acknowledged and cleared right away

  Guard Enter(sync::LockResult<Guard> acquired) {
    if (!acquired) {
      auto guard = std::move(acquired.error()).IntoInner();
      state_.ClearPoison();
      return guard;
    }
    return std::move(acquired).value();
  }

  template <typename Predicate>
  Guard EnterWhen(Predicate ready) {
    auto acquired = state_.LockWhen(ready);

    // Poisoned mutex skips the predicate, check it again after repair
    while (!acquired) {
      auto guard = std::move(acquired.error()).IntoInner();
      state_.ClearPoison();
      acquired = state_.Await(std::move(guard), ready);
    }

    return std::move(acquired).value();
  }

  static T TakeFront(Guard& state) {
    T front = std::move(state->items.front());
    state->items.pop_front();
    return front;
  }

 private:
  sync::ConditionalMutex<State> state_;
};

}  // namespace monitor::queue
