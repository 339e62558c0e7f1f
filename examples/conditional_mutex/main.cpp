#include <monitor/sync/conditional_mutex.hpp>
#include <monitor/sync/format.hpp>

#include <monitor/queue/blocking_queue.hpp>

#include <fmt/core.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace monitor;  // NOLINT

/*
ConditionalMutex<T> is a mutex which owns the state it protects.

The only way to reach the state is a Guard, which is returned by
Lock, TryLock and LockWhen. Guard unlocks the mutex in its destructor.

The point of ConditionalMutex is LockWhen: "wait until P(state)".
You never pick a condition variable nor decide whom to notify:
every unlock wakes every waiter, and each waiter checks its own
predicate under the lock.

Every lock operation returns LockResult<Guard>, which is
std::expected<Guard, PoisonError<Guard>>. It holds an error if some
previous holder left its critical section by an exception.
*/

//////////////////////////////////////////////////////////////////////

void LockWhenExample() {
  fmt::print("LockWhen example\n");

  sync::ConditionalMutex<int> counter{0};

  std::thread waiter([&counter] {
    // Blocks until somebody makes the counter reach 3
    auto guard = counter.LockWhen([](int value) {
      return value >= 3;
    }).value();

    fmt::print("Waiter observed {}\n", *guard);
  });

  for (size_t i = 0; i < 3; ++i) {
    std::this_thread::sleep_for(10ms);

    // No notify here: releasing the guard is enough
    ++*counter.Lock().value();
  }

  waiter.join();

  fmt::print("{}\n", counter);
}

//////////////////////////////////////////////////////////////////////

void AwaitExample() {
  fmt::print("Await example\n");

  struct Exchange {
    int request{0};
    int response{0};
  };

  sync::ConditionalMutex<Exchange> exchange;

  std::thread server([&exchange] {
    auto guard = exchange.LockWhen([](const Exchange& e) {
      return e.request != 0;
    }).value();

    guard->response = guard->request * 2;
  });

  auto guard = exchange.Lock().value();
  guard->request = 21;

  // Leave the section until the response is there, then carry on
  guard = exchange.Await(std::move(guard), [](const Exchange& e) {
    return e.response != 0;
  }).value();

  fmt::print("Response: {}\n", guard->response);

  guard.Unlock();
  server.join();
}

//////////////////////////////////////////////////////////////////////

void PoisonExample() {
  fmt::print("Poison example\n");

  sync::ConditionalMutex<std::vector<int>> data;

  try {
    auto guard = data.Lock().value();
    guard->push_back(1);
    throw std::runtime_error("Failed halfway");
  } catch (const std::runtime_error& e) {
    fmt::print("Critical section failed: {}\n", e.what());
  }

  auto acquired = data.Lock();

  if (!acquired) {
    // Lock is held, we decide whether the state is still usable
    auto guard = std::move(acquired.error()).IntoInner();
    fmt::print("Poisoned, {} items survived\n", guard->size());
    guard->clear();
  }

  data.ClearPoison();
  fmt::print("Poisoned after repair: {}\n", data.IsPoisoned());
}

//////////////////////////////////////////////////////////////////////

void QueueExample() {
  fmt::print("BlockingQueue example\n");

  queue::BlockingQueue<int> queue;

  std::thread producer([&queue] {
    for (int i = 0; i < 6; ++i) {
      queue.Push(i);
    }
    queue.Close();
  });

  // Batches of two, until the queue is closed and drained
  while (auto batch = queue.PopN<2>()) {
    fmt::print("Batch: {} {}\n", (*batch)[0], (*batch)[1]);
  }

  producer.join();
}

//////////////////////////////////////////////////////////////////////

int main() {
  LockWhenExample();
  AwaitExample();
  PoisonExample();
  QueueExample();

  return 0;
}
