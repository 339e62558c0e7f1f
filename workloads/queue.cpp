#include <monitor/queue/blocking_queue.hpp>

#include <wheels/core/assert.hpp>
#include <wheels/core/stop_watch.hpp>

#include <twist/ed/stdlike/thread.hpp>

#include <fmt/core.h>

#include <array>
#include <chrono>
#include <cstddef>

using namespace monitor;  // NOLINT

constexpr size_t kTotal = 10'000'000;

//////////////////////////////////////////////////////////////////////

// One producer pushing batches of PushN, one consumer popping batches of PopN

template <size_t PushN, size_t PopN>
void WorkLoadQueue() {
  static_assert(kTotal % PushN == 0 && kTotal % PopN == 0);

  fmt::print("testing push {} pop {}... ", PushN, PopN);

  wheels::StopWatch sw;

  queue::BlockingQueue<size_t> queue;

  twist::ed::stdlike::thread producer([&queue] {
    for (size_t i = 0; i < kTotal; i += PushN) {
      if constexpr (PushN == 1) {
        queue.Push(i);
      } else {
        std::array<size_t, PushN> batch;
        for (size_t j = 0; j < PushN; ++j) {
          batch[j] = i + j;
        }
        queue.PushN(batch);
      }
    }
  });

  size_t expected = 0;

  for (size_t i = 0; i < kTotal; i += PopN) {
    if constexpr (PopN == 1) {
      auto item = queue.Pop();
      WHEELS_VERIFY(item && *item == expected, "Lost or reordered item");
      ++expected;
    } else {
      auto batch = queue.PopN<PopN>();
      WHEELS_VERIFY(batch, "Queue closed unexpectedly");
      for (size_t item : *batch) {
        WHEELS_VERIFY(item == expected, "Lost or reordered item");
        ++expected;
      }
    }
  }

  producer.join();

  const auto elapsed = sw.Elapsed();

  fmt::print(
      "{}ms\n",
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

//////////////////////////////////////////////////////////////////////

int main() {
  WorkLoadQueue<1, 1>();
  WorkLoadQueue<1, 10>();
  WorkLoadQueue<10, 1>();
  WorkLoadQueue<10, 10>();

  return 0;
}
