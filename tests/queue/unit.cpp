#include <monitor/queue/blocking_queue.hpp>

#include <wheels/test/framework.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#if !defined(TWIST_FIBERS)

using namespace monitor;  // NOLINT

using namespace std::chrono_literals;

template <typename T>
using BlockingQueue = queue::BlockingQueue<T>;

// Throws when moved from if told so
struct Fragile {
  explicit Fragile(int v, bool fail = false)
      : value(v),
        fail_on_move(fail) {
  }

  Fragile(Fragile&& that)
      : value(that.value),
        fail_on_move(that.fail_on_move) {
    if (fail_on_move) {
      throw std::runtime_error("Move failed");
    }
  }

  int value;
  bool fail_on_move;
};

TEST_SUITE(Queue) {
  SIMPLE_TEST(JustWorks) {
    BlockingQueue<std::string> queue;

    ASSERT_TRUE(queue.Push("Data"));

    auto item = queue.Pop();
    ASSERT_TRUE(item);
    ASSERT_EQ(*item, "Data");
  }

  SIMPLE_TEST(Fifo) {
    BlockingQueue<int> queue;

    queue.Push(1);
    queue.Push(2);
    queue.Push(3);

    ASSERT_EQ(*queue.Pop(), 1);
    ASSERT_EQ(*queue.Pop(), 2);
    ASSERT_EQ(*queue.Pop(), 3);
  }

  SIMPLE_TEST(Batches) {
    BlockingQueue<int> queue;

    ASSERT_TRUE(queue.PushN(std::array<int, 3>{1, 2, 3}));
    queue.Push(4);

    auto batch = queue.PopN<2>();
    ASSERT_TRUE(batch);
    ASSERT_EQ((*batch)[0], 1);
    ASSERT_EQ((*batch)[1], 2);

    auto rest = queue.PopN<2>();
    ASSERT_TRUE(rest);
    ASSERT_EQ((*rest)[0], 3);
    ASSERT_EQ((*rest)[1], 4);
  }

  SIMPLE_TEST(MoveOnly) {
    BlockingQueue<std::unique_ptr<int>> queue;

    queue.Push(std::make_unique<int>(17));

    auto item = queue.Pop();
    ASSERT_TRUE(item);
    ASSERT_EQ(**item, 17);
  }

  SIMPLE_TEST(PopBlocks) {
    BlockingQueue<int> queue;
    std::atomic<bool> popped{false};

    std::thread consumer([&] {
      auto item = queue.Pop();
      ASSERT_TRUE(item);
      ASSERT_EQ(*item, 5);
      popped.store(true);
    });

    std::this_thread::sleep_for(100ms);
    ASSERT_FALSE(popped.load());

    queue.Push(5);
    consumer.join();

    ASSERT_TRUE(popped.load());
  }

  SIMPLE_TEST(PopNWaitsForWholeBatch) {
    BlockingQueue<int> queue;
    std::atomic<bool> popped{false};

    std::thread consumer([&] {
      auto batch = queue.PopN<3>();
      ASSERT_TRUE(batch);
      ASSERT_EQ((*batch)[2], 3);
      popped.store(true);
    });

    for (int i = 1; i <= 2; ++i) {
      queue.Push(i);
      std::this_thread::sleep_for(50ms);
      ASSERT_FALSE(popped.load());
    }

    queue.Push(3);
    consumer.join();

    ASSERT_TRUE(popped.load());
  }

  SIMPLE_TEST(CloseWakesConsumers) {
    BlockingQueue<int> queue;

    std::thread first([&] {
      ASSERT_FALSE(queue.Pop());
    });
    std::thread second([&] {
      ASSERT_FALSE(queue.PopN<4>());
    });

    std::this_thread::sleep_for(100ms);
    queue.Close();

    first.join();
    second.join();
  }

  SIMPLE_TEST(DrainAfterClose) {
    BlockingQueue<int> queue;

    queue.Push(1);
    queue.Push(2);
    queue.Close();

    ASSERT_FALSE(queue.Push(3));
    ASSERT_FALSE(queue.PushN(std::array<int, 1>{4}));

    ASSERT_FALSE(queue.PopN<3>());

    ASSERT_EQ(*queue.Pop(), 1);
    ASSERT_EQ(*queue.Pop(), 2);
    ASSERT_FALSE(queue.Pop());
  }

  SIMPLE_TEST(FailedPushKeepsQueueOpen) {
    BlockingQueue<Fragile> queue;

    ASSERT_THROW(queue.Push(Fragile{1, /*fail=*/true}), std::runtime_error);

    std::atomic<bool> popped{false};

    std::thread consumer([&] {
      auto item = queue.Pop();
      ASSERT_TRUE(item);
      ASSERT_EQ(item->value, 2);
      popped.store(true);
    });

    // Still blocks on an open empty queue
    std::this_thread::sleep_for(100ms);
    ASSERT_FALSE(popped.load());

    ASSERT_TRUE(queue.Push(Fragile{2}));
    consumer.join();

    ASSERT_TRUE(popped.load());
  }

  SIMPLE_TEST(FailedPushWhileConsumerWaits) {
    BlockingQueue<Fragile> queue;
    std::atomic<size_t> popped{0};

    std::thread consumer([&] {
      while (auto item = queue.Pop()) {
        ++popped;
      }
    });

    std::this_thread::sleep_for(50ms);
    // Wakes the consumer with a poisoned mutex
    ASSERT_THROW(queue.Push(Fragile{1, /*fail=*/true}), std::runtime_error);

    std::this_thread::sleep_for(50ms);
    ASSERT_EQ(popped.load(), 0);

    queue.Push(Fragile{2});
    queue.Push(Fragile{3});
    queue.Close();

    consumer.join();

    ASSERT_EQ(popped.load(), 2);
  }
}

#endif

RUN_ALL_TESTS()
