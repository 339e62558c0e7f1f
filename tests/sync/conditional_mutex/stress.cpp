#include <monitor/sync/conditional_mutex.hpp>

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/stdlike/thread.hpp>

#include <twist/test/with/wheels/stress.hpp>
#include <twist/test/budget.hpp>
#include <twist/test/repeat.hpp>

#include <vector>

using namespace monitor;  // NOLINT
using namespace std::chrono_literals;

//////////////////////////////////////////////////////////////////////

// At most one guard at any instant

void MutualExclusion(size_t threads) {
  sync::ConditionalMutex<size_t> counter{0};
  twist::ed::stdlike::atomic<size_t> inside{0};
  twist::ed::stdlike::atomic<size_t> sections{0};

  std::vector<twist::ed::stdlike::thread> contenders;

  for (size_t i = 0; i < threads; ++i) {
    contenders.emplace_back([&, i] {
      for (size_t j = 0; twist::test::KeepRunning(); ++j) {
        auto guard = (j + i) % 2 == 0
                         ? counter.Lock().value()
                         : counter.LockWhen([](size_t) {
                             return true;
                           }).value();

        ASSERT_EQ(inside.fetch_add(1), 0);
        ++*guard;
        inside.fetch_sub(1);

        sections.fetch_add(1, std::memory_order::relaxed);
      }
    });
  }

  for (auto& t : contenders) {
    t.join();
  }

  ASSERT_EQ(*counter.Lock().value(), sections.load());
}

//////////////////////////////////////////////////////////////////////

// Threads pass a baton around by waiting for their own turn,
// a single missed wakeup hangs the test

void TurnTaking(size_t threads, size_t rounds) {
  for (twist::test::Repeat repeat; repeat();) {
    sync::ConditionalMutex<size_t> turn{0};

    std::vector<twist::ed::stdlike::thread> players;

    for (size_t id = 0; id < threads; ++id) {
      players.emplace_back([&turn, id, threads, rounds] {
        for (size_t r = 0; r < rounds; ++r) {
          auto guard = turn.LockWhen([id, threads](size_t t) {
            return t % threads == id;
          }).value();

          ASSERT_EQ(*guard % threads, id);
          ++*guard;
        }
      });
    }

    for (auto& t : players) {
      t.join();
    }

    ASSERT_EQ(*turn.Lock().value(), threads * rounds);
  }
}

//////////////////////////////////////////////////////////////////////

// A single release must wake every waiter whose predicate became true

void BroadcastTest() {
  for (twist::test::Repeat repeat; repeat();) {
    const size_t waiters = 1 + repeat.Iter() % 4;

    sync::ConditionalMutex<bool> ready{false};
    twist::ed::stdlike::atomic<size_t> passed{0};

    std::vector<twist::ed::stdlike::thread> threads;

    for (size_t i = 0; i < waiters; ++i) {
      threads.emplace_back([&] {
        auto guard = ready.LockWhen([](bool r) {
          return r;
        }).value();

        ASSERT_TRUE(*guard);
        passed.fetch_add(1);
      });
    }

    threads.emplace_back([&] {
      *ready.Lock().value() = true;
    });

    for (auto& t : threads) {
      t.join();
    }

    ASSERT_EQ(passed.load(), waiters);
  }
}

//////////////////////////////////////////////////////////////////////

// Ping-pong through Await in the middle of both sections

void PingPong(size_t exchanges) {
  for (twist::test::Repeat repeat; repeat();) {
    sync::ConditionalMutex<size_t> ball{0};

    auto player = [&ball, exchanges](size_t parity) {
      auto guard = ball.Lock().value();

      for (size_t i = 0; i < exchanges; ++i) {
        guard = ball.Await(std::move(guard), [parity](size_t b) {
          return b % 2 == parity;
        }).value();

        ++*guard;
      }
    };

    twist::ed::stdlike::thread ping([&] {
      player(0);
    });
    twist::ed::stdlike::thread pong([&] {
      player(1);
    });

    ping.join();
    pong.join();

    ASSERT_EQ(*ball.Lock().value(), 2 * exchanges);
  }
}

//////////////////////////////////////////////////////////////////////

TEST_SUITE(ConditionalMutex) {
  TWIST_TEST(MutualExclusion_2, 5s) {
    MutualExclusion(2);
  }

  TWIST_TEST(MutualExclusion_5, 5s) {
    MutualExclusion(5);
  }

  TWIST_TEST(TurnTaking_2, 5s) {
    TurnTaking(2, 16);
  }

  TWIST_TEST(TurnTaking_4, 5s) {
    TurnTaking(4, 8);
  }

  TWIST_TEST(Broadcast, 5s) {
    BroadcastTest();
  }

  TWIST_TEST(PingPong, 5s) {
    PingPong(10);
  }
}

RUN_ALL_TESTS()
