#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "syncore.hpp"

using namespace syncore;
using namespace std::chrono_literals;

constexpr std::size_t NUM_THREADS = 4;
constexpr std::size_t INCREMENTS = 250000;

// Runs body(i) on NUM_THREADS threads, returns when all are done
template <typename Body>
void run_workers(Body &&body) {
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < NUM_THREADS; ++i) {
    threads.emplace_back([&body, i]() { body(i); });
  }
  for (auto &t : threads) {
    t.join();
  }
}

template <typename C>
std::int64_t count_in_parallel() {
  C counter;
  run_workers([&counter](std::size_t) {
    for (std::size_t i = 0; i < INCREMENTS; ++i) {
      counter.increment();
    }
  });
  return counter.get();
}

// =============================================================================
// 1. Race condition
// =============================================================================
bool demo_race() {
  std::cout << "--- 1. Race condition (unsynchronized counter) ---\n";

  const auto expected = static_cast<std::int64_t>(NUM_THREADS * INCREMENTS);
  std::int64_t observed = count_in_parallel<unsynchronized_counter>();

  std::cout << "  Expected: " << expected << "\n";
  std::cout << "  Observed: " << observed << " (" << expected - observed
            << " updates lost)\n";
  return observed <= expected;
}

// =============================================================================
// 2. Fixed counters
// =============================================================================
bool demo_fixed_counters() {
  std::cout << "\n--- 2. Fixed counters ---\n";

  const auto expected = static_cast<std::int64_t>(NUM_THREADS * INCREMENTS);
  std::int64_t locked = count_in_parallel<locked_counter>();
  std::int64_t lock_free = count_in_parallel<counter>();

  std::cout << "  Mutex counter:     " << locked << "\n";
  std::cout << "  Lock-free counter: " << lock_free << "\n";
  return locked == expected && lock_free == expected;
}

// =============================================================================
// 3. Producer / consumer
// =============================================================================
bool demo_producer_consumer() {
  std::cout << "\n--- 3. Producer / consumer over a bounded channel ---\n";

  constexpr int ITEMS_PER_PRODUCER = 10000;
  auto ch = make_bounded_channel<int>(4);
  atomic_counter consumed_sum;
  atomic_counter producers_left(2);

  std::vector<std::thread> threads;
  for (int p = 0; p < 2; ++p) {
    threads.emplace_back([ch, &producers_left]() {
      for (int i = 1; i <= ITEMS_PER_PRODUCER; ++i) {
        if (ch->put(i) != channel_op_status::success) {
          return;
        }
      }
      if (producers_left.decrement() == 0) {
        ch->close();
      }
    });
  }
  for (int c = 0; c < 2; ++c) {
    threads.emplace_back([ch, &consumed_sum]() {
      while (auto item = ch->take()) {
        consumed_sum.increment(*item);
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  const std::int64_t expected =
      2LL * ITEMS_PER_PRODUCER * (ITEMS_PER_PRODUCER + 1) / 2;
  std::cout << "  Consumed sum: " << consumed_sum.get() << " (expected "
            << expected << ")\n";
  return consumed_sum.get() == expected;
}

// =============================================================================
// 4. Deadlock avoidance (dining philosophers)
// =============================================================================
bool demo_deadlock_avoidance() {
  std::cout << "\n--- 4. Deadlock avoidance (dining philosophers) ---\n";

  constexpr std::size_t SEATS = 5;
  constexpr int MEALS = 2000;

  std::vector<std::unique_ptr<ranked_mutex>> forks;
  for (std::size_t i = 0; i < SEATS; ++i) {
    forks.push_back(
        std::make_unique<ranked_mutex>(i, "fork" + std::to_string(i)));
  }

  atomic_counter meals;
  std::vector<std::thread> philosophers;
  for (std::size_t seat = 0; seat < SEATS; ++seat) {
    philosophers.emplace_back([&forks, &meals, seat]() {
      // Left then right; the last philosopher names them in reverse rank
      ranked_mutex *left = forks[seat].get();
      ranked_mutex *right = forks[(seat + 1) % SEATS].get();
      for (int m = 0; m < MEALS; ++m) {
        auto guard = acquire_ordered({left, right});
        meals.increment();
      }
    });
  }
  for (auto &t : philosophers) {
    t.join();
  }

  std::cout << "  Meals eaten: " << meals.get() << "\n";
  return meals.get() == static_cast<std::int64_t>(SEATS * MEALS);
}

// =============================================================================
// 5. Cancellation
// =============================================================================
bool demo_cancellation() {
  std::cout << "\n--- 5. Cancellation ---\n";

  atomic_counter heartbeats;
  auto idle = make_bounded_channel<int>(1);
  std::atomic<bool> consumer_cancelled{false};

  {
    supervised_thread heartbeat([&heartbeats](cancellation_token token) {
      while (!token.is_cancelled()) {
        heartbeats.increment();
        std::this_thread::sleep_for(5ms);
      }
    });
    supervised_thread consumer(
        [idle, &consumer_cancelled](cancellation_token token) {
          // Nothing is ever put; only cancellation ends this wait
          auto result = idle->take(token);
          consumer_cancelled = result.status == channel_op_status::cancelled;
        });

    std::this_thread::sleep_for(50ms);
    auto start = std::chrono::steady_clock::now();
    heartbeat.stop();
    consumer.stop();
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::cout << "  Heartbeats before stop: " << heartbeats.get() << "\n";
    std::cout << "  Workers stopped in " << waited.count() << " ms\n";
  }

  std::cout << "  Blocked consumer saw cancellation: "
            << (consumer_cancelled ? "yes" : "no") << "\n";
  return heartbeats.get() > 0 && consumer_cancelled;
}

// =============================================================================
// 6. Piped stream
// =============================================================================
bool demo_piped_stream() {
  std::cout << "\n--- 6. Piped byte stream ---\n";

  auto pipe = make_byte_pipe(32);
  pipe_writer writer = std::move(pipe.first);
  pipe_reader &reader = pipe.second;

  std::string sent;
  for (int i = 0; i < 20; ++i) {
    sent += "line " + std::to_string(i) + "\n";
  }

  std::thread producer([&writer, &sent]() {
    writer.write(sent);
    writer.close();
  });
  std::string received = reader.read_all();
  producer.join();

  std::cout << "  Sent " << sent.size() << " bytes, received "
            << received.size() << " bytes\n";
  return received == sent;
}

// =============================================================================
// 7. Three-stage pipeline
// =============================================================================
bool demo_pipeline() {
  std::cout << "\n--- 7. Pipeline: generate -> square -> sum ---\n";

  constexpr std::int64_t LIMIT = 100;
  auto numbers = make_bounded_channel<std::int64_t>(8);
  auto squares = make_bounded_channel<std::int64_t>(8);
  std::int64_t total = 0;

  std::thread generate([numbers]() {
    for (std::int64_t i = 1; i <= LIMIT; ++i) {
      if (numbers->put(i) != channel_op_status::success) {
        break;
      }
    }
    numbers->close();
  });
  std::thread square([numbers, squares]() {
    while (auto n = numbers->take()) {
      if (squares->put(*n * *n) != channel_op_status::success) {
        break;
      }
    }
    squares->close();
  });
  std::thread sum([squares, &total]() {
    while (auto sq = squares->take()) {
      total += *sq;
    }
  });

  generate.join();
  square.join();
  sum.join();

  const std::int64_t expected = LIMIT * (LIMIT + 1) * (2 * LIMIT + 1) / 6;
  std::cout << "  Sum of squares 1.." << LIMIT << ": " << total
            << " (expected " << expected << ")\n";
  return total == expected;
}

int main() {
  init_allocator();

  std::cout << "=== Shared-Memory Concurrency Demo ===\n";
  std::cout << "Hardware threads: " << std::thread::hardware_concurrency()
            << "\n\n";

  bool ok = true;
  ok = demo_race() && ok;
  ok = demo_fixed_counters() && ok;
  ok = demo_producer_consumer() && ok;
  ok = demo_deadlock_avoidance() && ok;
  ok = demo_cancellation() && ok;
  ok = demo_piped_stream() && ok;
  ok = demo_pipeline() && ok;

  std::cout << "\n" << (ok ? "All demonstrations completed" : "FAILED") << "\n";
  return ok ? 0 : 1;
}
