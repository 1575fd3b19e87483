#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "syncore.hpp"

// Counter realizations under the same contended workload: every thread
// increments one shared counter as fast as it can

constexpr std::size_t NUM_THREADS = 4;
constexpr std::size_t INCREMENTS = 500000;
constexpr int NUM_RUNS = 3;

template <typename Func>
double measure_time_ms(Func &&func) {
  auto start = std::chrono::high_resolution_clock::now();
  func();
  auto end = std::chrono::high_resolution_clock::now();
  return std::chrono::duration<double, std::milli>(end - start).count();
}

struct bench_result {
  std::string name;
  double time_ms;
  std::int64_t last_total;
};

template <typename C>
bench_result run_counter(const std::string &name) {
  std::cout << name << "... " << std::flush;

  double total_ms = 0;
  std::int64_t last_total = 0;
  for (int run = 0; run < NUM_RUNS; ++run) {
    C counter;
    total_ms += measure_time_ms([&]() {
      std::vector<std::thread> threads;
      threads.reserve(NUM_THREADS);
      for (std::size_t t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&counter]() {
          for (std::size_t i = 0; i < INCREMENTS; ++i) {
            counter.increment();
          }
        });
      }
      for (auto &t : threads) {
        t.join();
      }
    });
    last_total = counter.get();
  }
  total_ms /= NUM_RUNS;
  std::cout << total_ms << " ms\n";
  return {name, total_ms, last_total};
}

int main() {
  using namespace syncore;
  using contended_counter =
      shared_counter<high_contention_policies::counter_policy>;
  using contended_locked_counter =
      shared_counter<locked_counter_policy<high_contention_policies::lock_policy>>;

  std::cout << "Shared Counter Contention Benchmark\n";
  std::cout << "===================================\n";
  std::cout << "Hardware threads: " << std::thread::hardware_concurrency()
            << "\n";
  std::cout << NUM_THREADS << " threads x " << INCREMENTS
            << " increments, average of " << NUM_RUNS << " runs\n\n";

  const auto expected = static_cast<std::int64_t>(NUM_THREADS * INCREMENTS);

  std::vector<bench_result> results;
  results.push_back(run_counter<unsynchronized_counter>("Unsynchronized"));
  results.push_back(run_counter<locked_counter>("Mutex"));
  results.push_back(run_counter<contended_locked_counter>("Spinlock"));
  results.push_back(run_counter<contended_counter>("Atomic fetch_add"));
  results.push_back(run_counter<cas_counter>("CAS loop"));

  // Every synchronized counter must be exact
  bool correct = true;
  for (std::size_t i = 1; i < results.size(); ++i) {
    if (results[i].last_total != expected) {
      std::cerr << "ERROR: " << results[i].name << " counted "
                << results[i].last_total << ", expected " << expected << "\n";
      correct = false;
    }
  }

  if (!correct) {
    return 1;
  }

  const double baseline = results[1].time_ms;

  std::cout << "\n";
  std::cout << "+---------------------+------------+---------+--------------+\n";
  std::cout << "| Counter             | Time (ms)  | vs Mutex| Final value  |\n";
  std::cout << "+---------------------+------------+---------+--------------+\n";
  for (const auto &r : results) {
    printf("| %-19s | %10.2f | %6.2fx | %12lld |\n", r.name.c_str(), r.time_ms,
           baseline / r.time_ms, static_cast<long long>(r.last_total));
  }
  std::cout << "+---------------------+------------+---------+--------------+\n";

  std::cout << "\nExpected final value: " << expected << "\n";
  std::cout << "Unsynchronized lost " << expected - results[0].last_total
            << " updates in its last run\n";

  return 0;
}
