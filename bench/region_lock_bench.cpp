#include "channel/region_lock.hpp"
#include <chrono>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <random>
#include <shared_mutex>
#include <thread>
#include <vector>

using namespace nbdatatools;

// Simulated critical section: touch a small buffer so the lock is held for a
// measurable but short time.
static void work(std::vector<uint64_t> &slot) {
  for (auto &v : slot) {
    v = v * 31 + 7;
  }
}

template <typename Fn>
double run_threads(int threads, int opsPerThread, Fn fn) {
  auto start = std::chrono::high_resolution_clock::now();
  std::vector<std::thread> pool;
  for (int t = 0; t < threads; ++t) {
    pool.emplace_back([&, t] {
      std::mt19937_64 rng(t + 1);
      for (int i = 0; i < opsPerThread; ++i) {
        fn(t, rng);
      }
    });
  }
  for (auto &th : pool) {
    th.join();
  }
  auto end = std::chrono::high_resolution_clock::now();
  return std::chrono::duration<double, std::milli>(end - start).count();
}

int main() {
  const int threads = static_cast<int>(
      std::max(2u, std::thread::hardware_concurrency()));
  const int ops = 20000;
  const uint64_t regionSize = 1024 * 1024;
  const uint64_t fileSize = 256 * regionSize;

  std::vector<std::vector<uint64_t>> slots(256, std::vector<uint64_t>(64, 1));

  std::cout << "Threads: " << threads << ", ops/thread: " << ops << std::endl;

  std::shared_mutex global;
  double globalRandom = run_threads(threads, ops, [&](int, std::mt19937_64 &rng) {
    uint64_t offset = rng() % fileSize;
    std::unique_lock<std::shared_mutex> lock(global);
    work(slots[offset / regionSize]);
  });

  RegionLockManager regions(regionSize);
  double regionRandom = run_threads(threads, ops, [&](int, std::mt19937_64 &rng) {
    uint64_t offset = rng() % fileSize;
    auto lock = regions.getWriteLock(offset, 4096);
    work(slots[offset / regionSize]);
  });

  double globalSame = run_threads(threads, ops, [&](int, std::mt19937_64 &) {
    std::unique_lock<std::shared_mutex> lock(global);
    work(slots[0]);
  });

  double regionSame = run_threads(threads, ops, [&](int, std::mt19937_64 &) {
    auto lock = regions.getWriteLock(0, 4096);
    work(slots[0]);
  });

  std::cout << std::fixed << std::setprecision(2);
  std::cout << "Random writes, global lock:   " << globalRandom << " ms" << std::endl;
  std::cout << "Random writes, region locks:  " << regionRandom << " ms" << std::endl;
  std::cout << "Same region, global lock:     " << globalSame << " ms" << std::endl;
  std::cout << "Same region, region locks:    " << regionSame << " ms" << std::endl;
  return 0;
}
