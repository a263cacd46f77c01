#include "batch_cache/cache.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

using namespace batch_cache;

namespace {
// Per-frame cost of the simulated bus; a frame carries any number of ids.
constexpr auto kFrameCost = std::chrono::microseconds(200);
constexpr auto kPerIdCost = std::chrono::microseconds(10);

std::vector<double> bus_read(const std::vector<int> &ids, std::uint64_t &frames) {
  ++frames;
  std::this_thread::sleep_for(kFrameCost + kPerIdCost * ids.size());
  std::vector<double> out;
  out.reserve(ids.size());
  for (int id : ids)
    out.push_back(id * 1.5);
  return out;
}
} // namespace

int main() {
  const std::vector<int> expiries_ms = {0, 1, 5, 20};
  const int motors = 16;
  const int ops = 500;

  for (int exp_ms : expiries_ms) {
    std::cout << "expiry_ms=" << exp_ms << "\n";
    for (const bool batched : {false, true}) {
      auto cache = Cache<int, double>::with_expiry_duration(
          std::chrono::milliseconds(exp_ms));
      std::mt19937_64 rng(42);
      std::uniform_int_distribution<int> u(0, motors - 1);
      std::uint64_t frames = 0;

      auto start = std::chrono::steady_clock::now();
      for (int i = 0; i < ops; ++i) {
        std::vector<int> ids;
        for (int j = 0; j < 6; ++j)
          ids.push_back(u(rng));
        if (batched) {
          cache.entries(ids).or_insert_with([&](const std::vector<int> &missing) {
            return bus_read(missing, frames);
          });
        } else {
          for (int id : ids) {
            cache.entry(id).or_insert_with([&](const int &k) {
              return bus_read({k}, frames).front();
            });
          }
        }
      }
      auto end = std::chrono::steady_clock::now();
      double seconds = std::chrono::duration<double>(end - start).count();
      std::cout << "mode=" << (batched ? "batched" : "per_key")
                << " ops/s=" << std::fixed << std::setprecision(2)
                << (ops / seconds) << " frames=" << frames
                << " hits=" << cache.stats().hits
                << " misses=" << cache.stats().misses << "\n";
    }
  }
  return 0;
}
