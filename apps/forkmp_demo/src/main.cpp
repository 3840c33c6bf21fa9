/**
 * @file main.cpp
 * @brief forkmp_demo: small tour of the region API.
 *
 * **Static loop** Fill a shared array, each worker writing its own block.
 * **Dynamic loop** Uneven work items pulled from the shared cursor.
 * **Lock** Accumulate into one shared cell under the region lock.
 * **Nesting** Inner regions fork below the outer workers when nesting is on.
 * **Failure** A worker throwing surfaces as RegionError in the caller.
 *
 * Usage: forkmp_demo [-v|-q] [threads]   (default: environment / hardware)
 * -v logs the fork/join traffic (same as FORKMP_LOGLEVEL=debug), -q silences
 * the failure reports of the last section.
 */

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "forkmp/forkmp.hpp"

namespace {

void static_loop(std::optional<int> threads) {
  constexpr std::size_t N = 100;
  auto squares = forkmp::shared::array<std::int64_t>({N});
  forkmp::parallel(threads, [&](forkmp::Parallel& p) {
    for (auto i : p.range(static_cast<std::int64_t>(N))) squares[i] = i * i;
  });
  const auto sum = std::accumulate(squares.begin(), squares.end(), std::int64_t{0});
  std::cout << "static:  sum of squares below " << N << " = " << sum << '\n';
}

void dynamic_loop(std::optional<int> threads) {
  constexpr std::size_t N = 16;
  auto owner = forkmp::shared::array<int>({N});
  forkmp::parallel(threads, [&](forkmp::Parallel& p) {
    for (auto i : p.dynamic_range(static_cast<std::int64_t>(N))) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1 + (i % 4) * 5));
      owner[i] = static_cast<int>(p.thread_num());
    }
  });
  std::cout << "dynamic: item owners =";
  for (int t : owner) std::cout << ' ' << t;
  std::cout << '\n';
}

void locked_sum(std::optional<int> threads) {
  auto total = forkmp::shared::array<std::int64_t>({1});
  forkmp::parallel(threads, [&](forkmp::Parallel& p) {
    for (auto i : p.range(1, 1001)) {
      std::lock_guard<forkmp::mem::Mutex> guard(p.lock());
      total[0] += i;
    }
  });
  std::cout << "lock:    1 + ... + 1000 = " << total[0] << '\n';
}

void nested() {
  forkmp::config::Configuration cfg;
  cfg.nested = true;
  cfg.num_threads = {2, 2};
  std::cout << "nested:\n" << std::flush;
  forkmp::parallel(cfg, std::nullopt, [&](forkmp::Parallel& outer) {
    forkmp::parallel(cfg, std::nullopt, [&](forkmp::Parallel& inner) {
      forkmp::Parallel::print("  outer {} / inner {} (level {})",
                              outer.thread_num(), inner.thread_num(), inner.level());
    });
  });
}

void failure(std::optional<int> threads) {
  try {
    forkmp::parallel(threads, [](forkmp::Parallel& p) {
      if (p.thread_num() == p.num_threads() - 1) {
        throw std::runtime_error("simulated failure");
      }
    });
    std::cout << "failure: nothing raised\n";
  } catch (const forkmp::RegionError& e) {
    std::cout << "failure: caught RegionError: " << e.what() << '\n';
  }
}

} // namespace

int main(int argc, char** argv) {
  std::optional<int> threads;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-v") {
      forkmp::obs::set_level(forkmp::obs::log_level::debug);
    } else if (arg == "-q") {
      forkmp::obs::set_level(forkmp::obs::log_level::off);
    } else {
      threads = std::atoi(argv[i]);
    }
  }

  std::cout << "forkmp " << forkmp::version_string << " demo\n"
            << "--------------------------------------------------\n"
            << std::flush;
  try {
    static_loop(threads);
    dynamic_loop(threads);
    locked_sum(threads);
    nested();
    failure(threads);
  } catch (const forkmp::Error& e) {
    std::cerr << "forkmp_demo: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  std::cout << std::flush;
  return EXIT_SUCCESS;
}
