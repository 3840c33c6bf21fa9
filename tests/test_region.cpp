/**
 * @file test_region.cpp
 * @brief End-to-end tests for Parallel: fork, schedule, lock, join, aggregate.
 *
 * Validates:
 *  - Thread-count resolution (request, per-level list, nesting, thread limit)
 *  - Every thread number in [0, N) runs the body exactly once
 *  - Static and dynamic loops inside a region cover their domain exactly once
 *  - K failing workers of M surface as one RegionError("K of M ...")
 *  - Nested regions with nesting off (sequential) and on (forked)
 *  - Thread limit shared by concurrently entered nested regions, and given
 *    back when a worker dies inside a nested region
 *  - Regions driven by the process environment through config::global()
 *  - Region lock, serialized print, lifecycle misuse
 *
 * Bodies run in forked processes, so they never call gtest assertions: they
 * write into shared buffers and the coordinator checks them after the join.
 */

#include <gtest/gtest.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "forkmp/forkmp.hpp"

using namespace std::chrono_literals;
using forkmp::Parallel;
using forkmp::config::Configuration;
using forkmp::region::resolve_thread_count;

namespace {

/// Explicit configuration so the host environment cannot change the outcome.
Configuration make_config(bool nested = false, std::optional<unsigned> limit = std::nullopt,
                          std::vector<unsigned> counts = {}) {
  Configuration cfg;
  cfg.nested = nested;
  cfg.thread_limit = limit;
  cfg.num_threads = std::move(counts);
  return cfg;
}

/// Run a region, returning the RegionError it raised (if any).
template <class Body>
std::optional<forkmp::RegionError> run_region(const Configuration& cfg, std::optional<int> n, Body&& body) {
  try {
    forkmp::parallel(cfg, n, std::forward<Body>(body));
  } catch (const forkmp::RegionError& e) {
    return e;
  }
  return std::nullopt;
}

/// Fork, run @p fn in the child, _exit with its result; return the exit status.
template <class Fn>
int run_in_child(Fn&& fn) {
  const pid_t pid = ::fork();
  if (pid == 0) {
    int rc = 1;
    try {
      rc = fn();
    } catch (...) {
      rc = 2;
    }
    ::_exit(rc);
  }
  int status = 0;
  ::waitpid(pid, &status, 0);
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

// ------------------------- Thread-count resolution -------------------------

TEST(ResolveThreadCount, RequestAndConfiguredCounts) {
  EXPECT_EQ(resolve_thread_count(make_config(), 0, 6), 6u);
  EXPECT_EQ(resolve_thread_count(make_config(false, std::nullopt, {3}), 0, std::nullopt), 3u);
  EXPECT_EQ(resolve_thread_count(make_config(false, std::nullopt, {3}), 0, 8), 3u);
  EXPECT_EQ(resolve_thread_count(make_config(false, std::nullopt, {8}), 0, 2), 2u);
  EXPECT_EQ(resolve_thread_count(make_config(), 0, std::nullopt), forkmp::os::hardware_threads());
}

TEST(ResolveThreadCount, NestingLevels) {
  // Nesting off: every level below the top runs sequentially.
  EXPECT_EQ(resolve_thread_count(make_config(false, std::nullopt, {4, 4}), 1, 4), 1u);
  EXPECT_EQ(resolve_thread_count(make_config(false), 3, 8), 1u);

  // Nesting on: per-level list, last entry reused.
  const auto cfg = make_config(true, std::nullopt, {4, 3});
  EXPECT_EQ(resolve_thread_count(cfg, 0, std::nullopt), 4u);
  EXPECT_EQ(resolve_thread_count(cfg, 1, std::nullopt), 3u);
  EXPECT_EQ(resolve_thread_count(cfg, 2, std::nullopt), 3u);
  EXPECT_EQ(resolve_thread_count(cfg, 1, 2), 2u);
}

/**
 * @test ThreadLimitCountsLiveProcesses
 * @brief n <= limit - active + 1, never below one.
 */
TEST(ResolveThreadCount, ThreadLimitCountsLiveProcesses) {
  const auto cfg = make_config(true, 3u);
  EXPECT_EQ(resolve_thread_count(cfg, 0, 4, 1), 3u);
  EXPECT_EQ(resolve_thread_count(cfg, 1, 4, 2), 2u);
  EXPECT_EQ(resolve_thread_count(cfg, 1, 4, 3), 1u);
  EXPECT_EQ(resolve_thread_count(cfg, 1, 4, 7), 1u);
}

TEST(ResolveThreadCount, InvalidInputs) {
  EXPECT_THROW(resolve_thread_count(make_config(), 0, 0), forkmp::ConfigError);
  EXPECT_THROW(resolve_thread_count(make_config(), 0, -2), forkmp::ConfigError);
  EXPECT_THROW(resolve_thread_count(make_config(false, 0u), 0, 2), forkmp::ConfigError);
  EXPECT_THROW(resolve_thread_count(make_config(false, std::nullopt, {2, 0}), 0, 2), forkmp::ConfigError);
}

// ------------------------------ Basic region -------------------------------

/**
 * @test Region_EveryThreadNumRunsOnce
 * @brief 4 processes, thread numbers 0..3, each body exactly once.
 */
TEST(Region, Region_EveryThreadNumRunsOnce) {
  const auto cfg = make_config();
  auto runs = forkmp::shared::array<std::int32_t>({4});
  auto sizes = forkmp::shared::array<std::int32_t>({4});
  auto pids = forkmp::shared::array<std::int32_t>({4});

  auto err = run_region(cfg, 4, [&](Parallel& p) {
    std::lock_guard<forkmp::mem::Mutex> g(p.lock());
    runs[p.thread_num()] += 1;
    sizes[p.thread_num()] = static_cast<std::int32_t>(p.num_threads());
    pids[p.thread_num()] = forkmp::os::current_pid();
  });
  ASSERT_FALSE(err.has_value()) << err->what();

  for (int t = 0; t < 4; ++t) {
    EXPECT_EQ(runs[t], 1) << t;
    EXPECT_EQ(sizes[t], 4) << t;
  }
  EXPECT_EQ(pids[0], forkmp::os::current_pid());
  std::vector<std::int32_t> distinct(pids.begin(), pids.end());
  std::sort(distinct.begin(), distinct.end());
  EXPECT_EQ(std::unique(distinct.begin(), distinct.end()), distinct.end());
}

TEST(Region, Region_SingleThreadRunsInline) {
  const auto cfg = make_config();
  const auto self = forkmp::os::current_pid();
  int local = 0;  // ordinary memory: only visible because nothing forked

  auto err = run_region(cfg, 1, [&](Parallel& p) {
    local = (p.num_threads() == 1 && p.thread_num() == 0 && forkmp::os::current_pid() == self) ? 1 : -1;
  });
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(local, 1);
}

/**
 * @test Region_ManualEnterExit
 * @brief enter()/exit() used directly; current() tracks the active region.
 */
TEST(Region, Region_ManualEnterExit) {
  const auto cfg = make_config();
  auto hits = forkmp::shared::array<std::int32_t>({30});
  auto seen_current = forkmp::shared::array<std::int32_t>({3});

  EXPECT_EQ(Parallel::current(), nullptr);
  Parallel p(cfg, 3);
  p.enter();
  seen_current[p.thread_num()] = (Parallel::current() == &p) ? 1 : 0;
  for (auto i : p.range(30)) hits[i] += 1;
  if (p.thread_num() == 0) {
    EXPECT_EQ(forkmp::region::active_processes(), 3u);
  }
  p.exit();

  EXPECT_FALSE(p.is_worker());
  EXPECT_EQ(Parallel::current(), nullptr);
  EXPECT_EQ(forkmp::region::active_processes(), 1u);
  for (int t = 0; t < 3; ++t) EXPECT_EQ(seen_current[t], 1);
  for (int i = 0; i < 30; ++i) EXPECT_EQ(hits[i], 1) << i;
}

// ------------------------------- Scheduling --------------------------------

/**
 * @test Region_StaticRangeMatchesPartition
 * @brief Each index is written once, by the worker static_partition assigns.
 */
TEST(Region, Region_StaticRangeMatchesPartition) {
  constexpr std::int64_t kN = 103;
  const auto cfg = make_config();
  auto hits = forkmp::shared::array<std::int32_t>({kN});
  auto owner = forkmp::shared::array<std::int32_t>({kN});

  auto err = run_region(cfg, 4, [&](Parallel& p) {
    for (auto i : p.range(kN)) {
      hits[i] += 1;
      owner[i] = static_cast<std::int32_t>(p.thread_num());
    }
  });
  ASSERT_FALSE(err.has_value());

  const auto blocks = forkmp::sched::static_partition(4, 0, kN);
  for (std::int32_t t = 0; t < 4; ++t) {
    for (auto i : blocks[t]) {
      EXPECT_EQ(hits[i], 1) << i;
      EXPECT_EQ(owner[i], t) << i;
    }
  }
}

TEST(Region, Region_SteppedStaticRange) {
  const auto cfg = make_config();
  auto hits = forkmp::shared::array<std::int32_t>({50});

  auto err = run_region(cfg, 3, [&](Parallel& p) {
    for (auto i : p.range(49, -1, -3)) hits[i] += 1;
  });
  ASSERT_FALSE(err.has_value());
  for (std::int64_t i = 0; i < 50; ++i) EXPECT_EQ(hits[i], (i % 3 == 1) ? 1 : 0) << i;
}

/**
 * @test Region_DynamicLoopsCoverOnce
 * @brief Two consecutive dynamic loops of uneven work, each index exactly once.
 */
TEST(Region, Region_DynamicLoopsCoverOnce) {
  constexpr std::int64_t kN = 60;
  const auto cfg = make_config();
  auto first = forkmp::shared::array<std::int32_t>({kN});
  auto second = forkmp::shared::array<std::int32_t>({kN});

  auto err = run_region(cfg, 4, [&](Parallel& p) {
    for (auto i : p.dynamic_range(kN)) {
      if (i % 7 == 0) std::this_thread::sleep_for(1ms);
      first[i] += 1;
    }
    for (auto i : p.dynamic_range(0, kN, 1, 4)) second[i] += 1;
  });
  ASSERT_FALSE(err.has_value());
  for (std::int64_t i = 0; i < kN; ++i) {
    EXPECT_EQ(first[i], 1) << i;
    EXPECT_EQ(second[i], 1) << i;
  }
}

// -------------------------------- Failures ---------------------------------

/**
 * @test Region_WorkerFailuresAggregated
 * @brief 2 of 5 workers throw: one RegionError after every worker finished.
 */
TEST(Region, Region_WorkerFailuresAggregated) {
  const auto cfg = make_config();
  auto finished = forkmp::shared::array<std::int32_t>({5});

  auto err = run_region(cfg, 5, [&](Parallel& p) {
    if (p.thread_num() == 1 || p.thread_num() == 3) {
      throw std::runtime_error("worker " + std::to_string(p.thread_num()) + " failed");
    }
    std::this_thread::sleep_for(20ms);
    finished[p.thread_num()] = 1;
  });
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->failed(), 2u);
  EXPECT_EQ(err->total(), 5u);
  EXPECT_STREQ(err->what(), "2 of 5 workers failed in parallel region");

  EXPECT_EQ(finished[0], 1);
  EXPECT_EQ(finished[2], 1);
  EXPECT_EQ(finished[4], 1);
  EXPECT_EQ(Parallel::current(), nullptr);
  EXPECT_EQ(forkmp::region::active_processes(), 1u);
}

TEST(Region, Region_CoordinatorFailureCounted) {
  const auto cfg = make_config();
  auto err = run_region(cfg, 3, [&](Parallel& p) {
    if (p.thread_num() == 0) throw std::logic_error("coordinator failed");
  });
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->failed(), 1u);
  EXPECT_EQ(err->total(), 3u);
}

TEST(Region, Region_SingleThreadFailure) {
  const auto cfg = make_config();
  auto err = run_region(cfg, 1, [](Parallel&) { throw std::runtime_error("alone"); });
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->failed(), 1u);
  EXPECT_EQ(err->total(), 1u);
}

/**
 * @test Region_AbnormalWorkerExitCounted
 * @brief A worker killed by a signal, or leaving with a bad status, is a failure.
 */
TEST(Region, Region_AbnormalWorkerExitCounted) {
  const auto cfg = make_config();
  auto err = run_region(cfg, 4, [&](Parallel& p) {
    if (p.thread_num() == 2) {
      forkmp::os::kill_process(forkmp::os::current_pid());
      ::pause();
    }
    if (p.thread_num() == 3) forkmp::os::terminate_process(7);
  });
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->failed(), 2u);
  EXPECT_EQ(err->total(), 4u);
}

/**
 * @test Region_FailureRecordsAfterExit
 * @brief The joined region keeps one record per failed worker, in thread order.
 */
TEST(Region, Region_FailureRecordsAfterExit) {
  const auto cfg = make_config();
  Parallel p(cfg, 3);
  p.enter();
  std::exception_ptr failure;
  if (p.thread_num() == 1) {
    forkmp::os::kill_process(forkmp::os::current_pid());
    ::pause();
  }
  if (p.thread_num() == 2) failure = std::make_exception_ptr(std::runtime_error("bad input"));
  EXPECT_THROW(p.exit(failure), forkmp::RegionError);

  const auto recs = p.failures();
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[0].thread_num, 1u);
  EXPECT_EQ(recs[0].message, "worker terminated by signal 9");
  EXPECT_EQ(recs[1].thread_num, 2u);
  EXPECT_EQ(recs[1].message, "bad input");
}

TEST(Region, Region_NoFailureNoThrow) {
  const auto cfg = make_config();
  EXPECT_NO_THROW(forkmp::parallel(cfg, 4, [](Parallel&) {}));
}

/**
 * @test Region_DrivenByProcessEnvironment
 * @brief Regions built without a Configuration take their counts from the
 *        environment, read on first use. Runs in a child so the variables are
 *        seen before this process loads its global configuration.
 */
TEST(Region, Region_DrivenByProcessEnvironment) {
  auto sizes = forkmp::shared::array<std::int32_t>({2});
  const int rc = run_in_child([&] {
    for (const char* name : {"PYMP_NESTED", "OMP_NESTED", "PYMP_THREAD_LIMIT", "OMP_THREAD_LIMIT"}) {
      ::unsetenv(name);
    }
    ::setenv("PYMP_NUM_THREADS", "3", 1);
    ::setenv("OMP_NUM_THREADS", "7", 1);

    forkmp::parallel(std::nullopt, [&](Parallel& p) {
      if (p.thread_num() == 0) sizes[0] = static_cast<std::int32_t>(p.num_threads());
    });
    forkmp::parallel(2, [&](Parallel& p) {
      if (p.thread_num() == 0) sizes[1] = static_cast<std::int32_t>(p.num_threads());
    });
    return 0;
  });
  EXPECT_EQ(rc, 0);
  EXPECT_EQ(sizes[0], 3);
  EXPECT_EQ(sizes[1], 2);
}

// --------------------------------- Nesting ---------------------------------

/**
 * @test Nested_DisabledRunsInnerSequentially
 * @brief With nesting off the inner region has one thread and forks nothing.
 */
TEST(Nested, Nested_DisabledRunsInnerSequentially) {
  const auto cfg = make_config(false);
  auto inner_threads = forkmp::shared::array<std::int32_t>({2});
  auto inner_level = forkmp::shared::array<std::int32_t>({2});
  auto same_pid = forkmp::shared::array<std::int32_t>({2});

  auto err = run_region(cfg, 2, [&](Parallel& outer) {
    const auto pid = forkmp::os::current_pid();
    forkmp::parallel(cfg, 3, [&](Parallel& inner) {
      inner_threads[outer.thread_num()] = static_cast<std::int32_t>(inner.num_threads());
      inner_level[outer.thread_num()] = static_cast<std::int32_t>(inner.level());
      same_pid[outer.thread_num()] = (forkmp::os::current_pid() == pid) ? 1 : 0;
    });
  });
  ASSERT_FALSE(err.has_value());
  for (int t = 0; t < 2; ++t) {
    EXPECT_EQ(inner_threads[t], 1);
    EXPECT_EQ(inner_level[t], 1);
    EXPECT_EQ(same_pid[t], 1);
  }
}

/**
 * @test Nested_EnabledForksPerLevel
 * @brief num_threads = [2, 3]: six (outer, inner) pairs, each exactly once.
 */
TEST(Nested, Nested_EnabledForksPerLevel) {
  const auto cfg = make_config(true, std::nullopt, {2, 3});
  auto pairs = forkmp::shared::array<std::int32_t>({2, 3});

  auto err = run_region(cfg, std::nullopt, [&](Parallel& outer) {
    forkmp::parallel(cfg, std::nullopt, [&](Parallel& inner) {
      if (inner.parent() == &outer && inner.level() == 1) {
        pairs.at(outer.thread_num(), inner.thread_num()) += 1;
      }
    });
  });
  ASSERT_FALSE(err.has_value());
  for (std::size_t o = 0; o < 2; ++o) {
    for (std::size_t i = 0; i < 3; ++i) EXPECT_EQ(pairs.at(o, i), 1) << o << "," << i;
  }
}

TEST(Nested, Nested_InnerFailurePropagatesToOuter) {
  const auto cfg = make_config(true, std::nullopt, {2, 2});
  auto err = run_region(cfg, std::nullopt, [&](Parallel& outer) {
    forkmp::parallel(cfg, std::nullopt, [&](Parallel& inner) {
      if (outer.thread_num() == 1 && inner.thread_num() == 1) throw std::runtime_error("deep");
    });
  });
  // Inner coordinator of outer worker 1 raises RegionError, failing that outer worker.
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->failed(), 1u);
  EXPECT_EQ(err->total(), 2u);
}

// ------------------------------ Thread limit -------------------------------

TEST(ThreadLimit, ThreadLimit_CapsTopLevel) {
  const auto cfg = make_config(false, 3u);
  auto sizes = forkmp::shared::array<std::int32_t>({1});

  auto err = run_region(cfg, 4, [&](Parallel& p) {
    if (p.thread_num() == 0) sizes[0] = static_cast<std::int32_t>(p.num_threads());
  });
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(sizes[0], 3);
}

/**
 * @test ThreadLimit_SharedByConcurrentInnerRegions
 * @brief Limit 3, outer 2, both inner regions ask for 2: whichever enters
 *        first gets 2, the other gets what is left (1).
 */
TEST(ThreadLimit, ThreadLimit_SharedByConcurrentInnerRegions) {
  const auto cfg = make_config(true, 3u);
  auto counts = forkmp::shared::array<std::int32_t>({2});
  auto entered = forkmp::shared::array<std::int32_t>({1});
  auto mu = forkmp::shared::lock();

  auto err = run_region(cfg, 2, [&](Parallel& outer) {
    forkmp::parallel(cfg, 2, [&](Parallel& inner) {
      if (inner.thread_num() != 0) return;
      {
        std::lock_guard<forkmp::mem::Mutex> g(mu);
        counts[outer.thread_num()] = static_cast<std::int32_t>(inner.num_threads());
        entered[0] += 1;
      }
      // Keep this inner region alive until the sibling has entered its own.
      const auto deadline = std::chrono::steady_clock::now() + 10s;
      while (std::chrono::steady_clock::now() < deadline) {
        {
          std::lock_guard<forkmp::mem::Mutex> g(mu);
          if (entered[0] == 2) break;
        }
        std::this_thread::sleep_for(1ms);
      }
    });
  });
  ASSERT_FALSE(err.has_value());
  std::vector<std::int32_t> got{counts[0], counts[1]};
  std::sort(got.begin(), got.end());
  EXPECT_EQ(got, (std::vector<std::int32_t>{1, 2}));
  EXPECT_EQ(forkmp::region::active_processes(), 1u);
}

/**
 * @test ThreadLimit_ReleasedWhenInnerCoordinatorDies
 * @brief Limit 4, outer 2, inner 2. The inner coordinator on outer thread 1 is
 *        killed while its region is open; the processes it accounted for are
 *        returned, so the next top-level region gets the full limit again.
 */
TEST(ThreadLimit, ThreadLimit_ReleasedWhenInnerCoordinatorDies) {
  const auto cfg = make_config(true, 4u);
  auto sizes = forkmp::shared::array<std::int32_t>({1});

  auto err = run_region(cfg, 2, [&](Parallel& outer) {
    forkmp::parallel(cfg, 2, [&](Parallel& inner) {
      if (outer.thread_num() == 1 && inner.thread_num() == 0) {
        forkmp::os::kill_process(forkmp::os::current_pid());
        ::pause();
      }
    });
  });
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->failed(), 1u);
  EXPECT_EQ(forkmp::region::active_processes(), 1u);

  auto err2 = run_region(cfg, 4, [&](Parallel& p) {
    if (p.thread_num() == 0) sizes[0] = static_cast<std::int32_t>(p.num_threads());
  });
  ASSERT_FALSE(err2.has_value());
  EXPECT_EQ(sizes[0], 4);
  EXPECT_EQ(forkmp::region::active_processes(), 1u);
}

// ------------------------------ Lock / print -------------------------------

/**
 * @test Region_LockSerializesIncrements
 * @brief 4 workers x 250 increments under the region lock: exactly 1000.
 */
TEST(Region, Region_LockSerializesIncrements) {
  const auto cfg = make_config();
  auto total = forkmp::shared::array<std::int64_t>({1});

  auto err = run_region(cfg, 4, [&](Parallel& p) {
    for (int k = 0; k < 250; ++k) {
      std::lock_guard<forkmp::mem::Mutex> g(p.lock());
      const auto v = total[0];
      total[0] = v + 1;
    }
  });
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(total[0], 1000);
}

TEST(Region, Region_PrintWholeLines) {
  const auto cfg = make_config();
  testing::internal::CaptureStdout();
  auto err = run_region(cfg, 3, [](Parallel& p) {
    for (int k = 0; k < 5; ++k) Parallel::print("thread {} line {}", p.thread_num(), k);
  });
  const std::string out = testing::internal::GetCapturedStdout();
  ASSERT_FALSE(err.has_value());

  std::istringstream lines(out);
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    EXPECT_EQ(line.rfind("thread ", 0), 0u) << line;
    EXPECT_NE(line.find(" line "), std::string::npos) << line;
    ++count;
  }
  EXPECT_EQ(count, 15);
}

// ----------------------------- Lifecycle misuse ----------------------------

TEST(Lifecycle, EnterTwiceRejected) {
  const auto cfg = make_config();
  Parallel p(cfg, 1);
  p.enter();
  EXPECT_THROW(p.enter(), forkmp::UsageError);
  p.exit();
  EXPECT_THROW(p.enter(), forkmp::UsageError);
  EXPECT_THROW(p.exit(), forkmp::UsageError);
}

TEST(Lifecycle, NonPositiveRequestRejectedBeforeFork) {
  const auto cfg = make_config();
  Parallel zero(cfg, 0);
  EXPECT_THROW(zero.enter(), forkmp::ConfigError);
  Parallel negative(cfg, -1);
  EXPECT_THROW(negative.enter(), forkmp::ConfigError);
  EXPECT_EQ(Parallel::current(), nullptr);
  EXPECT_EQ(forkmp::region::active_processes(), 1u);
}

TEST(Lifecycle, ExitOutOfOrderRejected) {
  const auto cfg = make_config();
  Parallel outer(cfg, 1);
  outer.enter();
  Parallel inner(cfg, 1);
  inner.enter();
  EXPECT_EQ(inner.level(), 1u);
  EXPECT_EQ(inner.parent(), &outer);

  EXPECT_THROW(outer.exit(), forkmp::UsageError);
  inner.exit();
  outer.exit();
  EXPECT_EQ(Parallel::current(), nullptr);
}

TEST(Lifecycle, OperationsRequireActiveRegion) {
  const auto cfg = make_config();
  Parallel p(cfg, 2);
  EXPECT_THROW(p.range(10), forkmp::UsageError);
  EXPECT_THROW(p.dynamic_range(10), forkmp::UsageError);
  EXPECT_THROW(p.lock(), forkmp::UsageError);
}
