/**
 * @file parallel.hpp
 * @brief Fork-based parallel region: resolve, fork, run, join, aggregate.
 *
 * Lifecycle:
 *  - enter(): resolve the thread count, allocate the region's shared state,
 *    fork num_threads()-1 workers. Every process returns from enter() and
 *    runs the body; the originating process has thread_num() == 0.
 *  - exit(failure): a worker records its failure (if any) and terminates;
 *    the coordinator joins every worker and raises forkmp::RegionError when
 *    one or more of them failed.
 *
 * Only state allocated through forkmp::mem / forkmp::shared before enter()
 * is shared. Everything else the body sees is a private copy-on-write
 * snapshot taken at fork time.
 *
 * @code
 *   auto out = forkmp::shared::array<double>({n});
 *   forkmp::parallel(4, [&](forkmp::Parallel& p) {
 *     for (auto i : p.range(n)) out[i] = f(i);
 *   });
 * @endcode
 */
#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "forkmp/config/config_loader.hpp"
#include "forkmp/config/constants.hpp"
#include "forkmp/mem/mutex.hpp"
#include "forkmp/mem/shm_segment.hpp"
#include "forkmp/os/process.hpp"
#include "forkmp/region/exception_aggregator.hpp"
#include "forkmp/sched/index_range.hpp"
#include "forkmp/sched/work_scheduler.hpp"

namespace forkmp::region {

/**
 * @brief Effective thread count of a region.
 *
 * @param cfg       Configuration snapshot.
 * @param level     Nesting depth of the region being entered (0 = top level).
 * @param requested Caller's request, if any.
 * @param active    Processes currently alive in the process tree (>= 1).
 * @throws forkmp::ConfigError if requested <= 0 or cfg violates its invariants.
 */
unsigned resolve_thread_count(const config::Configuration& cfg, unsigned level,
                std::optional<int> requested, unsigned active = 1);

/// @brief Processes currently alive across all regions of this process tree.
unsigned active_processes();

class Parallel {
public:
  /// Region driven by the process-wide configuration (config::global()).
  explicit Parallel(std::optional<int> num_threads = std::nullopt);

  /// Region driven by @p cfg, which must outlive enter().
  explicit Parallel(const config::Configuration& cfg, std::optional<int> num_threads = std::nullopt);

  ~Parallel();

  Parallel(const Parallel&)            = delete;
  Parallel& operator=(const Parallel&) = delete;
  Parallel(Parallel&&)                 = delete;
  Parallel& operator=(Parallel&&)      = delete;

  /**
   * @brief Fork the region. Returns in every participating process.
   * @throws ConfigError, UsageError, mem::ShmError, ProcessError.
   */
  Parallel& enter();

  /**
   * @brief Leave the region.
   * Worker: never returns. Coordinator: joins all workers, then throws
   * RegionError if any participant (itself included) failed.
   * @param failure The body's exception, if it threw.
   */
  void exit(std::exception_ptr failure = nullptr);

  unsigned num_threads() const noexcept { return num_threads_; }
  unsigned thread_num() const noexcept  { return thread_num_; }
  unsigned level() const noexcept       { return level_; }
  const Parallel* parent() const noexcept { return parent_; }
  bool is_worker() const noexcept       { return is_worker_; }

  /// @brief This worker's static share of [0, stop).
  sched::IndexRange range(std::int64_t stop) const;
  /// @brief This worker's static share of [start, stop) by @p step.
  sched::IndexRange range(std::int64_t start, std::int64_t stop, std::int64_t step = 1) const;

  /// @brief Open a dynamic loop over [0, stop).
  sched::DynamicRange dynamic_range(std::int64_t stop);
  /// @brief Open a dynamic loop over [start, stop) by @p step, claiming @p chunk indices at a time.
  sched::DynamicRange dynamic_range(std::int64_t start, std::int64_t stop, std::int64_t step = 1,
                    std::size_t chunk = config::constants::DYNAMIC_CHUNK_DEFAULT);

  /// @brief Failure records of a joined region (coordinator, after exit()).
  std::vector<FailureRecord> failures() const;

  /// @brief Lock shared by the processes of this region.
  mem::Mutex& lock();

  /// @brief Print one line to stdout, serialized across every process.
  template <class... Args>
  static void print(fmt::format_string<Args...> msg, Args&&... args) {
    print_line(fmt::format(msg, std::forward<Args>(args)...));
  }
  static void print_line(std::string_view line);

  /// @brief Innermost region entered by this process, or nullptr.
  static Parallel* current() noexcept;

  /// @brief Nesting depth a region entered now would get.
  static unsigned current_level() noexcept;

private:
  enum class State : std::uint8_t { Idle, Entered, Exited };

  void require_entered(const char* op) const;
  void fork_workers();
  void run_worker_gate(os::StartGate& gate);
  void join_workers(std::exception_ptr own_failure);
  void release_accounting() noexcept;
  void reclaim_leftover(unsigned thread) noexcept;
  std::uint32_t* held_slot() noexcept;
  [[noreturn]] void leave_worker(std::exception_ptr failure) noexcept;

  const config::Configuration* source_;
  config::Configuration        config_{};      ///< Snapshot taken by enter()
  std::optional<int>           requested_;

  State     state_ = State::Idle;
  bool      is_worker_ = false;
  unsigned  level_ = 0;
  unsigned  num_threads_ = 1;
  unsigned  thread_num_ = 0;
  Parallel* parent_ = nullptr;

  std::vector<os::Pid>                 pids_;
  std::optional<mem::Mutex>            lock_;
  std::optional<sched::DynamicSchedule> dynamic_;
  std::optional<ExceptionAggregator>   failures_;
  mem::ShmSegment                      held_{};  ///< Per worker: processes its own nested regions account for
};

/**
 * @brief Enter @p region, run body(region) in every process, exit.
 * Exceptions from the body are handed to exit() and surface, aggregated, as
 * RegionError in the coordinator.
 */
template <class Body>
void run(Parallel& region, Body&& body) {
  region.enter();
  std::exception_ptr failure;
  try {
    body(region);
  } catch (...) {
    failure = std::current_exception();
  }
  region.exit(failure);
}

} // namespace forkmp::region
