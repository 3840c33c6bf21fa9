/**
 * @file parallel.cpp
 * @brief Region lifecycle: thread-count resolution, fork, join, aggregation.
 *
 * Process-tree accounting (the number of live processes used by the thread
 * limit) and the print lock live in one shared segment created by the root
 * process before its first fork, so every descendant sees the same instance.
 */
#include "forkmp/region/parallel.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <new>
#include <string>

#include <fmt/ranges.h>

#include "forkmp/error.hpp"
#include "forkmp/mem/shm_segment.hpp"
#include "forkmp/obs/log.hpp"

namespace forkmp::region {

using namespace forkmp::config::constants;

namespace {

Parallel* g_current = nullptr;  // innermost region of this process image

struct Accounting {
  std::uint32_t active;  ///< Live processes in the tree, guarded by ProcessState::lock
};

struct ProcessState {
  mem::Mutex      lock;
  mem::Mutex      print_lock;
  mem::ShmSegment segment;

  Accounting* accounting() noexcept { return segment.as<Accounting>(); }
};

ProcessState& process_state() {
  static ProcessState st = [] {
    auto lock = mem::Mutex::create();
    if (!lock) throw mem::ShmError(lock.error());
    auto print_lock = mem::Mutex::create();
    if (!print_lock) throw mem::ShmError(print_lock.error());
    auto seg = mem::ShmSegment::create(sizeof(Accounting));
    if (!seg) throw mem::ShmError(seg.error());
    new (seg->data()) Accounting{1};
    return ProcessState{std::move(*lock), std::move(*print_lock), std::move(*seg)};
  }();
  return st;
}

std::string describe(const std::exception_ptr& failure) {
  try {
    std::rethrow_exception(failure);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "exception of unknown type";
  }
}

} // namespace

// ---------------- thread-count resolution ----------------

unsigned resolve_thread_count(const config::Configuration& cfg, unsigned level,
                std::optional<int> requested, unsigned active) {
  if (requested && *requested <= 0) {
    throw forkmp::ConfigError(
      fmt::format("requested thread count must be positive, got {}", *requested));
  }
  if (auto ok = cfg.validate(); !ok) {
    throw forkmp::ConfigError(ok.error().describe());
  }
  if (level > 0 && !cfg.nested) {
    return 1;
  }

  const std::optional<unsigned> configured = cfg.threads_for_level(level);
  unsigned n;
  if (requested && configured) {
    n = std::min(static_cast<unsigned>(*requested), *configured);
  } else if (requested) {
    n = static_cast<unsigned>(*requested);
  } else if (configured) {
    n = *configured;
  } else {
    n = os::hardware_threads();
  }

  if (cfg.thread_limit) {
    // The limit counts every live process of the tree, the caller included.
    const unsigned limit = *cfg.thread_limit;
    const unsigned cap = (limit >= active) ? limit - active + 1 : 1;
    n = std::min(n, cap);
  }
  return std::max(n, 1u);
}

unsigned active_processes() {
  auto& ps = process_state();
  std::lock_guard<mem::Mutex> guard(ps.lock);
  return ps.accounting()->active;
}

// ---------------- Parallel ----------------

Parallel::Parallel(std::optional<int> num_threads)
  : Parallel(config::global(), num_threads) {}

Parallel::Parallel(const config::Configuration& cfg, std::optional<int> num_threads)
  : source_(&cfg), requested_(num_threads) {}

Parallel::~Parallel() {
  if (state_ != State::Entered) return;
  if (is_worker_) {
    leave_worker(std::make_exception_ptr(
      forkmp::UsageError("parallel region left without exit()")));
  }
  obs::error("parallel region (level {}) destroyed without exit(); joining workers", level_);
  try {
    join_workers(nullptr);
  } catch (const std::exception& e) {
    obs::error("{}", e.what());
  }
}

Parallel& Parallel::enter() {
  if (state_ != State::Idle) {
    throw forkmp::UsageError("a Parallel region may only be entered once");
  }
  config_ = *source_;
  parent_ = g_current;
  level_  = current_level();

  auto& ps = process_state();
  {
    std::lock_guard<mem::Mutex> guard(ps.lock);
    Accounting* acc = ps.accounting();
    num_threads_ = resolve_thread_count(config_, level_, requested_, acc->active);
    acc->active += num_threads_ - 1;
    if (std::uint32_t* held = held_slot()) *held += num_threads_ - 1;
  }

  auto lock = mem::Mutex::create();
  auto dyn  = sched::DynamicSchedule::create(num_threads_);
  forkmp_detail::expected<ExceptionAggregator, mem::ShmErr> agg{};
  forkmp_detail::expected<mem::ShmSegment, mem::ShmErr> held{};
  if (num_threads_ > 1) {
    agg  = ExceptionAggregator::create(num_threads_);
    held = mem::ShmSegment::create(num_threads_ * sizeof(std::uint32_t));
  }
  if (!lock || !dyn || !agg || !held) {
    release_accounting();
    state_ = State::Exited;
    throw mem::ShmError(!lock ? lock.error() : !dyn ? dyn.error() : !agg ? agg.error() : held.error());
  }
  lock_.emplace(std::move(*lock));
  dynamic_.emplace(std::move(*dyn));
  if (num_threads_ > 1) {
    failures_.emplace(std::move(*agg));
    held_ = std::move(*held);
  }

  g_current = this;
  state_ = State::Entered;
  obs::debug("entering parallel region (level {}, {} threads)", level_, num_threads_);

  if (num_threads_ > 1) {
    fork_workers();
  }
  return *this;
}

void Parallel::fork_workers() {
  auto gate = os::StartGate::create();
  if (!gate) {
    g_current = parent_;
    release_accounting();
    state_ = State::Exited;
    throw forkmp::ProcessError(os::to_string(gate.error()));
  }

  // Anything still buffered would otherwise be written once per process.
  obs::flush();
  std::fflush(nullptr);

  for (unsigned t = 1; t < num_threads_; ++t) {
    auto pid = os::fork_process();
    if (!pid) {
      gate->abort();
      for (os::Pid p : pids_) (void)os::wait_process(p);
      pids_.clear();
      g_current = parent_;
      release_accounting();
      state_ = State::Exited;
      throw forkmp::ProcessError(fmt::format("{} after {} of {} workers",
                           os::to_string(pid.error()), t - 1, num_threads_ - 1));
    }
    if (*pid == 0) {
      is_worker_  = true;
      thread_num_ = t;
      pids_.clear();
      run_worker_gate(*gate);
      return;
    }
    pids_.push_back(*pid);
  }
  gate->release(num_threads_ - 1);
  obs::debug("forked to processes: {}", fmt::join(pids_, ", "));
}

void Parallel::run_worker_gate(os::StartGate& gate) {
  if (!gate.wait()) {
    // The coordinator gave up forking; this worker never ran the body.
    os::terminate_process(WORKER_SUCCESS_STATUS);
  }
}

void Parallel::exit(std::exception_ptr failure) {
  if (state_ != State::Entered) {
    throw forkmp::UsageError("exit() called on a parallel region that is not active");
  }
  if (g_current != this) {
    throw forkmp::UsageError("nested parallel regions must be exited innermost first");
  }
  if (is_worker_) {
    leave_worker(failure);
  }
  join_workers(failure);
}

void Parallel::leave_worker(std::exception_ptr failure) noexcept {
  int status = WORKER_SUCCESS_STATUS;
  if (failure) {
    const std::string what = describe(failure);
    if (failures_) failures_->record_failure(thread_num_, what);
    obs::critical("thread {} of parallel region (level {}) failed: {}", thread_num_, level_, what);
    status = WORKER_FAILURE_STATUS;
  }
  obs::debug("process {} done, shutting down", os::current_pid());
  obs::flush();
  std::fflush(nullptr);
  os::terminate_process(status);
}

void Parallel::join_workers(std::exception_ptr own_failure) {
  bool own_failed = false;
  if (own_failure) {
    const std::string what = describe(own_failure);
    if (failures_) {
      failures_->record_failure(0, what);
    } else {
      obs::critical("an exception occurred in thread 0: {}", what);
    }
    own_failed = true;
  }

  // Every worker is waited for, whatever happened to the others.
  for (std::size_t i = 0; i < pids_.size(); ++i) {
    const os::Pid pid = pids_[i];
    const auto thread = static_cast<unsigned>(i + 1);
    obs::debug("waiting for process {}...", pid);
    auto info = os::wait_process(pid);
    if (!info) {
      failures_->record_failure(thread, fmt::format("worker {} could not be joined: {}",
                              pid, os::to_string(info.error())));
      continue;
    }
    if (info->ok()) continue;
    if (!failures_->has_record(thread)) {
      // Died without reporting (signal, std::terminate, foreign _exit).
      failures_->record_failure(thread, info->exited
        ? fmt::format("worker exited with status {}", info->status)
        : fmt::format("worker terminated by signal {}", info->signal));
    }
    reclaim_leftover(thread);
  }

  release_accounting();
  pids_.clear();
  g_current = parent_;
  state_ = State::Exited;

  if (failures_) {
    for (const auto& rec : failures_->failures()) {
      obs::critical("an exception occurred in thread {} (pid {}): {}",
                    rec.thread_num, rec.pid, rec.message);
    }
  }
  obs::debug("parallel region left (level {})", level_);

  if (failures_) {
    failures_->raise_if_any(num_threads_);
  } else if (own_failed) {
    throw forkmp::RegionError(1, num_threads_);
  }
}

std::vector<FailureRecord> Parallel::failures() const {
  if (!failures_ || state_ != State::Exited) return {};
  return failures_->failures();
}

void Parallel::release_accounting() noexcept {
  if (num_threads_ <= 1) return;
  try {
    auto& ps = process_state();
    std::lock_guard<mem::Mutex> guard(ps.lock);
    ps.accounting()->active -= num_threads_ - 1;
    if (std::uint32_t* held = held_slot()) *held -= num_threads_ - 1;
  } catch (const std::exception& e) {
    obs::error("could not update process accounting: {}", e.what());
  }
}

void Parallel::reclaim_leftover(unsigned thread) noexcept {
  try {
    auto& ps = process_state();
    std::lock_guard<mem::Mutex> guard(ps.lock);
    std::uint32_t& held = held_.as<std::uint32_t>()[thread];
    if (held == 0) return;
    obs::warn("worker {} died inside nested regions; releasing {} accounted processes",
              thread, held);
    ps.accounting()->active -= held;
    held = 0;
  } catch (const std::exception& e) {
    obs::error("could not update process accounting: {}", e.what());
  }
}

// Slot of the innermost region this process was forked into. Its coordinator
// reaps this process and returns whatever is still charged here.
std::uint32_t* Parallel::held_slot() noexcept {
  for (Parallel* r = parent_; r != nullptr; r = r->parent_) {
    if (r->is_worker_) return r->held_.as<std::uint32_t>() + r->thread_num_;
  }
  return nullptr;
}

void Parallel::require_entered(const char* op) const {
  if (state_ != State::Entered) {
    throw forkmp::UsageError(fmt::format("{} requires an active parallel region", op));
  }
}

sched::IndexRange Parallel::range(std::int64_t stop) const {
  return range(0, stop, 1);
}

sched::IndexRange Parallel::range(std::int64_t start, std::int64_t stop, std::int64_t step) const {
  require_entered("range()");
  return sched::static_partition(num_threads_, start, stop, step)[thread_num_];
}

sched::DynamicRange Parallel::dynamic_range(std::int64_t stop) {
  return dynamic_range(0, stop, 1, DYNAMIC_CHUNK_DEFAULT);
}

sched::DynamicRange Parallel::dynamic_range(std::int64_t start, std::int64_t stop,
                      std::int64_t step, std::size_t chunk) {
  require_entered("dynamic_range()");
  return sched::DynamicRange(*dynamic_, thread_num_, sched::IndexRange(start, stop, step), chunk);
}

mem::Mutex& Parallel::lock() {
  require_entered("lock()");
  return *lock_;
}

void Parallel::print_line(std::string_view line) {
  auto& ps = process_state();
  std::lock_guard<mem::Mutex> guard(ps.print_lock);
  fmt::print(stdout, "{}\n", line);
  std::fflush(stdout);
}

Parallel* Parallel::current() noexcept {
  return g_current;
}

unsigned Parallel::current_level() noexcept {
  return g_current ? g_current->level_ + 1 : 0;
}

} // namespace forkmp::region
