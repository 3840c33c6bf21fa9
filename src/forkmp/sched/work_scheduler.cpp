/**
 * @file work_scheduler.cpp
 * @brief Static block partitioning and the shared dynamic cursor.
 */
#include "forkmp/sched/work_scheduler.hpp"

#include <algorithm>
#include <limits>
#include <mutex>
#include <new>
#include <utility>

#include "forkmp/error.hpp"

namespace forkmp::sched {

namespace {

void require_step(const IndexRange& domain) {
  if (domain.step() == 0) {
    throw forkmp::ConfigError("iteration step must not be zero");
  }
  if (domain.step() == std::numeric_limits<std::int64_t>::min()) {
    throw forkmp::ConfigError("iteration step must be greater than INT64_MIN");
  }
}

} // namespace

// ---------------- static ----------------

std::vector<IndexRange> static_partition(unsigned thread_count, const IndexRange& domain) {
  if (thread_count == 0) {
    throw forkmp::ConfigError("static_partition: thread count must be positive");
  }
  require_step(domain);

  const std::size_t n   = domain.size();
  const std::size_t per = n / thread_count;
  const std::size_t rem = n % thread_count;

  std::vector<IndexRange> out;
  out.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    const std::size_t first = i * per + std::min(i, rem);
    const std::size_t count = per + (i < rem ? 1 : 0);
    out.push_back(domain.slice(first, count));
  }
  return out;
}

std::vector<IndexRange> static_partition(unsigned thread_count,
                                         std::int64_t start, std::int64_t stop,
                                         std::int64_t step) {
  return static_partition(thread_count, IndexRange(start, stop, step));
}

// ---------------- DynamicSchedule ----------------

// Segment layout: State, then one loop counter per worker.
struct DynamicSchedule::State {
  std::int64_t cursor;  ///< Positions handed out in the newest loop
};

forkmp_detail::expected<DynamicSchedule, mem::ShmErr>
DynamicSchedule::create(unsigned thread_count) noexcept {
  auto mutex = mem::Mutex::create();
  if (!mutex) {
    return forkmp_detail::unexpected(mutex.error());
  }
  const std::size_t slots = std::max(thread_count, 1u);
  auto seg = mem::ShmSegment::create(sizeof(State) + slots * sizeof(std::int64_t));
  if (!seg) {
    return forkmp_detail::unexpected(seg.error());
  }

  DynamicSchedule s;
  s.mutex_        = std::move(*mutex);
  s.segment_      = std::move(*seg);
  s.thread_count_ = static_cast<unsigned>(slots);
  new (s.segment_.data()) State{0};
  std::fill_n(s.loop_ids(), slots, std::int64_t{-1});
  return s;
}

DynamicSchedule::State* DynamicSchedule::state() noexcept {
  return segment_.as<State>();
}

std::int64_t* DynamicSchedule::loop_ids() noexcept {
  return reinterpret_cast<std::int64_t*>(segment_.as<State>() + 1);
}

std::int64_t DynamicSchedule::newest_loop() noexcept {
  const std::int64_t* ids = loop_ids();
  return *std::max_element(ids, ids + thread_count_);
}

std::int64_t DynamicSchedule::open_loop(unsigned thread_num) {
  std::lock_guard<mem::Mutex> guard(mutex_);
  const std::int64_t reached = newest_loop();
  const std::int64_t id = ++loop_ids()[thread_num];
  if (reached < id) {
    // First worker to get here: the previous loop is fully claimed.
    state()->cursor = 0;
  }
  return id;
}

std::optional<Claim> DynamicSchedule::claim(std::int64_t loop_id, std::size_t total, std::size_t chunk) {
  std::lock_guard<mem::Mutex> guard(mutex_);
  if (newest_loop() > loop_id) return std::nullopt;

  State* st = state();
  const auto cursor = static_cast<std::size_t>(st->cursor);
  if (cursor >= total) return std::nullopt;

  Claim c;
  c.first = cursor;
  c.last  = cursor + std::min(chunk, total - cursor);  // chunk may be SIZE_MAX
  st->cursor = static_cast<std::int64_t>(c.last);
  return c;
}

// ---------------- DynamicRange ----------------

DynamicRange::DynamicRange(DynamicSchedule& schedule, unsigned thread_num, IndexRange domain,
                           std::size_t chunk)
  : schedule_(&schedule), domain_(domain), chunk_(chunk) {
  require_step(domain_);
  if (chunk_ == 0) {
    throw forkmp::ConfigError("dynamic schedule chunk size must be positive");
  }
  if (thread_num >= schedule.thread_count()) {
    throw forkmp::UsageError("dynamic schedule: thread number out of range");
  }
  loop_id_ = schedule_->open_loop(thread_num);
}

DynamicRange::iterator DynamicRange::begin() {
  if (!started_) {
    started_ = true;
    refill();
  }
  return iterator(this);
}

void DynamicRange::advance() {
  ++pos_;
  if (pos_ >= last_) refill();
}

void DynamicRange::refill() {
  auto c = schedule_->claim(loop_id_, domain_.size(), chunk_);
  if (!c) {
    exhausted_ = true;
    return;
  }
  pos_  = c->first;
  last_ = c->last;
}

} // namespace forkmp::sched
