/**
 * @file work_scheduler.hpp
 * @brief Static and dynamic distribution of an IndexRange over region workers.
 *
 * Static: a pure function of (thread_count, domain). Worker i gets one
 * contiguous block; the first n % T workers get one extra index.
 *
 * Dynamic: workers pull chunks from a cursor that lives in shared memory and
 * is advanced under a process-shared mutex. Claim order is unspecified, claim
 * sets are disjoint and together cover the domain.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <vector>

#include "forkmp/compat/expected.hpp"
#include "forkmp/config/constants.hpp"
#include "forkmp/mem/mutex.hpp"
#include "forkmp/mem/shm_segment.hpp"
#include "forkmp/sched/index_range.hpp"

namespace forkmp::sched {

/**
 * @brief Partition @p domain into @p thread_count contiguous blocks.
 * @return One IndexRange per worker, in worker order (some may be empty).
 * @throws forkmp::ConfigError if thread_count == 0 or the step is zero.
 */
std::vector<IndexRange> static_partition(unsigned thread_count, const IndexRange& domain);

/// @overload
std::vector<IndexRange> static_partition(unsigned thread_count,
                                         std::int64_t start, std::int64_t stop,
                                         std::int64_t step = 1);

/// @brief Block of positions [first, last) into a domain, claimed by one worker.
struct Claim {
  std::size_t first = 0;
  std::size_t last  = 0;
};

/**
 * @class DynamicSchedule
 * @brief Shared cursor state of one region (one instance for all its workers).
 *
 * A region may run several dynamic loops one after another. Every worker keeps
 * a loop counter in the shared segment: the first worker to open loop k resets
 * the cursor, and claims for an older loop stop as soon as any worker has
 * opened a newer one. A worker only opens loop k after its claims for loop k-1
 * came back empty, so the older loop is fully claimed by then.
 */
class DynamicSchedule final {
public:
  DynamicSchedule() noexcept = default;

  /// @brief Factory: shared state for @p thread_count workers (setup time only).
  static forkmp_detail::expected<DynamicSchedule, mem::ShmErr> create(unsigned thread_count) noexcept;

  DynamicSchedule(DynamicSchedule&&) noexcept            = default;
  DynamicSchedule& operator=(DynamicSchedule&&) noexcept = default;
  DynamicSchedule(const DynamicSchedule&)                = delete;
  DynamicSchedule& operator=(const DynamicSchedule&)     = delete;

  unsigned thread_count() const noexcept { return thread_count_; }

  /// @brief Open the next dynamic loop for @p thread_num. Returns its loop id.
  std::int64_t open_loop(unsigned thread_num);

  /**
   * @brief Claim up to @p chunk positions of a domain of @p total indices.
   * @return nullopt once the loop is exhausted or superseded.
   */
  std::optional<Claim> claim(std::int64_t loop_id, std::size_t total, std::size_t chunk);

private:
  struct State;  // lives in segment_

  State*        state() noexcept;
  std::int64_t* loop_ids() noexcept;
  std::int64_t  newest_loop() noexcept;

  mem::Mutex       mutex_{};
  mem::ShmSegment  segment_{};
  unsigned         thread_count_ = 0;
};

/**
 * @class DynamicRange
 * @brief Lazy, finite, single-pass sequence of the indices this worker claims.
 *
 * Iterating it pulls chunks from the shared cursor. It cannot be restarted:
 * calling begin() again resumes where the previous iteration stopped.
 */
class DynamicRange {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = std::int64_t;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const std::int64_t*;
    using reference         = std::int64_t;

    iterator() noexcept = default;
    explicit iterator(DynamicRange* owner) noexcept : owner_(owner) {}

    std::int64_t operator*() const noexcept { return owner_->current(); }
    iterator& operator++() { owner_->advance(); return *this; }
    void operator++(int) { owner_->advance(); }

    bool operator==(std::default_sentinel_t) const noexcept { return !owner_ || owner_->done(); }

  private:
    DynamicRange* owner_ = nullptr;
  };

  /// @pre @p schedule outlives the range; domain.step() != 0; chunk > 0.
  DynamicRange(DynamicSchedule& schedule, unsigned thread_num, IndexRange domain,
               std::size_t chunk = config::constants::DYNAMIC_CHUNK_DEFAULT);

  DynamicRange(const DynamicRange&)            = delete;
  DynamicRange& operator=(const DynamicRange&) = delete;
  DynamicRange(DynamicRange&&) noexcept            = default;
  DynamicRange& operator=(DynamicRange&&) noexcept = default;

  iterator begin();
  std::default_sentinel_t end() const noexcept { return {}; }

  const IndexRange& domain() const noexcept { return domain_; }
  std::size_t chunk() const noexcept { return chunk_; }

private:
  std::int64_t current() const noexcept { return domain_[pos_]; }
  bool done() const noexcept { return exhausted_; }
  void advance();
  void refill();

  DynamicSchedule* schedule_ = nullptr;
  IndexRange       domain_{};
  std::size_t      chunk_ = 1;
  std::int64_t     loop_id_ = 0;
  std::size_t      pos_  = 0;   ///< Next position to yield
  std::size_t      last_ = 0;   ///< End of the current claim
  bool             started_ = false;
  bool             exhausted_ = false;
};

} // namespace forkmp::sched
