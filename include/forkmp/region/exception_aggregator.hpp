/**
 * @file exception_aggregator.hpp
 * @brief Shared failure channel of one parallel region.
 *
 * One slot per worker, written at most once by the worker that owns it, plus
 * a shared failure counter. The coordinator reads it after every worker has
 * been joined; reading earlier races with the writers.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "forkmp/compat/expected.hpp"
#include "forkmp/mem/shm_segment.hpp"

namespace forkmp::region {

/// @brief What a failed worker left behind.
struct FailureRecord {
  unsigned     thread_num = 0;
  int          pid = 0;
  std::string  message;
};

class ExceptionAggregator final {
  static_assert(std::atomic<std::uint32_t>::is_always_lock_free,
                "std::atomic<uint32_t> must be lock-free to live in shared memory");

public:
  ExceptionAggregator() noexcept = default;

  /// @brief Factory: one slot per worker (setup time only).
  static forkmp_detail::expected<ExceptionAggregator, mem::ShmErr> create(unsigned slots) noexcept;

  ExceptionAggregator(ExceptionAggregator&&) noexcept            = default;
  ExceptionAggregator& operator=(ExceptionAggregator&&) noexcept = default;
  ExceptionAggregator(const ExceptionAggregator&)                = delete;
  ExceptionAggregator& operator=(const ExceptionAggregator&)     = delete;

  /**
   * @brief Record a failure for @p thread_num. Safe from distinct processes.
   * @return false if the slot was already written or does not exist.
   *         Messages longer than the slot are truncated.
   */
  bool record_failure(unsigned thread_num, std::string_view message) noexcept;

  /// @brief True once @p thread_num has a record.
  bool has_record(unsigned thread_num) const noexcept;

  /// @brief Number of claimed slots, counted before the message is copied.
  std::uint32_t failure_count() const noexcept;

  /// @brief Copies of every claimed slot, in thread order. A slot whose writer
  ///        died before finishing is reported with pid 0 and a fixed message.
  std::vector<FailureRecord> failures() const;

  unsigned slots() const noexcept { return slots_; }

  /// @brief Throw forkmp::RegionError("N of total ...") if anything was recorded.
  void raise_if_any(std::uint32_t total) const;

private:
  struct Header;
  struct Slot;

  Header*       header() const noexcept;
  Slot*         slot(unsigned i) const noexcept;

  mem::ShmSegment segment_{};
  unsigned        slots_ = 0;
};

} // namespace forkmp::region
