/**
 * @file index_range.hpp
 * @brief Arithmetic iteration domain [start, stop) with a non-zero step.
 *
 * The only domain the schedulers accept: it is fully described by three
 * integers, so it crosses fork() for free and every worker can compute its
 * share without materializing the indices.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>

namespace forkmp::sched {

class IndexRange {
public:
  using value_type = std::int64_t;

  /// @brief Forward iterator over the progression, positioned by index count.
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = std::int64_t;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const std::int64_t*;
    using reference         = std::int64_t;

    iterator() noexcept = default;
    iterator(const IndexRange* range, std::size_t pos) noexcept : range_(range), pos_(pos) {}

    std::int64_t operator*() const noexcept { return (*range_)[pos_]; }
    iterator& operator++() noexcept { ++pos_; return *this; }
    iterator operator++(int) noexcept { iterator t = *this; ++pos_; return t; }
    bool operator==(const iterator& o) const noexcept { return pos_ == o.pos_; }
    bool operator!=(const iterator& o) const noexcept { return pos_ != o.pos_; }

  private:
    const IndexRange* range_ = nullptr;
    std::size_t       pos_   = 0;
  };

  IndexRange() noexcept = default;

  /// @pre step != 0 (checked by the schedulers, which raise ConfigError).
  IndexRange(std::int64_t start, std::int64_t stop, std::int64_t step = 1) noexcept
    : start_(start), stop_(stop), step_(step) {}

  std::int64_t start() const noexcept { return start_; }
  std::int64_t stop() const noexcept  { return stop_; }
  std::int64_t step() const noexcept  { return step_; }

  /**
   * @brief Number of indices (0 for an empty or backwards range).
   * @details Computed on the unsigned span so the full int64 domain is valid.
   * @pre step != INT64_MIN (rejected by the schedulers).
   */
  std::size_t size() const noexcept {
    if (step_ > 0 && stop_ > start_) {
      const std::uint64_t span = to_u(stop_) - to_u(start_);
      return static_cast<std::size_t>((span - 1) / to_u(step_) + 1);
    }
    if (step_ < 0 && start_ > stop_) {
      const std::uint64_t span = to_u(start_) - to_u(stop_);
      return static_cast<std::size_t>((span - 1) / (0 - to_u(step_)) + 1);
    }
    return 0;
  }

  bool empty() const noexcept { return size() == 0; }

  /// @brief i-th index (no bounds checks).
  std::int64_t operator[](std::size_t i) const noexcept {
    return static_cast<std::int64_t>(to_u(start_) + static_cast<std::uint64_t>(i) * to_u(step_));
  }

  /**
   * @brief Sub-progression of @p count indices beginning at position @p first.
   * @pre first + count <= size()
   */
  IndexRange slice(std::size_t first, std::size_t count) const noexcept {
    if (count == 0) {
      return IndexRange((*this)[first], (*this)[first], step_);
    }
    // Stop just past the last index; the far end of the parent may not be representable.
    const std::int64_t lo   = (*this)[first];
    const std::int64_t last = (*this)[first + count - 1];
    return IndexRange(lo, step_ > 0 ? last + 1 : last - 1, step_);
  }

  iterator begin() const noexcept { return iterator(this, 0); }
  iterator end() const noexcept   { return iterator(this, size()); }

  bool operator==(const IndexRange& o) const noexcept {
    return start_ == o.start_ && stop_ == o.stop_ && step_ == o.step_;
  }

private:
  static constexpr std::uint64_t to_u(std::int64_t v) noexcept { return static_cast<std::uint64_t>(v); }

  std::int64_t start_ = 0;
  std::int64_t stop_  = 0;
  std::int64_t step_  = 1;
};

} // namespace forkmp::sched
