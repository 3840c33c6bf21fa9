/**
 * @file shared_buffer.hpp
 * @brief Typed N-dimensional array living in an anonymous shared mapping.
 *
 * Allocate before entering the region that uses it: only memory resident in
 * the parent at fork time is shared with the workers. Everything else a body
 * captures is copied on write and stays private to each process.
 *
 * No locking is attached to element access. Concurrent read-modify-write
 * sequences must be serialized with a forkmp::mem::Mutex.
 *
 * @tparam T Element type. Must be trivially copyable (it is never constructed
 *           or destroyed, the kernel zero-fills the pages).
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "forkmp/compat/expected.hpp"
#include "forkmp/mem/shm_segment.hpp"

namespace forkmp::mem {

template <class T>
class SharedBuffer final {
  static_assert(std::is_trivially_copyable_v<T>,
                "SharedBuffer<T> requires a trivially copyable element type");

public:
  using value_type = T;
  using Shape      = std::vector<std::size_t>;

  /// @brief Empty buffer (use with factory).
  SharedBuffer() noexcept = default;

  /**
   * @brief Factory: map a zero-filled buffer of the given row-major shape.
   * @param shape Extent per dimension. An empty shape is a scalar (one element).
   * @return expected<SharedBuffer, ShmErr> mapped buffer or error.
   */
  static forkmp_detail::expected<SharedBuffer, ShmErr> create(Shape shape) {
    std::size_t count = 1;
    for (std::size_t extent : shape) {
      if (extent != 0 && count > std::numeric_limits<std::size_t>::max() / extent) {
        return forkmp_detail::unexpected(ShmErr::SizeOverflow);
      }
      count *= extent;
    }
    if (count > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
      return forkmp_detail::unexpected(ShmErr::SizeOverflow);
    }
    // A zero-extent buffer still gets one element worth of mapping.
    auto seg = ShmSegment::create(std::max<std::size_t>(count, 1) * sizeof(T));
    if (!seg) {
      return forkmp_detail::unexpected(seg.error());
    }
    SharedBuffer buf;
    buf.segment_ = std::move(*seg);
    buf.shape_   = std::move(shape);
    buf.size_    = count;
    return buf;
  }

  static forkmp_detail::expected<SharedBuffer, ShmErr> create(std::initializer_list<std::size_t> shape) {
    return create(Shape(shape));
  }

  SharedBuffer(const SharedBuffer&)            = delete;
  SharedBuffer& operator=(const SharedBuffer&) = delete;
  SharedBuffer(SharedBuffer&&) noexcept            = default;
  SharedBuffer& operator=(SharedBuffer&&) noexcept = default;

  const Shape& shape() const noexcept { return shape_; }
  std::size_t  size() const noexcept  { return size_; }
  bool         empty() const noexcept { return size_ == 0; }

  T*       data() noexcept       { return segment_.template as<T>(); }
  const T* data() const noexcept { return segment_.template as<T>(); }

  T*       begin() noexcept       { return data(); }
  T*       end() noexcept         { return data() + size_; }
  const T* begin() const noexcept { return data(); }
  const T* end() const noexcept   { return data() + size_; }

  std::span<T>       span() noexcept       { return {data(), size_}; }
  std::span<const T> span() const noexcept { return {data(), size_}; }

  /// @brief Flat element access (no bounds checks).
  T&       operator[](std::size_t i) noexcept       { return data()[i]; }
  const T& operator[](std::size_t i) const noexcept { return data()[i]; }

  /**
   * @brief Row-major multi-index access with bounds checks.
   * @throws std::out_of_range on a rank mismatch or an index past its extent.
   */
  template <class... Idx>
  T& at(Idx... idx) { return data()[offset({static_cast<std::size_t>(idx)...})]; }

  template <class... Idx>
  const T& at(Idx... idx) const { return data()[offset({static_cast<std::size_t>(idx)...})]; }

  /// @brief Assign @p v to every element (not atomic as a whole).
  void fill(const T& v) noexcept {
    for (std::size_t i = 0; i < size_; ++i) data()[i] = v;
  }

private:
  std::size_t offset(std::initializer_list<std::size_t> idx) const {
    const std::size_t rank = shape_.empty() ? 1 : shape_.size();
    if (idx.size() != rank) {
      throw std::out_of_range("SharedBuffer::at: rank mismatch");
    }
    if (shape_.empty()) {
      if (*idx.begin() != 0) throw std::out_of_range("SharedBuffer::at: index out of range");
      return 0;
    }
    std::size_t off = 0;
    std::size_t dim = 0;
    for (std::size_t i : idx) {
      if (i >= shape_[dim]) throw std::out_of_range("SharedBuffer::at: index out of range");
      off = off * shape_[dim] + i;
      ++dim;
    }
    return off;
  }

  ShmSegment  segment_{};
  Shape       shape_{};
  std::size_t size_ = 0;
};

} // namespace forkmp::mem
