/**
 * @file shm_segment.hpp
 * @brief Anonymous shared mapping that survives fork() as one instance.
 *
 * Design goals:
 *  - One mmap(MAP_SHARED | MAP_ANONYMOUS) per segment, zero-filled by the kernel.
 *  - Factory returns expected<>; no exceptions on the setup path.
 *  - Move-only RAII: the mapping is released by whichever process image
 *    destroys the owning object. Children that leave through _exit() never do.
 *
 * A segment must be created before the fork that should share it.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "forkmp/compat/expected.hpp"  // forkmp_detail::expected / unexpected
#include "forkmp/error.hpp"

namespace forkmp::mem {

/**
 * @brief Error codes reported by shared-memory factories (setup time only).
 */
enum class ShmErr : std::uint8_t {
  SizeZero = 1,      ///< Requested zero bytes
  SizeOverflow,      ///< Shape/element size product overflows size_t
  MapFailed,         ///< mmap() refused the mapping
  MutexInitFailed    ///< pthread mutex attribute/init call failed
};

/// Short description of an error code.
const char* to_string(ShmErr err) noexcept;

/// Thrown by the forkmp::shared helpers when a factory fails.
class ShmError : public forkmp::Error {
public:
  explicit ShmError(ShmErr code);
  ShmErr code() const noexcept { return code_; }

private:
  ShmErr code_;
};

/**
 * @brief Owning handle to an anonymous shared mapping.
 */
class ShmSegment final {
public:
  /// @brief Empty handle (use with factory).
  ShmSegment() noexcept = default;

  /**
   * @brief Factory: map @p bytes of zero-filled shared memory.
   * @return expected<ShmSegment, ShmErr> mapped segment or error.
   */
  static forkmp_detail::expected<ShmSegment, ShmErr> create(std::size_t bytes) noexcept;

  ~ShmSegment();

  ShmSegment(const ShmSegment&)            = delete; ///< Non-copyable
  ShmSegment& operator=(const ShmSegment&) = delete; ///< Non-assignable

  ShmSegment(ShmSegment&& other) noexcept;
  ShmSegment& operator=(ShmSegment&& other) noexcept;

  void*       data() noexcept       { return base_; }
  const void* data() const noexcept { return base_; }
  std::size_t size() const noexcept { return size_; }
  explicit operator bool() const noexcept { return base_ != nullptr; }

  /// @brief View the start of the segment as a @p T (caller constructs it).
  template <class T> T*       as() noexcept       { return static_cast<T*>(base_); }
  template <class T> const T* as() const noexcept { return static_cast<const T*>(base_); }

private:
  void release() noexcept;

  void*       base_ = nullptr;
  std::size_t size_ = 0;
};

} // namespace forkmp::mem
