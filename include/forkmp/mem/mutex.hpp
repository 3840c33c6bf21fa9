/**
 * @file mutex.hpp
 * @brief Locks that work across the processes of a parallel region.
 *
 * Each lock is a robust, process-shared pthread mutex placed in its own
 * anonymous shared mapping. Like SharedBuffer it must be created before the
 * fork that should share it.
 *
 * Both classes meet the standard Lockable requirements, so std::lock_guard,
 * std::unique_lock and std::scoped_lock give scoped acquisition that is
 * released on every exit path, exceptions included.
 *
 * If a holder dies while owning the lock, the next lock() recovers it and
 * logs a warning. The data it protected may be half-written.
 */
#pragma once

#include <pthread.h>
#include <sys/types.h>

#include <cstdint>
#include <utility>

#include "forkmp/compat/expected.hpp"
#include "forkmp/mem/shm_segment.hpp"

namespace forkmp::mem {

namespace detail {

/// @brief Shared implementation of Mutex / ReentrantMutex.
class ProcessMutex {
public:
  ProcessMutex() noexcept = default;
  ~ProcessMutex();

  ProcessMutex(ProcessMutex&&) noexcept;
  ProcessMutex& operator=(ProcessMutex&&) noexcept;
  ProcessMutex(const ProcessMutex&)            = delete;
  ProcessMutex& operator=(const ProcessMutex&) = delete;

  /// @brief Block until acquired.
  /// @throws std::system_error if pthread reports anything but success/owner-death,
  ///         including a relock of the non-reentrant kind by its holder.
  void lock();

  /// @brief Acquire without blocking.
  /// @return false if another process (or, for the non-reentrant kind, this one) holds it.
  bool try_lock();

  /// @brief Release. Must be called by the holder.
  void unlock();

  pthread_mutex_t* native_handle() noexcept { return segment_.as<pthread_mutex_t>(); }
  explicit operator bool() const noexcept { return static_cast<bool>(segment_); }

protected:
  enum class Kind : std::uint8_t { Normal, Recursive };

  static forkmp_detail::expected<ProcessMutex, ShmErr> make(Kind kind) noexcept;

private:
  /// @return true if the lock was acquired (possibly after recovery).
  bool acquired(int rc, const char* op);
  void destroy() noexcept;

  ShmSegment segment_{};
  pid_t      creator_ = 0;  ///< Only the creating process destroys the pthread object
};

} // namespace detail

/**
 * @brief Non-reentrant process-shared lock.
 * Relocking from the holding process is an error (pthread returns EDEADLK).
 */
class Mutex final : public detail::ProcessMutex {
public:
  Mutex() noexcept = default;

  /// @brief Factory (setup time only).
  static forkmp_detail::expected<Mutex, ShmErr> create() noexcept;

private:
  explicit Mutex(detail::ProcessMutex&& base) noexcept : detail::ProcessMutex(std::move(base)) {}
};

/**
 * @brief Process-shared lock that its holder may acquire repeatedly.
 * Each lock() must be balanced by an unlock().
 */
class ReentrantMutex final : public detail::ProcessMutex {
public:
  ReentrantMutex() noexcept = default;

  /// @brief Factory (setup time only).
  static forkmp_detail::expected<ReentrantMutex, ShmErr> create() noexcept;

private:
  explicit ReentrantMutex(detail::ProcessMutex&& base) noexcept : detail::ProcessMutex(std::move(base)) {}
};

} // namespace forkmp::mem
