/**
 * @file mutex.cpp
 * @brief Robust process-shared pthread mutexes in anonymous shared mappings.
 */
#include "forkmp/mem/mutex.hpp"

#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

#include "forkmp/obs/log.hpp"

namespace forkmp::mem {
namespace detail {

forkmp_detail::expected<ProcessMutex, ShmErr> ProcessMutex::make(Kind kind) noexcept {
  auto seg = ShmSegment::create(sizeof(pthread_mutex_t));
  if (!seg) {
    return forkmp_detail::unexpected(seg.error());
  }

  pthread_mutexattr_t attr;
  if (pthread_mutexattr_init(&attr) != 0) {
    return forkmp_detail::unexpected(ShmErr::MutexInitFailed);
  }
  const int type = (kind == Kind::Recursive) ? PTHREAD_MUTEX_RECURSIVE : PTHREAD_MUTEX_ERRORCHECK;
  bool ok = pthread_mutexattr_setpshared(&attr, PTHREAD_PROCESS_SHARED) == 0 &&
            pthread_mutexattr_setrobust(&attr, PTHREAD_MUTEX_ROBUST) == 0 &&
            pthread_mutexattr_settype(&attr, type) == 0;
  ok = ok && pthread_mutex_init(seg->as<pthread_mutex_t>(), &attr) == 0;
  pthread_mutexattr_destroy(&attr);
  if (!ok) {
    return forkmp_detail::unexpected(ShmErr::MutexInitFailed);
  }

  ProcessMutex m;
  m.segment_ = std::move(*seg);
  m.creator_ = ::getpid();
  return m;
}

ProcessMutex::~ProcessMutex() { destroy(); }

ProcessMutex::ProcessMutex(ProcessMutex&& other) noexcept
  : segment_(std::move(other.segment_)),
    creator_(std::exchange(other.creator_, 0)) {}

ProcessMutex& ProcessMutex::operator=(ProcessMutex&& other) noexcept {
  if (this != &other) {
    destroy();
    segment_ = std::move(other.segment_);
    creator_ = std::exchange(other.creator_, 0);
  }
  return *this;
}

void ProcessMutex::destroy() noexcept {
  // A forked copy only drops its mapping; the pthread object belongs to the creator.
  if (segment_ && creator_ == ::getpid()) {
    pthread_mutex_destroy(native_handle());
  }
  segment_ = ShmSegment{};
  creator_ = 0;
}

bool ProcessMutex::acquired(int rc, const char* op) {
  if (rc == 0) return true;
  if (rc == EBUSY) return false;
  if (rc == EOWNERDEAD) {
    obs::warn("{}: previous holder died while owning the lock; recovering", op);
    const int crc = pthread_mutex_consistent(native_handle());
    if (crc != 0) {
      throw std::system_error(crc, std::generic_category(), "pthread_mutex_consistent");
    }
    return true;
  }
  throw std::system_error(rc, std::generic_category(), op);
}

void ProcessMutex::lock() {
  (void)acquired(pthread_mutex_lock(native_handle()), "pthread_mutex_lock");
}

bool ProcessMutex::try_lock() {
  const int rc = pthread_mutex_trylock(native_handle());
  // Error-checking kind: this process already holds it.
  if (rc == EDEADLK) return false;
  return acquired(rc, "pthread_mutex_trylock");
}

void ProcessMutex::unlock() {
  const int rc = pthread_mutex_unlock(native_handle());
  if (rc != 0) {
    throw std::system_error(rc, std::generic_category(), "pthread_mutex_unlock");
  }
}

} // namespace detail

forkmp_detail::expected<Mutex, ShmErr> Mutex::create() noexcept {
  auto base = ProcessMutex::make(Kind::Normal);
  if (!base) {
    return forkmp_detail::unexpected(base.error());
  }
  return Mutex(std::move(*base));
}

forkmp_detail::expected<ReentrantMutex, ShmErr> ReentrantMutex::create() noexcept {
  auto base = ProcessMutex::make(Kind::Recursive);
  if (!base) {
    return forkmp_detail::unexpected(base.error());
  }
  return ReentrantMutex(std::move(*base));
}

} // namespace forkmp::mem
