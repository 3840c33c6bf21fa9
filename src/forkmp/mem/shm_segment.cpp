/**
 * @file shm_segment.cpp
 * @brief mmap/munmap plumbing for ShmSegment.
 */
#include "forkmp/mem/shm_segment.hpp"

#include <sys/mman.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "forkmp/obs/log.hpp"

namespace forkmp::mem {

const char* to_string(ShmErr err) noexcept {
  switch (err) {
    case ShmErr::SizeZero:        return "shared segment of zero bytes requested";
    case ShmErr::SizeOverflow:    return "shared segment size overflows";
    case ShmErr::MapFailed:       return "mmap of shared segment failed";
    case ShmErr::MutexInitFailed: return "process-shared mutex initialization failed";
  }
  return "unknown shared memory error";
}

ShmError::ShmError(ShmErr code) : forkmp::Error(to_string(code)), code_(code) {}

forkmp_detail::expected<ShmSegment, ShmErr> ShmSegment::create(std::size_t bytes) noexcept {
  if (bytes == 0) {
    return forkmp_detail::unexpected(ShmErr::SizeZero);
  }
  void* p = ::mmap(nullptr, bytes, PROT_READ | PROT_WRITE,
                   MAP_SHARED | MAP_ANONYMOUS, -1, 0);
  if (p == MAP_FAILED) {
    const int err = errno;
    obs::error("mmap({} bytes) failed: {}", bytes, std::strerror(err));
    return forkmp_detail::unexpected(ShmErr::MapFailed);
  }
  ShmSegment seg;
  seg.base_ = p;
  seg.size_ = bytes;
  return seg;
}

ShmSegment::~ShmSegment() { release(); }

ShmSegment::ShmSegment(ShmSegment&& other) noexcept
  : base_(std::exchange(other.base_, nullptr)),
    size_(std::exchange(other.size_, 0)) {}

ShmSegment& ShmSegment::operator=(ShmSegment&& other) noexcept {
  if (this != &other) {
    release();
    base_ = std::exchange(other.base_, nullptr);
    size_ = std::exchange(other.size_, 0);
  }
  return *this;
}

void ShmSegment::release() noexcept {
  if (base_ != nullptr) {
    ::munmap(base_, size_);
    base_ = nullptr;
    size_ = 0;
  }
}

} // namespace forkmp::mem
