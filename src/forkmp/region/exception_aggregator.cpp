/**
 * @file exception_aggregator.cpp
 * @brief Slot layout and at-most-once publication of worker failures.
 */
#include "forkmp/region/exception_aggregator.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <new>

#include "forkmp/config/constants.hpp"
#include "forkmp/error.hpp"

namespace forkmp::region {

using forkmp::config::constants::FAILURE_MESSAGE_CAPACITY;

namespace {
// Slot::state values.
constexpr std::uint32_t kEmpty   = 0;
constexpr std::uint32_t kWriting = 1;
constexpr std::uint32_t kWritten = 2;
} // namespace

struct ExceptionAggregator::Header {
  std::atomic<std::uint32_t> failures;
};

struct ExceptionAggregator::Slot {
  std::atomic<std::uint32_t> state;
  std::int32_t               pid;
  char                       message[FAILURE_MESSAGE_CAPACITY];
};

forkmp_detail::expected<ExceptionAggregator, mem::ShmErr>
ExceptionAggregator::create(unsigned slots) noexcept {
  const unsigned n = std::max(slots, 1u);
  auto seg = mem::ShmSegment::create(sizeof(Header) + n * sizeof(Slot));
  if (!seg) {
    return forkmp_detail::unexpected(seg.error());
  }
  ExceptionAggregator agg;
  agg.segment_ = std::move(*seg);
  agg.slots_   = n;
  new (agg.segment_.data()) Header{};
  agg.header()->failures.store(0, std::memory_order_relaxed);
  for (unsigned i = 0; i < n; ++i) {
    Slot* s = new (agg.slot(i)) Slot{};
    s->state.store(kEmpty, std::memory_order_relaxed);
  }
  return agg;
}

ExceptionAggregator::Header* ExceptionAggregator::header() const noexcept {
  return static_cast<Header*>(const_cast<void*>(segment_.data()));
}

ExceptionAggregator::Slot* ExceptionAggregator::slot(unsigned i) const noexcept {
  auto* base = reinterpret_cast<Slot*>(header() + 1);
  return base + i;
}

bool ExceptionAggregator::record_failure(unsigned thread_num, std::string_view message) noexcept {
  if (!segment_ || thread_num >= slots_) return false;
  Slot* s = slot(thread_num);

  std::uint32_t expected = kEmpty;
  if (!s->state.compare_exchange_strong(expected, kWriting, std::memory_order_acq_rel)) {
    return false;  // already recorded
  }
  // Counted as soon as the slot is claimed: a writer killed mid-copy still fails the region.
  header()->failures.fetch_add(1, std::memory_order_acq_rel);
  const std::size_t n = std::min(message.size(), FAILURE_MESSAGE_CAPACITY - 1);
  std::memcpy(s->message, message.data(), n);
  s->message[n] = '\0';
  s->pid = static_cast<std::int32_t>(::getpid());
  s->state.store(kWritten, std::memory_order_release);
  return true;
}

bool ExceptionAggregator::has_record(unsigned thread_num) const noexcept {
  if (!segment_ || thread_num >= slots_) return false;
  return slot(thread_num)->state.load(std::memory_order_acquire) != kEmpty;
}

std::uint32_t ExceptionAggregator::failure_count() const noexcept {
  if (!segment_) return 0;
  return header()->failures.load(std::memory_order_acquire);
}

std::vector<FailureRecord> ExceptionAggregator::failures() const {
  std::vector<FailureRecord> out;
  for (unsigned i = 0; i < slots_; ++i) {
    const Slot* s = slot(i);
    const std::uint32_t state = s->state.load(std::memory_order_acquire);
    if (state == kWritten) {
      out.push_back(FailureRecord{i, s->pid, std::string(s->message)});
    } else if (state == kWriting) {
      out.push_back(FailureRecord{i, 0, "worker died while recording its failure"});
    }
  }
  return out;
}

void ExceptionAggregator::raise_if_any(std::uint32_t total) const {
  const std::uint32_t failed = failure_count();
  if (failed != 0) {
    throw forkmp::RegionError(failed, total);
  }
}

} // namespace forkmp::region
