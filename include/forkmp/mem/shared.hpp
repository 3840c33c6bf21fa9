/**
 * @file shared.hpp
 * @brief Throwing allocation helpers for shared state used inside regions.
 *
 * Thin wrappers over the expected<> factories for call sites that treat an
 * allocation failure as fatal:
 *
 * @code
 *   auto hits = forkmp::shared::array<double>({n});
 *   auto mu   = forkmp::shared::lock();
 *   forkmp::parallel(4, [&](forkmp::Parallel& p) {
 *     for (auto i : p.range(n)) {
 *       std::lock_guard<forkmp::mem::Mutex> g(mu);
 *       hits[0] += 1.0;
 *     }
 *   });
 * @endcode
 */
#pragma once

#include <cstddef>
#include <initializer_list>

#include "forkmp/mem/mutex.hpp"
#include "forkmp/mem/shared_buffer.hpp"
#include "forkmp/mem/shm_segment.hpp"

namespace forkmp::shared {

/// @throws forkmp::mem::ShmError if the mapping cannot be created.
template <class T>
mem::SharedBuffer<T> array(typename mem::SharedBuffer<T>::Shape shape) {
  auto buf = mem::SharedBuffer<T>::create(std::move(shape));
  if (!buf) throw mem::ShmError(buf.error());
  return std::move(*buf);
}

template <class T>
mem::SharedBuffer<T> array(std::initializer_list<std::size_t> shape) {
  return array<T>(typename mem::SharedBuffer<T>::Shape(shape));
}

/// @throws forkmp::mem::ShmError if the lock cannot be created.
inline mem::Mutex lock() {
  auto m = mem::Mutex::create();
  if (!m) throw mem::ShmError(m.error());
  return std::move(*m);
}

/// @throws forkmp::mem::ShmError if the lock cannot be created.
inline mem::ReentrantMutex rlock() {
  auto m = mem::ReentrantMutex::create();
  if (!m) throw mem::ShmError(m.error());
  return std::move(*m);
}

} // namespace forkmp::shared
