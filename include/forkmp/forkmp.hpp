/**
 * @file forkmp.hpp
 * @brief Umbrella header: everything a program needs to run parallel regions.
 */
#pragma once

#include <optional>
#include <utility>

#include "forkmp/config/config_loader.hpp"
#include "forkmp/error.hpp"
#include "forkmp/mem/mutex.hpp"
#include "forkmp/mem/shared.hpp"
#include "forkmp/mem/shared_buffer.hpp"
#include "forkmp/obs/log.hpp"
#include "forkmp/region/parallel.hpp"
#include "forkmp/sched/index_range.hpp"
#include "forkmp/sched/work_scheduler.hpp"
#include "forkmp/version.hpp"

namespace forkmp {

using region::Parallel;

/**
 * @brief Run @p body in a region of (up to) @p num_threads processes.
 * @throws RegionError in the coordinator if any participant failed.
 */
template <class Body>
void parallel(std::optional<int> num_threads, Body&& body) {
  Parallel region(num_threads);
  region::run(region, std::forward<Body>(body));
}

/// @overload Region driven by an explicit configuration.
template <class Body>
void parallel(const config::Configuration& cfg, std::optional<int> num_threads, Body&& body) {
  Parallel region(cfg, num_threads);
  region::run(region, std::forward<Body>(body));
}

} // namespace forkmp
