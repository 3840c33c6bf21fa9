/**
 * @file error.cpp
 * @brief Out-of-line constructors for the exception hierarchy.
 */
#include "forkmp/error.hpp"

#include <fmt/format.h>

namespace forkmp {

RegionError::RegionError(std::uint32_t failed, std::uint32_t total)
    : Error(fmt::format("{} of {} workers failed in parallel region", failed, total)),
      failed_(failed),
      total_(total) {}

} // namespace forkmp
