#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the region engine.
 * @details These values eliminate magic numbers from the codebase. Runtime
 *          tunables are overridden through the environment (see Loader).
 */

#include <cstddef>
#include <cstdint>

namespace forkmp::config::constants {

// =====================
// Environment variables (PYMP_* wins over OMP_* when both are set)
// =====================
inline constexpr const char* ENV_NESTED_PRIMARY        = "PYMP_NESTED";
inline constexpr const char* ENV_NESTED_FALLBACK       = "OMP_NESTED";
inline constexpr const char* ENV_THREAD_LIMIT_PRIMARY  = "PYMP_THREAD_LIMIT";
inline constexpr const char* ENV_THREAD_LIMIT_FALLBACK = "OMP_THREAD_LIMIT";
inline constexpr const char* ENV_NUM_THREADS_PRIMARY   = "PYMP_NUM_THREADS";
inline constexpr const char* ENV_NUM_THREADS_FALLBACK  = "OMP_NUM_THREADS";

/// Logger tuning (read once by forkmp::obs).
inline constexpr const char* ENV_LOG_LEVEL = "FORKMP_LOGLEVEL";
inline constexpr const char* ENV_LOG_FILE  = "FORKMP_LOGFILE";

// =====================
// Region defaults
// =====================
inline constexpr bool     NESTED_DEFAULT         = false; ///< Nested regions run sequentially
inline constexpr unsigned FALLBACK_THREAD_COUNT  = 1;     ///< Used if the hardware count is unknown
inline constexpr std::size_t DYNAMIC_CHUNK_DEFAULT  = 1;     ///< Fine-grained dynamic schedule

// =====================
// Failure channel
// =====================
/// Bytes reserved per worker for its failure message (including the terminator).
inline constexpr std::size_t FAILURE_MESSAGE_CAPACITY = 1024;

/// Exit status of a worker whose body failed.
inline constexpr int WORKER_FAILURE_STATUS = 1;
/// Exit status of a worker released normally.
inline constexpr int WORKER_SUCCESS_STATUS = 0;

} // namespace forkmp::config::constants
