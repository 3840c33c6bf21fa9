#pragma once
/**
 * @file error.hpp
 * @brief Exception hierarchy raised at the public API boundary.
 * @details Setup-time factories report failures as expected<T, E> error codes;
 *          the throwing layer (regions, forkmp::shared helpers, config::global)
 *          converts them into the types below.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace forkmp {

/// Base class of every error raised by forkmp.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Invalid environment value or invalid thread-count / schedule request.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

/// Misuse of the region lifecycle (double enter, exit out of order, ...).
class UsageError : public Error {
public:
    explicit UsageError(const std::string& message) : Error(message) {}
};

/// fork() or waitpid() failed.
class ProcessError : public Error {
public:
    explicit ProcessError(const std::string& message) : Error(message) {}
};

/**
 * @brief One or more workers of a parallel region failed.
 *
 * Deliberately carries only the counts. Per-worker detail is in the log.
 */
class RegionError : public Error {
public:
    RegionError(std::uint32_t failed, std::uint32_t total);

    std::uint32_t failed() const noexcept { return failed_; }
    std::uint32_t total() const noexcept { return total_; }

private:
    std::uint32_t failed_;
    std::uint32_t total_;
};

} // namespace forkmp
