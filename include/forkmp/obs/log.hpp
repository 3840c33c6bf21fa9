#pragma once
/**
 * @file log.hpp
 * @brief Process logger facade backed by spdlog.
 * @details One logger per process image. Forked workers inherit it; every line
 *          carries the pid so interleaved output from a region can be told apart.
 *          Level and sink come from FORKMP_LOGLEVEL / FORKMP_LOGFILE.
 */

#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace forkmp::obs {

namespace log_level = spdlog::level;

/// The process-wide logger (created on first use).
spdlog::logger& logger();

/// Override the level chosen from the environment.
void set_level(log_level::level_enum level);

/// Flush the sinks. Called by workers right before _exit().
void flush() noexcept;

template <class... Args>
void log_print(log_level::level_enum level, fmt::format_string<Args...> msg, Args&&... args) {
    auto& lg = logger();
    if (!lg.should_log(level)) return;
    lg.log(level, std::string_view(fmt::format(msg, std::forward<Args>(args)...)));
}

template <class... Args>
void debug(fmt::format_string<Args...> msg, Args&&... args) {
    log_print(log_level::debug, msg, std::forward<Args>(args)...);
}

template <class... Args>
void info(fmt::format_string<Args...> msg, Args&&... args) {
    log_print(log_level::info, msg, std::forward<Args>(args)...);
}

template <class... Args>
void warn(fmt::format_string<Args...> msg, Args&&... args) {
    log_print(log_level::warn, msg, std::forward<Args>(args)...);
}

template <class... Args>
void error(fmt::format_string<Args...> msg, Args&&... args) {
    log_print(log_level::err, msg, std::forward<Args>(args)...);
}

template <class... Args>
void critical(fmt::format_string<Args...> msg, Args&&... args) {
    log_print(log_level::critical, msg, std::forward<Args>(args)...);
}

} // namespace forkmp::obs
