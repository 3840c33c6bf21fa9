/**
 * @file log.cpp
 * @brief spdlog setup: stderr color sink by default, file sink on request.
 */
#include "forkmp/obs/log.hpp"
#include "forkmp/config/constants.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace forkmp::obs {

namespace {

constexpr const char* kLoggerName = "forkmp";

log_level::level_enum level_from_env(const char* env) {
    if (!std::strcmp(env, "trace"))    return log_level::trace;
    if (!std::strcmp(env, "debug"))    return log_level::debug;
    if (!std::strcmp(env, "info"))     return log_level::info;
    if (!std::strcmp(env, "warn"))     return log_level::warn;
    if (!std::strcmp(env, "error"))    return log_level::err;
    if (!std::strcmp(env, "critical")) return log_level::critical;
    if (!std::strcmp(env, "off"))      return log_level::off;
    return log_level::info;
}

std::shared_ptr<spdlog::logger> make_logger() {
    using namespace forkmp::config::constants;
    std::shared_ptr<spdlog::logger> lg;
    if (const char* file = std::getenv(ENV_LOG_FILE); file && *file) {
        lg = spdlog::basic_logger_mt(kLoggerName, file);
    } else {
        lg = spdlog::stderr_color_mt(kLoggerName);
    }
    // %P: pid, the only thing that tells workers of one region apart.
    lg->set_pattern("%^[%L %X.%e] [pid %P] %v%$");
    lg->set_level(log_level::info);
    if (const char* env = std::getenv(ENV_LOG_LEVEL); env) {
        lg->set_level(level_from_env(env));
    }
    return lg;
}

} // namespace

spdlog::logger& logger() {
    static std::shared_ptr<spdlog::logger> g_logger = make_logger();
    return *g_logger;
}

void set_level(log_level::level_enum level) {
    logger().set_level(level);
}

void flush() noexcept {
    try {
        logger().flush();
    } catch (const spdlog::spdlog_ex& e) {
        std::fputs(e.what(), stderr);
    }
}

} // namespace forkmp::obs
