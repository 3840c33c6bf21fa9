/**
 * @file config_loader.cpp
 * @brief Environment parsing for region tunables.
 */
#include "forkmp/config/config_loader.hpp"
#include "forkmp/error.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <utility>

#include <fmt/format.h>

namespace forkmp::config {
    using namespace forkmp::config::constants;

    namespace {

    std::string_view trim(std::string_view s) noexcept {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
        return s;
    }

    bool iequals(std::string_view a, std::string_view b) noexcept {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
    }

    /// Primary variable wins; fallback only when the primary is unset.
    std::optional<std::pair<std::string, std::string>>
    lookup_pair(const EnvLookup& lookup, const char* primary, const char* fallback) {
        if (auto v = lookup(primary))  return std::make_pair(std::string(primary), std::move(*v));
        if (auto v = lookup(fallback)) return std::make_pair(std::string(fallback), std::move(*v));
        return std::nullopt;
    }

    } // namespace

    std::string ConfigIssue::describe() const {
        switch (code) {
            case ConfigErr::InvalidBool:
                return fmt::format("{}='{}': expected TRUE or FALSE", variable, value);
            case ConfigErr::InvalidThreadLimit:
                return fmt::format("{}='{}': expected a positive integer", variable, value);
            case ConfigErr::InvalidNumThreads:
                return fmt::format("{}='{}': expected a single positive number or a "
                                   "comma-separated list of numbers per nesting level",
                                   variable, value);
        }
        return fmt::format("{}='{}': invalid value", variable, value);
    }

    std::optional<unsigned> Configuration::threads_for_level(unsigned level) const noexcept {
        if (num_threads.empty()) return std::nullopt;
        const std::size_t idx = std::min<std::size_t>(level, num_threads.size() - 1);
        return num_threads[idx];
    }

    forkmp_detail::expected<void, ConfigIssue> Configuration::validate() const {
        if (thread_limit && *thread_limit == 0) {
            return forkmp_detail::unexpected(
                ConfigIssue{ConfigErr::InvalidThreadLimit, "thread_limit", "0"});
        }
        for (unsigned n : num_threads) {
            if (n == 0) {
                std::string joined;
                for (unsigned v : num_threads) {
                    if (!joined.empty()) joined += ',';
                    joined += std::to_string(v);
                }
                return forkmp_detail::unexpected(
                    ConfigIssue{ConfigErr::InvalidNumThreads, "num_threads", joined});
            }
        }
        return {};
    }

    std::optional<bool> parse_bool(std::string_view text) {
        text = trim(text);
        if (iequals(text, "true"))  return true;
        if (iequals(text, "false")) return false;
        return std::nullopt;
    }

    std::optional<unsigned> parse_positive(std::string_view text) {
        text = trim(text);
        if (text.empty()) return std::nullopt;
        unsigned v = 0;
        const auto* first = text.data();
        const auto* last  = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, v);
        if (ec != std::errc{} || ptr != last || v == 0) return std::nullopt;
        return v;
    }

    std::optional<std::vector<unsigned>> parse_thread_list(std::string_view text) {
        std::vector<unsigned> out;
        while (true) {
            const auto comma = text.find(',');
            auto v = parse_positive(text.substr(0, comma));
            if (!v) return std::nullopt;
            out.push_back(*v);
            if (comma == std::string_view::npos) break;
            text.remove_prefix(comma + 1);
        }
        return out;
    }

    forkmp_detail::expected<Configuration, ConfigIssue> Loader::from_lookup(const EnvLookup& lookup) {
        Configuration cfg;

        if (auto kv = lookup_pair(lookup, ENV_NESTED_PRIMARY, ENV_NESTED_FALLBACK)) {
            auto v = parse_bool(kv->second);
            if (!v) return forkmp_detail::unexpected(ConfigIssue{ConfigErr::InvalidBool, kv->first, kv->second});
            cfg.nested = *v;
        }
        if (auto kv = lookup_pair(lookup, ENV_THREAD_LIMIT_PRIMARY, ENV_THREAD_LIMIT_FALLBACK)) {
            auto v = parse_positive(kv->second);
            if (!v) return forkmp_detail::unexpected(ConfigIssue{ConfigErr::InvalidThreadLimit, kv->first, kv->second});
            cfg.thread_limit = *v;
        }
        if (auto kv = lookup_pair(lookup, ENV_NUM_THREADS_PRIMARY, ENV_NUM_THREADS_FALLBACK)) {
            auto v = parse_thread_list(kv->second);
            if (!v) return forkmp_detail::unexpected(ConfigIssue{ConfigErr::InvalidNumThreads, kv->first, kv->second});
            cfg.num_threads = std::move(*v);
        }
        return cfg;
    }

    forkmp_detail::expected<Configuration, ConfigIssue> Loader::from_environment() {
        return from_lookup([](std::string_view name) -> std::optional<std::string> {
            const char* v = std::getenv(std::string(name).c_str());
            if (!v) return std::nullopt;
            return std::string(v);
        });
    }

    Configuration& global() {
        static Configuration cfg = [] {
            auto loaded = Loader::from_environment();
            if (!loaded) throw forkmp::ConfigError(loaded.error().describe());
            return std::move(*loaded);
        }();
        return cfg;
    }

} // namespace forkmp::config
