#pragma once
/**
 * @file config_loader.hpp
 * @brief Process-wide region tunables and the environment loader feeding them.
 * @details Defaults reference named constants (constants.hpp).
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "forkmp/compat/expected.hpp"
#include "forkmp/config/constants.hpp"

namespace forkmp::config {

    /** @enum ConfigErr
     *  @brief Reasons a configuration value is rejected.
     */
    enum class ConfigErr : std::uint8_t {
        InvalidBool = 1,      ///< Not "true"/"false" (any case)
        InvalidThreadLimit,   ///< Not a positive integer
        InvalidNumThreads,    ///< Not a comma-separated list of positive integers
    };

    /** @struct ConfigIssue
     *  @brief Error payload: which variable, what value, why.
     */
    struct ConfigIssue {
        ConfigErr   code{ConfigErr::InvalidBool};
        std::string variable;  ///< Environment variable or field name
        std::string value;     ///< Offending text

        /// Human readable description (used for ConfigError messages).
        std::string describe() const;
    };

    /** @struct Configuration
     *  @brief Tunables read by every region at enter().
     *
     *  Plain mutable fields. Regions copy them when entered, so later writes
     *  only affect regions entered afterwards.
     */
    struct Configuration {
        bool                    nested{constants::NESTED_DEFAULT}; ///< Allow forking below level 0
        std::optional<unsigned> thread_limit;                      ///< Cap on live processes in the tree
        std::vector<unsigned>   num_threads;                       ///< Per-level counts; one entry = all levels

        /**
         * @brief Thread count configured for a nesting level.
         * @return nullopt when num_threads is empty. Levels past the end reuse
         *         the last entry.
         */
        std::optional<unsigned> threads_for_level(unsigned level) const noexcept;

        /// Check the invariants (no zero entries, no zero limit).
        forkmp_detail::expected<void, ConfigIssue> validate() const;
    };

    /// Lookup used by the loader; returns nullopt for unset variables.
    using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

    /** @class Loader
     *  @brief Builds a Configuration from PYMP_* / OMP_* variables.
     */
    class Loader {
    public:
        /// Read the process environment.
        static forkmp_detail::expected<Configuration, ConfigIssue> from_environment();

        /// Read through an arbitrary lookup (tests, embedding).
        static forkmp_detail::expected<Configuration, ConfigIssue> from_lookup(const EnvLookup& lookup);
    };

    // Parsers shared by the loader and tests.
    std::optional<bool>                  parse_bool(std::string_view text);
    std::optional<unsigned>              parse_positive(std::string_view text);
    std::optional<std::vector<unsigned>> parse_thread_list(std::string_view text);

    /**
     * @brief The process-wide configuration, loaded from the environment once.
     * @throws forkmp::ConfigError if the environment holds an invalid value.
     */
    Configuration& global();

} // namespace forkmp::config
