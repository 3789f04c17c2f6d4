#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader for the client configuration: named defaults plus TOML overrides.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "meshroute/compat/expected.hpp"
#include "meshroute/config/constants.hpp"
#include "meshroute/routing/load_balancer.hpp"

namespace meshroute::config {

    /** @struct ClientConfig
     *  @brief Settings consumed when wiring a ClientFactory.
     */
    struct ClientConfig {
        routing::BalancerStrategy strategy{routing::BalancerStrategy::RoundRobin}; ///< Balancing policy
        uint64_t seed{constants::BALANCER_SEED_DEFAULT};     ///< Salt for the random strategy
        bool     observer_echo{constants::OBSERVER_ECHO_DEFAULT}; ///< Echo routing events to stdout
    };

    /** @struct ConfigError
     *  @brief Why a configuration could not be loaded.
     */
    struct ConfigError {
        std::size_t line{0};  ///< 1-based line in the TOML source, 0 when not line-specific
        std::string message;  ///< Human-readable description
    };

    using ConfigResult = meshroute_detail::expected<ClientConfig, ConfigError>;

    /** @class Loader
     *  @brief Source of client configuration (defaults or parsed files).
     *
     * TOML document; every key is optional and unknown keys are rejected:
     * @code
     * [balancer]
     * strategy = "random"   # "round_robin" | "random"
     * seed     = 0x2A       # non-negative integer
     *
     * [observer]
     * echo = true
     * @endcode
     */
    class Loader {
    public:
        /// Configuration built from named defaults only.
        static ClientConfig defaults();

        /**
         * @brief Load configuration from a file.
         * @param path File to read.
         * @return Parsed config, or the first error (unreadable file, bad line).
         */
        static ConfigResult load_from_file(const std::string& path);

        /// Parse configuration text (same format as load_from_file).
        static ConfigResult load_from_string(std::string_view text);
    };

    /// Parse a strategy name ("round_robin", "random").
    std::optional<routing::BalancerStrategy> parse_strategy(std::string_view name) noexcept;

    /// Build the balancer factory described by `cfg`.
    std::unique_ptr<routing::LoadBalancerFactory> make_balancer_factory(const ClientConfig& cfg);

} // namespace meshroute::config
