/**
* @file config_loader.cpp
 * @brief Loader: named defaults overridden by a TOML document (toml++).
 */
#include "meshroute/config/config_loader.hpp"
#include "meshroute/routing/policy_balancers.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>

#include <toml++/toml.h>

namespace meshroute::config {
    using namespace meshroute::config::constants;

    namespace {

        meshroute_detail::unexpected<ConfigError> fail(std::size_t line, std::string msg) {
            return meshroute_detail::unexpected<ConfigError>(ConfigError{line, std::move(msg)});
        }

        std::size_t line_of(const toml::node& n) noexcept {
            return static_cast<std::size_t>(n.source().begin.line);
        }

        /// Apply [balancer]; returns an error message on the first bad entry.
        std::optional<ConfigError> apply_balancer(const toml::table& t, ClientConfig& cfg) {
            for (auto&& [key, node] : t) {
                const std::string_view k = key.str();
                if (k == KEY_STRATEGY) {
                    const auto name = node.value_exact<std::string>();
                    const auto s = name ? parse_strategy(*name) : std::nullopt;
                    if (!s) {
                        return ConfigError{line_of(node), "unknown balancer strategy" +
                                           (name ? " '" + *name + "'" : std::string{})};
                    }
                    cfg.strategy = *s;
                } else if (k == KEY_SEED) {
                    const auto n = node.value_exact<int64_t>();
                    if (!n || *n < 0) return ConfigError{line_of(node), "seed must be a non-negative integer"};
                    cfg.seed = static_cast<uint64_t>(*n);
                } else {
                    return ConfigError{line_of(node), "unknown key 'balancer." + std::string(k) + "'"};
                }
            }
            return std::nullopt;
        }

        std::optional<ConfigError> apply_observer(const toml::table& t, ClientConfig& cfg) {
            for (auto&& [key, node] : t) {
                const std::string_view k = key.str();
                if (k != KEY_ECHO) {
                    return ConfigError{line_of(node), "unknown key 'observer." + std::string(k) + "'"};
                }
                const auto b = node.value_exact<bool>();
                if (!b) return ConfigError{line_of(node), "observer.echo must be a boolean"};
                cfg.observer_echo = *b;
            }
            return std::nullopt;
        }

    } // namespace

    std::optional<routing::BalancerStrategy> parse_strategy(std::string_view name) noexcept {
        if (name == "round_robin") return routing::BalancerStrategy::RoundRobin;
        if (name == "random")      return routing::BalancerStrategy::Random;
        return std::nullopt;
    }

    ClientConfig Loader::defaults() {
        ClientConfig cfg;
        cfg.strategy = parse_strategy(BALANCER_STRATEGY_DEFAULT)
                           .value_or(routing::BalancerStrategy::RoundRobin);
        cfg.seed = BALANCER_SEED_DEFAULT;
        cfg.observer_echo = OBSERVER_ECHO_DEFAULT;
        return cfg;
    }

    ConfigResult Loader::load_from_string(std::string_view text) {
        toml::table doc;
        try {
            doc = toml::parse(text);
        } catch (const toml::parse_error& err) {
            return fail(static_cast<std::size_t>(err.source().begin.line),
                        std::string(err.description()));
        }

        ClientConfig cfg = defaults();
        for (auto&& [key, node] : doc) {
            const std::string_view k = key.str();
            const toml::table* t = node.as_table();
            if (k != TABLE_BALANCER && k != TABLE_OBSERVER) {
                return fail(line_of(node), "unknown key '" + std::string(k) + "'");
            }
            if (!t) return fail(line_of(node), "'" + std::string(k) + "' must be a table");

            auto bad = (k == TABLE_BALANCER) ? apply_balancer(*t, cfg) : apply_observer(*t, cfg);
            if (bad) return meshroute_detail::unexpected<ConfigError>(std::move(*bad));
        }
        return cfg;
    }

    ConfigResult Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return fail(0, "cannot open config file '" + path + "'");
        std::ostringstream buf;
        buf << in.rdbuf();
        return load_from_string(buf.str());
    }

    std::unique_ptr<routing::LoadBalancerFactory> make_balancer_factory(const ClientConfig& cfg) {
        return std::make_unique<routing::PolicyLoadBalancerFactory>(cfg.strategy, cfg.seed);
    }

} // namespace meshroute::config
