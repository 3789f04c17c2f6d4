#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the routing core.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader in deployments.
 */

#include <cstdint>

namespace meshroute::config::constants {

// =====================
// Load Balancer Defaults
// =====================
/// Strategy name used when the config does not set one.
inline constexpr const char* BALANCER_STRATEGY_DEFAULT = "round_robin";
/// Deterministic salt for the random strategy.
inline constexpr uint64_t BALANCER_SEED_DEFAULT = 0x5EEDB41AULL;

// =====================
// Observability Defaults
// =====================
/// Print one line per routing event to stdout. Off for embedders; the demo turns it on.
inline constexpr bool OBSERVER_ECHO_DEFAULT = false;

// =====================
// Config file tables / keys (TOML)
// =====================
inline constexpr const char* TABLE_BALANCER = "balancer";
inline constexpr const char* KEY_STRATEGY   = "strategy";
inline constexpr const char* KEY_SEED       = "seed";
inline constexpr const char* TABLE_OBSERVER = "observer";
inline constexpr const char* KEY_ECHO       = "echo";

} // namespace meshroute::config::constants
