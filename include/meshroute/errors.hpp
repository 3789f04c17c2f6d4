#pragma once
/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the client factory, clients and collaborators.
 * @details Errors are values: every fallible operation returns Result<T> or Status.
 *          No exceptions on the request path.
 */

#include <cstdint>
#include <string>
#include <utility>

#include "meshroute/compat/expected.hpp"

namespace meshroute {

// -----------------------------------------------------------------------------
// Error kinds. Callers branch on the kind, never on the reason text.
// -----------------------------------------------------------------------------
/// Failure classes reported synchronously to the caller.
enum class ErrorKind : std::uint8_t {
    NetworkNotStarted,   ///< Call issued before ClientFactory::start() succeeded.
    ClusterShutdown,     ///< Call issued after shutdown(), or start() after shutdown().
    ClusterDisconnected, ///< Cluster view reports not-connected at call time.
    InvalidNode,         ///< Target node is not a current cluster member.
    InvalidCluster,      ///< Load balancer factory rejected the node set.
    NoNodesAvailable,    ///< Load balancer had no node to offer.
    BackendFailure       ///< A collaborator failed to start or shut down.
};

/// Stable lower-case name for logs.
inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NetworkNotStarted:   return "network_not_started";
        case ErrorKind::ClusterShutdown:     return "cluster_shutdown";
        case ErrorKind::ClusterDisconnected: return "cluster_disconnected";
        case ErrorKind::InvalidNode:         return "invalid_node";
        case ErrorKind::InvalidCluster:      return "invalid_cluster";
        case ErrorKind::NoNodesAvailable:    return "no_nodes_available";
        case ErrorKind::BackendFailure:      return "backend_failure";
    }
    return "unknown";
}

/// Error value: kind plus a human-readable reason (may be empty).
struct Error {
    ErrorKind   kind{ErrorKind::BackendFailure};
    std::string reason;

    bool operator==(const Error&) const = default;
};

template <class T>
using Result = meshroute_detail::expected<T, Error>;

/// Result of an operation that produces no value.
using Status = Result<void>;

/// Build the error side of a Result/Status.
inline meshroute_detail::unexpected<Error> make_error(ErrorKind kind, std::string reason = {}) {
    return meshroute_detail::unexpected<Error>(Error{kind, std::move(reason)});
}

} // namespace meshroute
