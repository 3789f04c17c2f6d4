#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: routing events + counters.
 * @details The factory and clients report through Observer; the default
 *          implementation counts and prints one line per event.
 */

#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include "meshroute/errors.hpp"

namespace meshroute::obs {

    /** @enum EventType
     *  @brief What happened in the routing core.
     */
    enum class EventType : uint8_t {
        FactoryStarted,   ///< ClientFactory reached Started
        FactoryShutdown,  ///< ClientFactory reached ShutDown
        BalancerRebuilt,  ///< New balancer snapshot published
        BalancerRejected, ///< Factory rejected a node set; failure snapshot published
        EventIgnored,     ///< Cluster event that does not trigger a rebuild
        BackendFailure,   ///< Collaborator failed to start or shut down
        Dispatched,       ///< Single-node send handed to the transport
        Broadcast,        ///< Broadcast handed to the transport
        CallRejected      ///< Client call failed a precondition or routing check
    };

    const char* to_string(EventType t) noexcept;

    /** @struct Counters
     *  @brief Process-level counters for routing activity.
     */
    struct Counters {
        uint64_t starts{0};           ///< FactoryStarted events
        uint64_t shutdowns{0};        ///< FactoryShutdown events
        uint64_t rebuilds{0};         ///< BalancerRebuilt events
        uint64_t rebuild_failures{0}; ///< BalancerRejected events
        uint64_t ignored_events{0};   ///< EventIgnored events
        uint64_t backend_failures{0}; ///< BackendFailure events
        uint64_t dispatches{0};       ///< Dispatched events
        uint64_t broadcasts{0};       ///< Broadcast events
        uint64_t rejected_calls{0};   ///< CallRejected events
    };

    /** @struct RoutingEvent
     *  @brief Payload describing a single routing event.
     */
    struct RoutingEvent {
        EventType   type{EventType::Dispatched};
        int32_t     node_id{-1};       ///< Target node, -1 when not applicable
        uint64_t    generation{0};     ///< Balancer snapshot generation, 0 when not applicable
        std::size_t node_count{0};     ///< Size of the node set involved
        std::optional<ErrorKind> error; ///< Failure kind for rejected/failed events
        std::string detail;            ///< Reason label (for humans/logs)
    };

    /** @class Observer
     *  @brief Observability sink interface. Implementations must be thread-safe.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single routing event.
        virtual void record(const RoutingEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Apply one event to a Counters aggregate.
    void count(Counters& c, const RoutingEvent& e) noexcept;

    /// Process-wide printf-backed observer. `echo` selects the printing or the quiet instance.
    Observer* make_simple_observer(bool echo = false);

} // namespace meshroute::obs
