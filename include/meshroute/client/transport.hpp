#pragma once
/**
 * @file transport.hpp
 * @brief Collaborator interface: low-level delivery of a message to one node.
 * @details Connection pooling, serialization, socket retries, send timeouts and
 *          cancellation all live behind this interface.
 */

#include "meshroute/client/message.hpp"
#include "meshroute/cluster/node.hpp"
#include "meshroute/errors.hpp"

namespace meshroute::client {

    class TransportClient {
    public:
        virtual ~TransportClient() = default;

        /**
         * @brief Start delivery of `message` to `node`.
         * @return Completion handle; delivery failures are stored in it.
         */
        virtual SendHandle send(const cluster::Node& node, const Message& message) = 0;

        /// Close connections and release transport resources.
        virtual Status shutdown() = 0;
    };

} // namespace meshroute::client
