#pragma once
/**
 * @file message.hpp
 * @brief Opaque message envelope and the completion handles returned by sends.
 * @details Completion failures belong to the transport: they travel inside the
 *          futures and are never reclassified by the routing core.
 */

#include <cstddef>
#include <cstdint>
#include <future>
#include <string>
#include <vector>

#include "meshroute/cluster/node.hpp"

namespace meshroute::client {

/**
 * @struct Message
 * @brief Payload handed to the transport unchanged. The core never inspects it.
 */
struct Message {
    std::string name;                  ///< Message type label, e.g. "Ping"
    std::vector<std::uint8_t> payload; ///< Encoded body (encoding is the caller's concern)
};

/// Completion of one send to one node. Ready when the transport finished; get() rethrows its failure.
using SendHandle = std::shared_future<void>;

/**
 * @class BroadcastHandle
 * @brief Aggregate of the per-node completions of one broadcast.
 *
 * Partial failure is not hidden: get() waits for every send, then rethrows the
 * failure of the first failed send in dispatch order.
 */
class BroadcastHandle {
public:
    BroadcastHandle() = default;

    /// Append the completion of the send to `target`.
    void add(cluster::NodeId target, SendHandle handle);

    /// Number of per-node sends.
    [[nodiscard]] std::size_t size() const noexcept { return handles_.size(); }

    /// Target ids in dispatch order.
    [[nodiscard]] const std::vector<cluster::NodeId>& targets() const noexcept { return targets_; }

    /// Per-node completions in dispatch order.
    [[nodiscard]] const std::vector<SendHandle>& handles() const noexcept { return handles_; }

    /// True once every per-node send has completed.
    [[nodiscard]] bool ready() const;

    /// Block until every per-node send has completed.
    void wait() const;

    /// wait(), then rethrow the first per-node failure, if any.
    void get() const;

private:
    std::vector<cluster::NodeId> targets_;
    std::vector<SendHandle> handles_;
};

} // namespace meshroute::client
