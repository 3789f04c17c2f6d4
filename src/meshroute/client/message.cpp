#include "meshroute/client/message.hpp"

#include <chrono>
#include <utility>

namespace meshroute::client {

void BroadcastHandle::add(cluster::NodeId target, SendHandle handle) {
    targets_.push_back(target);
    handles_.push_back(std::move(handle));
}

bool BroadcastHandle::ready() const {
    for (const auto& h : handles_) {
        if (h.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return false;
    }
    return true;
}

void BroadcastHandle::wait() const {
    for (const auto& h : handles_) h.wait();
}

void BroadcastHandle::get() const {
    wait();
    for (const auto& h : handles_) h.get();
}

} // namespace meshroute::client
