/**
* @file observability.cpp
 * @brief printf-backed implementation of Observer.
 */
#include "meshroute/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace meshroute::obs {

    const char* to_string(EventType t) noexcept {
        switch (t) {
            case EventType::FactoryStarted:   return "factory_started";
            case EventType::FactoryShutdown:  return "factory_shutdown";
            case EventType::BalancerRebuilt:  return "balancer_rebuilt";
            case EventType::BalancerRejected: return "balancer_rejected";
            case EventType::EventIgnored:     return "event_ignored";
            case EventType::BackendFailure:   return "backend_failure";
            case EventType::Dispatched:       return "dispatched";
            case EventType::Broadcast:        return "broadcast";
            case EventType::CallRejected:     return "call_rejected";
        }
        return "unknown";
    }

    void count(Counters& c, const RoutingEvent& e) noexcept {
        switch (e.type) {
            case EventType::FactoryStarted:   c.starts++; break;
            case EventType::FactoryShutdown:  c.shutdowns++; break;
            case EventType::BalancerRebuilt:  c.rebuilds++; break;
            case EventType::BalancerRejected: c.rebuild_failures++; break;
            case EventType::EventIgnored:     c.ignored_events++; break;
            case EventType::BackendFailure:   c.backend_failures++; break;
            case EventType::Dispatched:       c.dispatches++; break;
            case EventType::Broadcast:        c.broadcasts++; break;
            case EventType::CallRejected:     c.rejected_calls++; break;
        }
    }

    class SimpleObserver : public Observer {
    public:
        explicit SimpleObserver(bool echo) : echo_(echo) {}

        void record(const RoutingEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(ctr_, e);
            if (!echo_) return;
            // JSON-ish line (swap for structured logger later)
            std::printf(
              R"({"event":"%s","node":%d,"generation":%llu,"nodes":%zu,"error":"%s","detail":"%s"})" "\n",
              to_string(e.type), static_cast<int>(e.node_id),
              static_cast<unsigned long long>(e.generation), e.node_count,
              e.error ? meshroute::to_string(*e.error) : "", e.detail.c_str());
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        const bool echo_;
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer(bool echo) {
        static SimpleObserver loud(true);   // process-wide singletons
        static SimpleObserver quiet(false);
        return echo ? &loud : &quiet;
    }

} // namespace meshroute::obs
