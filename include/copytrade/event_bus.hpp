// include/copytrade/event_bus.hpp
#pragma once

#include "copytrade/event.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace copytrade {

// In-process fan-out of OnchainEvents.
//
// publish() calls every subscriber inline on the publishing thread, in
// subscription order. Handlers that do I/O hand the work to a TaskPool
// instead of blocking here. A handler that throws is logged and skipped;
// the publisher and the remaining handlers are unaffected.
class EventBus {
public:
    using Handler     = std::function<void(const OnchainEvent&)>;
    using Unsubscribe = std::function<void()>;

    void publish(const OnchainEvent& event) const;

    // The returned callable removes the handler; calling it again is a no-op.
    // It must not outlive the bus.
    Unsubscribe subscribe(Handler handler);

    std::size_t subscribers() const;

private:
    mutable std::mutex                  mutex_;
    std::map<std::uint64_t, Handler>    handlers_;
    std::uint64_t                       next_id_ = 1;
};

} // namespace copytrade
