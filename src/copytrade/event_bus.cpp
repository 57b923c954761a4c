// src/copytrade/event_bus.cpp
#include "copytrade/event_bus.hpp"
#include "utils/log.hpp"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace copytrade {

void EventBus::publish(const OnchainEvent& event) const
{
    std::vector<Handler> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(handlers_.size());
        for (const auto& kv : handlers_) {
            snapshot.push_back(kv.second);
        }
    }

    for (const auto& handler : snapshot) {
        try {
            handler(event);
        } catch (const std::exception& ex) {
            spdlog::warn("event handler failed {}", utils::fields({{"hash", event.hash}, {"err", ex.what()}}));
        } catch (...) {
            spdlog::warn("event handler failed {}",
                         utils::fields({{"hash", event.hash}, {"err", "non-standard exception"}}));
        }
    }
}

EventBus::Unsubscribe EventBus::subscribe(Handler handler)
{
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        handlers_.emplace(id, std::move(handler));
    }
    return [this, id]() {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(id);
    };
}

std::size_t EventBus::subscribers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

} // namespace copytrade
