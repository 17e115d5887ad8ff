#pragma once

#include "common/types.hpp"
#include <vector>

namespace dexbook {

/// Receives one TradeEvent per fill. Fire-and-forget from the engine's side.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void publish(const TradeEvent& event) = 0;
};

/// Keeps every event in arrival order.
class TradeRecorder : public EventSink {
public:
    void publish(const TradeEvent& event) override { events_.push_back(event); }

    const std::vector<TradeEvent>& events() const noexcept { return events_; }
    size_t size() const noexcept { return events_.size(); }
    void clear() noexcept { events_.clear(); }

    Quantity total_quantity() const noexcept {
        Quantity total = 0;
        for (const auto& e : events_) total += e.quantity;
        return total;
    }

private:
    std::vector<TradeEvent> events_;
};

} // namespace dexbook
