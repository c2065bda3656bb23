#pragma once

#include "event.h"
#include "event-listener.h"
#include <map>
#include <memory>
#include <vector>

namespace inkwell {
namespace base {

// Synchronous listener registry. The host renderer owns one and uses it to
// notify its layers (e.g. of native size changes). Listeners are held weakly;
// expired entries are skipped and pruned on deregistration.
class EventBus {
public:
    using Ptr = std::shared_ptr<EventBus>;

    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // priority: higher value = called first (default 0)
    Result<void> registerListener(Event::Type type, EventListener::Ptr listener, int priority = 0);
    Result<void> deregisterListener(Event::Type type, EventListener::Ptr listener);
    Result<void> deregisterListener(EventListener::Ptr listener);

    // Delivers to listeners of event.type in priority order until one consumes it.
    Result<bool> dispatch(const Event& event);

    // Delivers to every listener of event.type regardless of consumption or
    // failure; returns the first failure.
    Result<void> broadcast(const Event& event);

    size_t listenerCount(Event::Type type) const;

private:
    struct PrioritizedListener {
        std::weak_ptr<EventListener> listener;
        int priority;
    };

    std::map<Event::Type, std::vector<PrioritizedListener>> _listeners;
};

} // namespace base
} // namespace inkwell
