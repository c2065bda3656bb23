#include <inkwell/base/event-bus.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace inkwell {
namespace base {

Result<void> EventBus::registerListener(Event::Type type, EventListener::Ptr listener, int priority) {
    if (!listener) {
        return Err<void>("EventBus::registerListener: null listener");
    }

    auto& vec = _listeners[type];
    // Insert sorted by priority (descending - higher priority first)
    PrioritizedListener entry{listener, priority};
    auto insertPos = std::upper_bound(vec.begin(), vec.end(), entry,
        [](const PrioritizedListener& a, const PrioritizedListener& b) {
            return a.priority > b.priority;
        });
    vec.insert(insertPos, entry);

    ydebug("EventBus: registered listener {} for type {} (priority {})",
           listener->id(), static_cast<int>(type), priority);
    return Ok();
}

Result<void> EventBus::deregisterListener(Event::Type type, EventListener::Ptr listener) {
    auto it = _listeners.find(type);
    if (it == _listeners.end()) return Ok();

    auto& vec = it->second;
    vec.erase(
        std::remove_if(vec.begin(), vec.end(),
            [&](const PrioritizedListener& pl) {
                auto sp = pl.listener.lock();
                return !sp || sp == listener;
            }),
        vec.end());
    return Ok();
}

Result<void> EventBus::deregisterListener(EventListener::Ptr listener) {
    for (auto& [type, vec] : _listeners) {
        vec.erase(
            std::remove_if(vec.begin(), vec.end(),
                [&](const PrioritizedListener& pl) {
                    auto sp = pl.listener.lock();
                    return !sp || sp == listener;
                }),
            vec.end());
    }
    return Ok();
}

Result<bool> EventBus::dispatch(const Event& event) {
    auto it = _listeners.find(event.type);
    if (it == _listeners.end()) return Ok(false);

    auto listeners = it->second;  // copy for safe iteration
    for (const auto& pl : listeners) {
        if (auto sp = pl.listener.lock()) {
            auto result = sp->onEvent(event);
            if (!result) {
                return Err<bool>("Event handler failed", result);
            }
            if (*result) {
                return Ok(true);  // consumed by higher priority listener
            }
        }
    }
    return Ok(false);
}

Result<void> EventBus::broadcast(const Event& event) {
    auto it = _listeners.find(event.type);
    if (it == _listeners.end()) return Ok();

    auto listeners = it->second;
    Result<void> result = Ok();
    for (const auto& pl : listeners) {
        if (auto sp = pl.listener.lock()) {
            if (auto res = sp->onEvent(event); !res) {
                ywarn("EventBus: listener {} failed: {}", sp->id(), error_msg(res));
                // Report the first failure once everyone has been notified
                if (result) {
                    result = Err<void>("Broadcast handler failed", res);
                }
            }
        }
    }
    return result;
}

size_t EventBus::listenerCount(Event::Type type) const {
    auto it = _listeners.find(type);
    if (it == _listeners.end()) return 0;
    return static_cast<size_t>(std::count_if(it->second.begin(), it->second.end(),
        [](const PrioritizedListener& pl) { return !pl.listener.expired(); }));
}

} // namespace base
} // namespace inkwell
