// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/EventBus.hpp"

#include <utility>

namespace Bulwark::Core {

    EventBus::~EventBus() {
        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }
    }

    void EventBus::pushEvent(const std::string& source, const std::string& payload) {
        ++published;
        events.get_subscriber().on_next(EngineEvent{source, payload});
    }

    void EventBus::subscribe(std::function<void(const EngineEvent&)> handler) {
        events.get_observable()
            .subscribe(lifetime, [handler = std::move(handler)](const EngineEvent& e) {
                handler(e);
            });
    }

} // namespace Bulwark::Core
