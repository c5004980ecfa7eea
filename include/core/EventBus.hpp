// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_EVENT_BUS_HPP
#define BULWARK_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <string>
#include "rxcpp/rx.hpp"

namespace Bulwark::Core {

    /**
     * @brief Diagnostic event published by engine components.
     */
    struct EngineEvent {
        std::string source;   // EVALUATOR, REMEDIATOR, BACKUP, EXEC, MODE ...
        std::string payload;
    };

    /**
     * @brief Diagnostics channel. Components push events instead of writing to
     * std::cerr; the entry point (or a test) decides where they go.
     *
     * Delivery is synchronous on the publishing thread: no observe_on, no
     * scheduler, so subscribers see events in publication order.
     */
    class EventBus {
    private:
        rxcpp::subjects::subject<EngineEvent> events;
        rxcpp::composite_subscription lifetime;
        std::size_t published = 0;

    public:
        EventBus() = default;
        ~EventBus();

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        void pushEvent(const std::string& source, const std::string& payload);

        void subscribe(std::function<void(const EngineEvent&)> handler);

        [[nodiscard]] std::size_t publishedCount() const { return published; }
    };
}

#endif
