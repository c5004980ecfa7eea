// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_EVALUATOR_HPP
#define BULWARK_EVALUATOR_HPP

#include <vector>
#include "core/Check.hpp"
#include "core/CheckRegistry.hpp"
#include "core/ModeController.hpp"

namespace Bulwark::Core {

    class EventBus;

    /**
     * @brief Runs every probe once, in registry order. Never mutates state.
     *
     * A probe that throws degrades to a WARN result for that check only.
     */
    class Evaluator {
    public:
        explicit Evaluator(EventBus& busRef);

        std::vector<CheckResult> evaluateAll(const CheckRegistry& registry, Mode mode) const;

        CheckResult evaluate(const Check& check) const;

    private:
        EventBus& bus;
    };
}

#endif
