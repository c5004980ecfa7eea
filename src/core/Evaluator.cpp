// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/Evaluator.hpp"
#include "core/Errors.hpp"
#include "core/EventBus.hpp"

#include <exception>

namespace Bulwark::Core {

    namespace {
        void degrade(CheckResult& r, ProbeFault fault, const std::string& message) {
            r.status = CheckStatus::WARN;
            r.fault = fault;
            r.message = message;
            r.actionable = false;
        }
    }

    Evaluator::Evaluator(EventBus& busRef) : bus(busRef) {}

    CheckResult Evaluator::evaluate(const Check& check) const {
        CheckResult r;
        r.checkId = check.id();
        r.title = check.title();
        r.category = check.category();

        try {
            Finding f = check.evaluate();
            r.status = f.status;
            r.message = std::move(f.message);
            r.fault = f.fault;
            r.actionable = f.actionable && f.fault == ProbeFault::NONE;
        } catch (const ToolMissingError& e) {
            degrade(r, ProbeFault::TOOL_MISSING, std::string("missing dependency: ") + e.what());
        } catch (const PermissionDeniedError& e) {
            degrade(r, ProbeFault::PERMISSION_DENIED, std::string("permission denied: ") + e.what());
        } catch (const std::exception& e) {
            degrade(r, ProbeFault::PROBE_ERROR, std::string("probe error: ") + e.what());
        }

        bus.pushEvent("EVALUATOR", "[" + r.checkId + "] " + toString(r.status) + " " + r.message);
        return r;
    }

    std::vector<CheckResult> Evaluator::evaluateAll(const CheckRegistry& registry, Mode mode) const {
        bus.pushEvent("EVALUATOR", "Evaluating " + std::to_string(registry.size()) +
                                   " checks (" + toString(mode) + ")");

        std::vector<CheckResult> results;
        results.reserve(registry.size());
        for (const auto& check : registry.checks()) {
            results.push_back(evaluate(check));
        }
        return results;
    }
}
