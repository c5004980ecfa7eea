// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/Engine.hpp"
#include "core/BackupLedger.hpp"
#include "core/Confirmation.hpp"
#include "core/Evaluator.hpp"
#include "core/EventBus.hpp"
#include "core/Remediator.hpp"

#include <algorithm>

namespace Bulwark::Core {

    Engine::Engine(const CheckRegistry& registryRef, EventBus& busRef,
                   IConfirmation& confirmationRef, BackupLedger& backupsRef)
        : registry(registryRef), bus(busRef), confirmation(confirmationRef), backups(backupsRef) {}

    RunReport Engine::run(Mode mode) {
        bus.pushEvent("MODE", std::string("Running in ") + toString(mode) + " mode");

        Evaluator evaluator(bus);
        std::vector<CheckResult> results = evaluator.evaluateAll(registry, mode);

        if (mode == Mode::APPLY) {
            Remediator remediator(bus, confirmation, backups);
            remediator.remediateAll(registry, results);

            // Applied checks are probed again; the fresh result replaces the
            // original and carries the outcome over. Once anything was applied,
            // inconclusive checks are probed again as well.
            const bool anyApplied = std::any_of(results.begin(), results.end(), [](const CheckResult& r) {
                return r.remediation == RemediationOutcome::APPLIED;
            });
            for (auto& result : results) {
                const bool stale = result.remediation == RemediationOutcome::APPLIED ||
                                   (anyApplied && result.inconclusive());
                if (!stale) continue;
                const Check* check = registry.find(result.checkId);
                if (check == nullptr) continue;

                CheckResult fresh = evaluator.evaluate(*check);
                fresh.remediation = result.remediation;
                result = std::move(fresh);
            }
        }

        return Reporter::summarize(std::move(results));
    }
}
