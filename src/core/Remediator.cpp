// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/Remediator.hpp"
#include "core/BackupLedger.hpp"
#include "core/Confirmation.hpp"
#include "core/EventBus.hpp"

#include <exception>

namespace Bulwark::Core {

    Remediator::Remediator(EventBus& busRef, IConfirmation& confirmationRef, BackupLedger& backupsRef)
        : bus(busRef), confirmation(confirmationRef), backups(backupsRef) {}

    bool Remediator::eligible(const Check& check, const CheckResult& result) {
        return result.status != CheckStatus::PASS
            && !result.inconclusive()
            && result.actionable
            && check.hasRemediation();
    }

    RemediationOutcome Remediator::remediate(const Check& check, CheckResult& result) const {
        const std::string tag = "[" + check.id() + "] ";

        if (check.requiresConfirmation() &&
            confirmation.confirm(check) != Decision::ACCEPT) {
            result.remediation = RemediationOutcome::DECLINED;
            bus.pushEvent("REMEDIATOR", tag + "declined");
            return result.remediation;
        }

        try {
            if (check.mutates()) {
                for (const auto& file : check.targetFiles()) {
                    backups.ensureBackup(file);
                }
            }
        } catch (const std::exception& e) {
            result.remediation = RemediationOutcome::FAILED;
            result.message += std::string(" (backup failed: ") + e.what() + ")";
            bus.pushEvent("REMEDIATOR", tag + "backup failed, not applied: " + e.what());
            return result.remediation;
        }

        try {
            check.remediate();
            result.remediation = RemediationOutcome::APPLIED;
            bus.pushEvent("REMEDIATOR", tag + "applied");
        } catch (const std::exception& e) {
            result.remediation = RemediationOutcome::FAILED;
            result.message += std::string(" (remediation failed: ") + e.what() + ")";
            bus.pushEvent("REMEDIATOR", tag + "failed: " + e.what());
        }
        return result.remediation;
    }

    void Remediator::remediateAll(const CheckRegistry& registry, std::vector<CheckResult>& results) const {
        for (auto& result : results) {
            const Check* check = registry.find(result.checkId);
            if (check == nullptr || !eligible(*check, result)) continue;
            remediate(*check, result);
        }
    }
}
