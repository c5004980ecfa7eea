// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_REMEDIATOR_HPP
#define BULWARK_REMEDIATOR_HPP

#include <vector>
#include "core/Check.hpp"
#include "core/CheckRegistry.hpp"

namespace Bulwark::Core {

    class BackupLedger;
    class EventBus;
    class IConfirmation;

    /**
     * @brief Applies remediations for non-passing results (APPLY mode only).
     *
     * The caller has already verified root. Each remediation is its own unit of
     * work: a failure is recorded on that result and the next one proceeds;
     * earlier successes are not rolled back.
     */
    class Remediator {
    public:
        Remediator(EventBus& busRef, IConfirmation& confirmationRef, BackupLedger& backupsRef);

        // Updates the remediation field of every eligible result, in order.
        void remediateAll(const CheckRegistry& registry, std::vector<CheckResult>& results) const;

        RemediationOutcome remediate(const Check& check, CheckResult& result) const;

        /**
         * @brief WARN/FAIL, conclusive, actionable, and the check has a remediation.
         */
        static bool eligible(const Check& check, const CheckResult& result);

    private:
        EventBus& bus;
        IConfirmation& confirmation;
        BackupLedger& backups;
    };
}

#endif
