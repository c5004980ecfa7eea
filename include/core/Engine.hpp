// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_ENGINE_HPP
#define BULWARK_ENGINE_HPP

#include "core/CheckRegistry.hpp"
#include "core/ModeController.hpp"
#include "core/Reporter.hpp"

namespace Bulwark::Core {

    class BackupLedger;
    class EventBus;
    class IConfirmation;

    /**
     * @brief One evaluate-then-optionally-remediate pass.
     *
     * AUDIT: evaluate -> summarize.
     * APPLY: evaluate -> remediate -> re-evaluate applied (and, after any change,
     * inconclusive) checks -> summarize.
     * The caller is responsible for the APPLY privilege gate.
     */
    class Engine {
    public:
        Engine(const CheckRegistry& registryRef, EventBus& busRef,
               IConfirmation& confirmationRef, BackupLedger& backupsRef);

        RunReport run(Mode mode);

    private:
        const CheckRegistry& registry;
        EventBus& bus;
        IConfirmation& confirmation;
        BackupLedger& backups;
    };
}

#endif
