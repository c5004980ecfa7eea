// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef AUDIT_MODULE_HPP
#define AUDIT_MODULE_HPP

#include <string>
#include "core/CheckRegistry.hpp"
#include "core/HostLayout.hpp"

namespace Bulwark::Modules {

    // Linux audit daemon: installed, then running.
    class AuditModule {
    public:
        explicit AuditModule(Core::HostContext context);

        std::string getName() const { return "AuditSubsystem"; }

        void registerChecks(Core::CheckRegistry& registry) const;

        static bool auditdInstalled(const Core::ICommandRunner& runner);

    private:
        Core::HostContext ctx;
    };
}

#endif
