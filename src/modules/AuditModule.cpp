// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "modules/AuditModule.hpp"
#include "core/Errors.hpp"
#include "core/SafeExecutor.hpp"

namespace Bulwark::Modules {

    using Core::Category;
    using Core::Check;
    using Core::Finding;

    namespace {

        void startAuditd(Core::ICommandRunner& runner) {
            Core::runChecked(runner, "systemctl", {"start", "auditd"});
            Core::runChecked(runner, "systemctl", {"enable", "auditd"});
        }
    }

    AuditModule::AuditModule(Core::HostContext context) : ctx(std::move(context)) {}

    bool AuditModule::auditdInstalled(const Core::ICommandRunner& runner) {
        return runner.available("auditd") || runner.available("auditctl");
    }

    void AuditModule::registerChecks(Core::CheckRegistry& registry) const {
        const std::shared_ptr<Core::ICommandRunner> runner = ctx.runner;

        {
            Check::Definition def;
            def.id = "audit.auditd_installed";
            def.title = "Audit daemon installed";
            def.category = Category::AUDIT_SUBSYSTEM;
            def.evaluate = [runner] {
                if (auditdInstalled(*runner)) {
                    return Finding::pass("auditd is installed");
                }
                return Finding::warn("auditd is not installed (recommended for security auditing)");
            };
            def.remediate = [runner] {
                if (runner->available("apt-get")) {
                    Core::runChecked(*runner, "apt-get", {"install", "-y", "auditd"});
                } else if (runner->available("yum")) {
                    Core::runChecked(*runner, "yum", {"install", "-y", "audit"});
                } else {
                    throw Core::RemediationError("no supported package manager found (apt-get or yum)");
                }
                startAuditd(*runner);
            };
            def.requiresConfirmation = true;
            def.mutates = true;
            registry.registerCheck(Check(std::move(def)));
        }

        {
            Check::Definition def;
            def.id = "audit.auditd_running";
            def.title = "Audit daemon running";
            def.category = Category::AUDIT_SUBSYSTEM;
            def.evaluate = [runner] {
                if (!auditdInstalled(*runner)) {
                    throw Core::ToolMissingError("auditd is not installed");
                }
                if (runner->run("systemctl", {"is-active", "--quiet", "auditd"}).succeeded()) {
                    return Finding::pass("auditd is running");
                }
                return Finding::warn("auditd is installed but not running");
            };
            def.remediate = [runner] { startAuditd(*runner); };
            def.mutates = true;
            registry.registerCheck(Check(std::move(def)));
        }
    }
}
