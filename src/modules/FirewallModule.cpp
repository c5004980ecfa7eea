// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "modules/FirewallModule.hpp"
#include "core/Errors.hpp"
#include "core/SafeExecutor.hpp"

namespace Bulwark::Modules {

    using Core::Category;
    using Core::Check;
    using Core::Finding;

    namespace {

        Finding probeFirewall(Core::ICommandRunner& runner) {
            switch (FirewallModule::detect(runner)) {
                case FirewallFrontend::UFW: {
                    auto status = runner.run("ufw", {"status"});
                    if (!status.succeeded()) {
                        throw Core::PermissionDeniedError("ufw status failed (root required)");
                    }
                    if (status.output.find("Status: active") != std::string::npos) {
                        return Finding::pass("UFW firewall is active");
                    }
                    return Finding::fail("UFW is installed but not active");
                }
                case FirewallFrontend::FIREWALLD: {
                    auto status = runner.run("systemctl", {"is-active", "--quiet", "firewalld"});
                    if (status.succeeded()) {
                        return Finding::pass("firewalld is active");
                    }
                    return Finding::fail("firewalld is installed but not active");
                }
                case FirewallFrontend::IPTABLES:
                    return Finding::warn("iptables is available but status unclear - manual review recommended")
                        .manualOnly();
                case FirewallFrontend::NONE:
                    break;
            }
            return Finding::fail("No firewall detected (install ufw or firewalld)").manualOnly();
        }

        void enableFirewall(Core::ICommandRunner& runner) {
            switch (FirewallModule::detect(runner)) {
                case FirewallFrontend::UFW:
                    Core::runChecked(runner, "ufw", {"--force", "enable"});
                    return;
                case FirewallFrontend::FIREWALLD:
                    Core::runChecked(runner, "systemctl", {"start", "firewalld"});
                    Core::runChecked(runner, "systemctl", {"enable", "firewalld"});
                    return;
                case FirewallFrontend::IPTABLES:
                case FirewallFrontend::NONE:
                    break;
            }
            throw Core::RemediationError("no firewall frontend that can be enabled automatically");
        }
    }

    FirewallModule::FirewallModule(Core::HostContext context) : ctx(std::move(context)) {}

    FirewallFrontend FirewallModule::detect(const Core::ICommandRunner& runner) {
        if (runner.available("ufw")) return FirewallFrontend::UFW;
        if (runner.available("firewall-cmd") || runner.available("firewalld")) return FirewallFrontend::FIREWALLD;
        if (runner.available("iptables")) return FirewallFrontend::IPTABLES;
        return FirewallFrontend::NONE;
    }

    void FirewallModule::registerChecks(Core::CheckRegistry& registry) const {
        const std::shared_ptr<Core::ICommandRunner> runner = ctx.runner;

        Check::Definition def;
        def.id = "firewall.active";
        def.title = "Firewall status";
        def.category = Category::PERIMETER;
        def.evaluate = [runner] { return probeFirewall(*runner); };
        def.remediate = [runner] { enableFirewall(*runner); };
        def.mutates = true;
        registry.registerCheck(Check(std::move(def)));
    }
}
