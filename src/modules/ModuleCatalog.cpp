// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "modules/ModuleCatalog.hpp"
#include "modules/AccountModule.hpp"
#include "modules/AuditModule.hpp"
#include "modules/FilePermissionModule.hpp"
#include "modules/FirewallModule.hpp"
#include "modules/PatchModule.hpp"
#include "modules/ServiceModule.hpp"
#include "modules/SshModule.hpp"
#include "modules/SysctlModule.hpp"
#include "core/EventBus.hpp"

#include <string>

namespace Bulwark::Modules {

    namespace {
        template <typename Module>
        void add(const Module& module, Core::CheckRegistry& registry, Core::EventBus* bus) {
            const std::size_t before = registry.size();
            module.registerChecks(registry);
            if (bus != nullptr) {
                bus->pushEvent("CATALOG", module.getName() + ": " +
                                          std::to_string(registry.size() - before) + " checks");
            }
        }
    }

    Core::CheckRegistry buildDefaultRegistry(const Core::HostContext& ctx, Core::EventBus* bus) {
        Core::CheckRegistry registry;

        add(SshModule(ctx), registry, bus);
        add(FirewallModule(ctx), registry, bus);
        add(PatchModule(ctx), registry, bus);
        add(AccountModule(ctx), registry, bus);
        add(FilePermissionModule(ctx), registry, bus);
        add(SysctlModule(ctx), registry, bus);
        add(ServiceModule(ctx), registry, bus);
        add(AuditModule(ctx), registry, bus);

        return registry;
    }
}
