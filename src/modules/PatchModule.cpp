// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "modules/PatchModule.hpp"
#include "core/Errors.hpp"
#include "core/SafeExecutor.hpp"
#include "utils/StringUtils.hpp"

namespace Bulwark::Modules {

    using Core::Category;
    using Core::Check;
    using Core::Finding;

    namespace {
        // yum check-update: 100 = updates available, 0 = none.
        constexpr int YUM_UPDATES_AVAILABLE = 100;
    }

    PatchModule::PatchModule(Core::HostContext context) : ctx(std::move(context)) {}

    std::size_t PatchModule::pendingUpdates(Core::ICommandRunner& runner) {
        if (runner.available("apt")) {
            auto listing = runner.run("apt", {"list", "--upgradable"});
            if (!listing.succeeded()) {
                throw std::runtime_error("apt list --upgradable exited with " +
                                         std::to_string(listing.exitCode));
            }
            std::size_t count = 0;
            for (const auto& line : BulwarkUtils::splitLines(listing.output)) {
                if (line.find("upgradable from") != std::string::npos) ++count;
            }
            return count;
        }

        if (runner.available("yum")) {
            auto listing = runner.run("yum", {"check-update", "-q"});
            if (listing.exitCode == 0) return 0;
            if (listing.exitCode != YUM_UPDATES_AVAILABLE) {
                throw std::runtime_error("yum check-update exited with " +
                                         std::to_string(listing.exitCode));
            }
            std::size_t count = 0;
            for (const auto& line : BulwarkUtils::splitLines(listing.output)) {
                if (!BulwarkUtils::trim(line).empty()) ++count;
            }
            return count;
        }

        throw Core::ToolMissingError("no supported package manager found (apt or yum)");
    }

    void PatchModule::registerChecks(Core::CheckRegistry& registry) const {
        const std::shared_ptr<Core::ICommandRunner> runner = ctx.runner;

        Check::Definition def;
        def.id = "patch.pending_updates";
        def.title = "System updates";
        def.category = Category::PATCHING;
        def.evaluate = [runner] {
            const std::size_t pending = pendingUpdates(*runner);
            if (pending == 0) {
                return Finding::pass("System is up to date");
            }
            return Finding::warn(std::to_string(pending) + " package update(s) available");
        };
        def.remediate = [runner] {
            if (runner->available("apt-get")) {
                Core::runChecked(*runner, "apt-get", {"upgrade", "-y"});
            } else if (runner->available("yum")) {
                Core::runChecked(*runner, "yum", {"update", "-y"});
            } else {
                throw Core::RemediationError("no supported package manager found (apt-get or yum)");
            }
        };
        def.requiresConfirmation = true;
        def.mutates = true;
        registry.registerCheck(Check(std::move(def)));
    }
}
