// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "modules/ServiceModule.hpp"
#include "core/SafeExecutor.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/StringUtils.hpp"

#include <sstream>

namespace Bulwark::Modules {

    using Core::Category;
    using Core::Check;
    using Core::Finding;

    namespace {

        // First column of `systemctl list-unit-files --no-legend`.
        std::vector<std::string> unitNames(const std::string& listing) {
            std::vector<std::string> units;
            for (const auto& line : BulwarkUtils::splitLines(listing)) {
                std::istringstream fields(line);
                std::string unit;
                if (fields >> unit) units.push_back(unit);
            }
            return units;
        }

        bool hasUnitFile(const std::vector<std::string>& units, const std::string& service) {
            for (const auto& unit : units) {
                if (BulwarkUtils::startsWith(unit, service + ".") ||
                    BulwarkUtils::startsWith(unit, service + "@")) {
                    return true;
                }
            }
            return false;
        }
    }

    ServiceModule::ServiceModule(Core::HostContext context) : ctx(std::move(context)) {}

    std::vector<std::string> ServiceModule::activeRiskyServices(Core::ICommandRunner& runner) {
        auto listing = runner.run("systemctl", {"list-unit-files", "--no-legend", "--no-pager"});
        if (!listing.succeeded()) {
            throw std::runtime_error("systemctl list-unit-files exited with " +
                                     std::to_string(listing.exitCode));
        }
        const auto units = unitNames(listing.output);

        std::vector<std::string> active;
        for (const auto& service : BulwarkTemplates::RISKY_SERVICES) {
            if (!hasUnitFile(units, service)) continue;
            if (runner.run("systemctl", {"is-active", "--quiet", service}).succeeded()) {
                active.push_back(service);
            }
        }
        return active;
    }

    void ServiceModule::registerChecks(Core::CheckRegistry& registry) const {
        const std::shared_ptr<Core::ICommandRunner> runner = ctx.runner;

        Check::Definition def;
        def.id = "services.risky";
        def.title = "Unnecessary network services";
        def.category = Category::UNNECESSARY_SERVICES;
        def.evaluate = [runner] {
            const auto active = activeRiskyServices(*runner);
            if (active.empty()) {
                return Finding::pass("No risky services are running");
            }
            return Finding::fail("Risky services are running: " + BulwarkUtils::join(active, ", "));
        };
        def.remediate = [runner] {
            for (const auto& service : activeRiskyServices(*runner)) {
                Core::runChecked(*runner, "systemctl", {"stop", service});
                Core::runChecked(*runner, "systemctl", {"disable", service});
            }
        };
        def.mutates = true;
        registry.registerCheck(Check(std::move(def)));
    }
}
