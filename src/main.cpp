// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

#include "core/BackupLedger.hpp"
#include "core/Confirmation.hpp"
#include "core/Engine.hpp"
#include "core/Errors.hpp"
#include "core/EventBus.hpp"
#include "core/HostLayout.hpp"
#include "core/ModeController.hpp"
#include "core/Reporter.hpp"
#include "core/SafeExecutor.hpp"
#include "modules/ModuleCatalog.hpp"
#include "utils/ExecPolicyRegistry.hpp"
#include "utils/Initializer.hpp"

using namespace Bulwark;

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "bulwark";

    Init::purgeUnsafeEnvironment();

    Core::Invocation invocation;
    try {
        invocation = Core::ModeController::parseArguments(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const Core::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "Try '" << program << " --help' for more information." << std::endl;
        return 2;
    }

    if (invocation.showHelp) {
        std::cout << Core::ModeController::usage(program);
        return 0;
    }

    const Core::HostLayout layout = Core::HostLayout::fromEnvironment();
    try {
        Core::ModeController::requireLiveHost(invocation.mode, layout);
    } catch (const Core::UsageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    const Core::PrivilegeContext privilege = Core::PrivilegeContext::detect();
    try {
        Core::ModeController::requirePrivilege(invocation.mode, privilege);
    } catch (const Core::PrivilegeError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    // Diagnostics go to stderr; stdout carries only the report.
    Core::EventBus bus;
    bus.subscribe([](const Core::EngineEvent& ev) {
        std::cerr << "[" << ev.source << "] " << ev.payload << std::endl;
    });

    Security::ExecPolicyRegistry::instance().initDefaults();

    Core::HostContext ctx;
    ctx.layout = layout;
    ctx.runner = std::make_shared<Core::SafeExecutor>(&bus);
    ctx.privileged = privilege.isRoot();

    const Core::CheckRegistry registry = Modules::buildDefaultRegistry(ctx, &bus);

    std::unique_ptr<Core::IConfirmation> confirmation;
    if (isatty(STDIN_FILENO)) {
        confirmation = std::make_unique<Core::TerminalConfirmation>(std::cin, std::cerr);
    } else {
        bus.pushEvent("MODE", "stdin is not a terminal; confirmations will be declined");
        confirmation = std::make_unique<Core::PresetConfirmation>(Core::Decision::DECLINE);
    }

    Core::BackupLedger backups(bus);
    const bool colour = isatty(STDOUT_FILENO);

    Core::Reporter reporter;
    reporter.renderHeader(std::cout, invocation.mode, privilege.isRoot(), colour);
    std::cout.flush();

    Core::Engine engine(registry, bus, *confirmation, backups);
    const Core::RunReport report = engine.run(invocation.mode);

    reporter.render(report, invocation.mode, std::cout, colour);
    return report.exitCode();
}
