// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/ModeController.hpp"
#include "core/Errors.hpp"
#include "utils/Initializer.hpp"

#include <optional>
#include <sstream>

namespace Bulwark::Core {

    const char* toString(Mode mode) {
        return mode == Mode::APPLY ? "APPLY" : "AUDIT";
    }

    PrivilegeContext PrivilegeContext::detect() {
        PrivilegeContext ctx;
        if (Init::isRoot()) {
            ctx.level = PrivilegeLevel::Root;
            ctx.reason = "effective uid 0";
        } else {
            ctx.reason = "effective uid is not 0";
        }
        return ctx;
    }

    Invocation ModeController::parseArguments(const std::vector<std::string>& args) {
        Invocation inv;
        std::optional<Mode> requested;

        for (const auto& arg : args) {
            if (arg == "--help" || arg == "-h") {
                inv.showHelp = true;
                continue;
            }

            Mode flag;
            if (arg == "--audit") {
                flag = Mode::AUDIT;
            } else if (arg == "--apply") {
                flag = Mode::APPLY;
            } else {
                throw UsageError("Unknown option: " + arg);
            }

            if (requested && *requested != flag) {
                throw UsageError("--audit and --apply are mutually exclusive");
            }
            requested = flag;
        }

        if (requested) inv.mode = *requested;
        return inv;
    }

    void ModeController::requirePrivilege(Mode mode, const PrivilegeContext& privilege) {
        if (mode == Mode::APPLY && !privilege.isRoot()) {
            throw PrivilegeError("--apply must be run as root");
        }
    }

    void ModeController::requireLiveHost(Mode mode, const HostLayout& layout) {
        if (mode == Mode::APPLY && layout.isRooted()) {
            throw UsageError("--apply cannot be used with BULWARK_ROOT (" + layout.root +
                             "); a rooted layout can only be audited");
        }
    }

    std::string ModeController::usage(const std::string& program) {
        std::ostringstream os;
        os << "Bulwark - System Security Hardening Tool\n"
           << "\n"
           << "Usage: " << program << " [--audit|--apply|--help]\n"
           << "\n"
           << "Options:\n"
           << "    --audit     Audit security settings without making changes (default)\n"
           << "    --apply     Apply security hardening measures (requires root)\n"
           << "    --help      Display this help message\n"
           << "\n"
           << "In --audit mode only system state is read; nothing is changed.\n"
           << "In --apply mode failing checks are remediated:\n"
           << "  - SSH configuration: /etc/ssh/sshd_config\n"
           << "  - Firewall state: ufw or firewalld\n"
           << "  - System updates: apt/yum upgrade (asks first)\n"
           << "  - Account locks: empty-password and extra UID 0 accounts\n"
           << "  - File permissions: /etc/passwd, /etc/shadow, /etc/group\n"
           << "  - Kernel parameters: /proc/sys runtime + /etc/sysctl.conf\n"
           << "  - Services: start/enable auditd, stop/disable risky services\n"
           << "Every file is backed up to <file>.backup.<timestamp> before it is changed.\n"
           << "\n"
           << "What can break or need follow-up:\n"
           << "  - SSH access can be lost if settings conflict with your login method\n"
           << "  - Firewall changes can block required ports/traffic\n"
           << "  - Kernel tuning can affect routing, containers, or networking\n"
           << "  - Updates can require reboot or service restarts\n"
           << "  - Disabling services can impact dependent applications\n"
           << "\n"
           << "Environment:\n"
           << "    BULWARK_ROOT  audit files under this directory instead of / (not with --apply)\n"
           << "\n"
           << "Exit status: 0 when no check is FAIL, 1 otherwise, 2 on usage or privilege errors.\n";
        return os.str();
    }
}
