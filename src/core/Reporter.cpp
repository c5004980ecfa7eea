// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/Reporter.hpp"

#include <algorithm>
#include <ostream>
#include <string>

namespace Bulwark::Core {

    namespace {

        struct Palette {
            const char* red;
            const char* green;
            const char* yellow;
            const char* blue;
            const char* reset;
        };

        Palette palette(bool colour) {
            if (!colour) return {"", "", "", "", ""};
            return {"\033[0;31m", "\033[0;32m", "\033[1;33m", "\033[0;34m", "\033[0m"};
        }

        int rank(CheckStatus s) {
            switch (s) {
                case CheckStatus::PASS: return 0;
                case CheckStatus::WARN: return 1;
                case CheckStatus::FAIL: return 2;
            }
            return 0;
        }

        const char* statusColour(CheckStatus s, const Palette& p) {
            switch (s) {
                case CheckStatus::PASS: return p.green;
                case CheckStatus::WARN: return p.yellow;
                case CheckStatus::FAIL: return p.red;
            }
            return p.reset;
        }

        void header(std::ostream& out, const std::string& title, const Palette& p) {
            const std::string rule(51, '=');
            out << "\n" << p.blue << rule << p.reset << "\n"
                << p.blue << title << p.reset << "\n"
                << p.blue << rule << p.reset << "\n\n";
        }
    }

    CheckStatus Reporter::worstOf(const std::vector<CheckResult>& results) {
        CheckStatus worst = CheckStatus::PASS;
        for (const auto& r : results) {
            if (rank(r.status) > rank(worst)) worst = r.status;
        }
        return worst;
    }

    RunReport Reporter::summarize(std::vector<CheckResult> results) {
        RunReport report;
        for (const auto& r : results) {
            switch (r.status) {
                case CheckStatus::PASS: ++report.passCount; break;
                case CheckStatus::WARN: ++report.warnCount; break;
                case CheckStatus::FAIL: ++report.failCount; break;
            }
            switch (r.remediation) {
                case RemediationOutcome::APPLIED:  ++report.appliedCount; break;
                case RemediationOutcome::DECLINED: ++report.declinedCount; break;
                case RemediationOutcome::FAILED:   ++report.failedRemediationCount; break;
                case RemediationOutcome::NOT_ATTEMPTED: break;
            }
        }
        report.runStatus = worstOf(results);
        report.results = std::move(results);
        return report;
    }

    void Reporter::renderHeader(std::ostream& out, Mode mode, bool privileged, bool colour) const {
        const Palette p = palette(colour);
        header(out, "System Security Hardening Tool", p);

        if (mode == Mode::AUDIT) {
            out << p.blue << "Mode: AUDIT ONLY (no changes will be made)" << p.reset << "\n";
            out << p.blue << "[INFO]" << p.reset
                << " Audit mode reads system state only; it does NOT change anything\n";
        } else {
            out << p.yellow << "Mode: APPLY (changes WILL be made to the system)" << p.reset << "\n";
            out << p.yellow << "[NOTE]" << p.reset
                << " Apply mode modifies system configuration, services, and settings\n";
            out << p.yellow << "[NOTE]" << p.reset
                << " SSH/firewall updates can block access; review prompts carefully\n";
        }

        if (!privileged && mode == Mode::AUDIT) {
            out << p.yellow << "[NOTE]" << p.reset
                << " Not running as root - some checks may be limited\n";
        }
        out << "\n";
    }

    void Reporter::render(const RunReport& report, Mode mode, std::ostream& out, bool colour) const {
        const Palette p = palette(colour);

        std::vector<Category> order;
        for (const auto& r : report.results) {
            if (std::find(order.begin(), order.end(), r.category) == order.end()) {
                order.push_back(r.category);
            }
        }

        for (Category category : order) {
            header(out, toString(category), p);
            for (const auto& r : report.results) {
                if (r.category != category) continue;

                out << statusColour(r.status, p) << "[" << toString(r.status) << "]" << p.reset
                    << " " << r.title << ": " << r.message << "\n";

                if (r.remediationAttempted()) {
                    const char* c = r.remediation == RemediationOutcome::APPLIED ? p.green
                                  : r.remediation == RemediationOutcome::FAILED  ? p.red
                                                                                 : p.yellow;
                    out << "       -> " << c << toString(r.remediation) << p.reset << "\n";
                }
            }
        }

        header(out, "Security Hardening Summary", p);
        out << p.green << "Passed checks:" << p.reset << " " << report.passCount << "\n";
        out << p.red << "Failed checks:" << p.reset << " " << report.failCount << "\n";
        out << p.yellow << "Warnings:" << p.reset << " " << report.warnCount << "\n";

        if (mode == Mode::APPLY) {
            out << p.green << "Changes applied:" << p.reset << " " << report.appliedCount << "\n";
            if (report.declinedCount > 0) {
                out << p.yellow << "Changes declined:" << p.reset << " " << report.declinedCount << "\n";
            }
            if (report.failedRemediationCount > 0) {
                out << p.red << "Changes failed:" << p.reset << " " << report.failedRemediationCount << "\n";
            }
            out << "\n";
            out << p.blue << "[INFO]" << p.reset << " Some changes may require a system restart to take full effect\n";
            out << p.blue << "[INFO]" << p.reset << " SSH configuration changes require: systemctl restart sshd\n";
        } else {
            out << "\n";
            out << p.blue << "[INFO]" << p.reset << " Run with --apply to automatically fix issues\n";
        }

        out << "\n";
        switch (report.runStatus) {
            case CheckStatus::FAIL:
                out << p.red << "Security hardening is needed!" << p.reset << "\n";
                break;
            case CheckStatus::WARN:
                out << p.yellow << "Security is good but could be improved" << p.reset << "\n";
                break;
            case CheckStatus::PASS:
                out << p.green << "System security posture is strong!" << p.reset << "\n";
                break;
        }
    }
}
