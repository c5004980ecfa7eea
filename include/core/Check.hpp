// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_CHECK_HPP
#define BULWARK_CHECK_HPP

#include <functional>
#include <string>
#include <vector>

namespace Bulwark::Core {

    enum class CheckStatus { PASS, WARN, FAIL };

    enum class RemediationOutcome { NOT_ATTEMPTED, APPLIED, DECLINED, FAILED };

    // Why a probe could not reach a verdict. NONE means the verdict is trustworthy.
    enum class ProbeFault { NONE, TOOL_MISSING, PERMISSION_DENIED, PROBE_ERROR };

    enum class Category {
        REMOTE_ACCESS,
        PERIMETER,
        PATCHING,
        ACCOUNT_POLICY,
        FILE_PERMISSIONS,
        KERNEL_PARAMETERS,
        UNNECESSARY_SERVICES,
        AUDIT_SUBSYSTEM
    };

    const char* toString(CheckStatus status);
    const char* toString(RemediationOutcome outcome);
    const char* toString(ProbeFault fault);
    const char* toString(Category category);

    /**
     * @brief What a probe returns: status plus a human message.
     *
     * actionable == false means a remediation must not be attempted even if the
     * check has one (e.g. the firewall frontend could not be identified).
     */
    struct Finding {
        CheckStatus status = CheckStatus::PASS;
        std::string message;
        ProbeFault fault = ProbeFault::NONE;
        bool actionable = true;

        static Finding pass(std::string message);
        static Finding warn(std::string message);
        static Finding fail(std::string message);
        static Finding of(CheckStatus status, std::string message);

        Finding& manualOnly() {
            actionable = false;
            return *this;
        }
    };

    struct CheckResult {
        std::string checkId;
        std::string title;
        Category category = Category::REMOTE_ACCESS;
        CheckStatus status = CheckStatus::PASS;
        std::string message;
        ProbeFault fault = ProbeFault::NONE;
        bool actionable = true;
        RemediationOutcome remediation = RemediationOutcome::NOT_ATTEMPTED;

        bool inconclusive() const { return fault != ProbeFault::NONE; }
        bool remediationAttempted() const { return remediation != RemediationOutcome::NOT_ATTEMPTED; }
    };

    /**
     * @brief One security property: a read-only probe and an optional remediation.
     *
     * Immutable once constructed. The probe must not write system state; the
     * remediation throws on failure.
     */
    class Check {
    public:
        using Probe = std::function<Finding()>;
        using Action = std::function<void()>;

        struct Definition {
            std::string id;
            std::string title;
            Category category = Category::REMOTE_ACCESS;
            Probe evaluate;
            Action remediate;
            bool requiresConfirmation = false;
            bool mutates = false;
            // Files the remediation writes; each is backed up before the first write.
            std::vector<std::string> targetFiles;
        };

        explicit Check(Definition definition);

        const std::string& id() const { return def.id; }
        const std::string& title() const { return def.title; }
        Category category() const { return def.category; }
        bool requiresConfirmation() const { return def.requiresConfirmation; }
        bool mutates() const { return def.mutates; }
        const std::vector<std::string>& targetFiles() const { return def.targetFiles; }
        bool hasRemediation() const { return static_cast<bool>(def.remediate); }

        Finding evaluate() const;
        void remediate() const;

    private:
        Definition def;
    };
}

#endif
