// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/Check.hpp"
#include "core/Errors.hpp"

#include <stdexcept>
#include <utility>

namespace Bulwark::Core {

    const char* toString(CheckStatus status) {
        switch (status) {
            case CheckStatus::PASS: return "PASS";
            case CheckStatus::WARN: return "WARN";
            case CheckStatus::FAIL: return "FAIL";
        }
        return "UNKNOWN";
    }

    const char* toString(RemediationOutcome outcome) {
        switch (outcome) {
            case RemediationOutcome::NOT_ATTEMPTED: return "not_attempted";
            case RemediationOutcome::APPLIED:       return "applied";
            case RemediationOutcome::DECLINED:      return "declined";
            case RemediationOutcome::FAILED:        return "failed";
        }
        return "unknown";
    }

    const char* toString(ProbeFault fault) {
        switch (fault) {
            case ProbeFault::NONE:              return "none";
            case ProbeFault::TOOL_MISSING:      return "tool_missing";
            case ProbeFault::PERMISSION_DENIED: return "permission_denied";
            case ProbeFault::PROBE_ERROR:       return "probe_error";
        }
        return "unknown";
    }

    const char* toString(Category category) {
        switch (category) {
            case Category::REMOTE_ACCESS:        return "SSH Security Configuration";
            case Category::PERIMETER:            return "Firewall Configuration";
            case Category::PATCHING:             return "System Updates";
            case Category::ACCOUNT_POLICY:       return "Password and Account Policies";
            case Category::FILE_PERMISSIONS:     return "Critical File Permissions";
            case Category::KERNEL_PARAMETERS:    return "Kernel Security Parameters";
            case Category::UNNECESSARY_SERVICES: return "Unnecessary Services";
            case Category::AUDIT_SUBSYSTEM:      return "Audit System Configuration";
        }
        return "Other";
    }

    Finding Finding::of(CheckStatus status, std::string message) {
        Finding f;
        f.status = status;
        f.message = std::move(message);
        return f;
    }

    Finding Finding::pass(std::string message) { return of(CheckStatus::PASS, std::move(message)); }
    Finding Finding::warn(std::string message) { return of(CheckStatus::WARN, std::move(message)); }
    Finding Finding::fail(std::string message) { return of(CheckStatus::FAIL, std::move(message)); }

    Check::Check(Definition definition) : def(std::move(definition)) {
        if (def.id.empty()) {
            throw std::invalid_argument("Check id must not be empty");
        }
        if (!def.evaluate) {
            throw std::invalid_argument("Check " + def.id + " has no probe");
        }
    }

    Finding Check::evaluate() const {
        return def.evaluate();
    }

    void Check::remediate() const {
        if (!def.remediate) {
            throw RemediationError("no remediation available for " + def.id);
        }
        def.remediate();
    }
}
