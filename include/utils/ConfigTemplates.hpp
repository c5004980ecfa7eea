// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef CONFIGTEMPLATES_HPP
#define CONFIGTEMPLATES_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <sys/types.h>
#include "core/Check.hpp"

namespace BulwarkTemplates {

    // Only these directories are searched for external tools; PATH is forced to match.
    extern const std::vector<std::string> TRUSTED_EXEC_DIRS;
    extern const std::string TRUSTED_PATH;

    // Environment variables removed before anything runs.
    extern const std::vector<std::string> UNSAFE_ENV_VARS;

    // Kernel hardening baseline (net.ipv4.*).
    struct SysctlExpectation {
        std::string checkId;
        std::string title;
        std::string key;                      // dotted sysctl name, probed
        std::string expected;
        std::vector<std::string> companions;  // also set on remediation
        Bulwark::Core::CheckStatus severity;
        std::string passMessage;
        std::string failMessage;
    };
    extern const std::vector<SysctlExpectation> SYSCTL_BASELINE;

    // Critical account databases.
    struct FileModeExpectation {
        std::string checkId;
        std::string title;
        std::string hostPathKey;              // "passwd", "shadow" or "group"
        std::vector<mode_t> acceptedModes;
        mode_t remediationMode;
    };
    extern const std::vector<FileModeExpectation> FILE_MODE_BASELINE;

    extern const std::vector<std::string> RISKY_SERVICES;

    extern const int PASS_MAX_DAYS_LIMIT;
    extern const int SSH_MAX_AUTH_TRIES;
    extern const std::size_t WORLD_WRITABLE_REPORT_LIMIT;
}

#endif
