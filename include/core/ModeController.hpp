// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_MODE_CONTROLLER_HPP
#define BULWARK_MODE_CONTROLLER_HPP

#include <string>
#include <vector>
#include "core/HostLayout.hpp"
#include "core/PrivilegeContext.hpp"

namespace Bulwark::Core {

    enum class Mode { AUDIT, APPLY };

    const char* toString(Mode mode);

    struct Invocation {
        Mode mode = Mode::AUDIT;
        bool showHelp = false;
    };

    /**
     * @brief Resolves the run mode once, at startup.
     *
     * AUDIT is the default. APPLY is entered only through an explicit flag and
     * only with root; there is no fallback from a refused APPLY to AUDIT.
     */
    class ModeController {
    public:
        /**
         * @brief Parses argv[1..]. Throws UsageError on unknown options or on
         * --audit combined with --apply.
         */
        static Invocation parseArguments(const std::vector<std::string>& args);

        /**
         * @brief Throws PrivilegeError when mode is APPLY without root.
         */
        static void requirePrivilege(Mode mode, const PrivilegeContext& privilege);

        /**
         * @brief Throws UsageError when mode is APPLY against a rooted layout.
         * Remediation commands (passwd, systemctl, package managers) always act
         * on the running host, so a rooted layout is inspection only.
         */
        static void requireLiveHost(Mode mode, const HostLayout& layout);

        static std::string usage(const std::string& program);
    };
}

#endif
