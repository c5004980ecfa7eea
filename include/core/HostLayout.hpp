// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_HOST_LAYOUT_HPP
#define BULWARK_HOST_LAYOUT_HPP

#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

namespace Bulwark::Core {

    class ICommandRunner;

    /**
     * @brief Every filesystem location the checks read or write.
     */
    struct HostLayout {
        std::string sshdConfig = "/etc/ssh/sshd_config";
        std::string loginDefs  = "/etc/login.defs";
        std::string passwd     = "/etc/passwd";
        std::string shadow     = "/etc/shadow";
        std::string group      = "/etc/group";
        std::string sysctlConf = "/etc/sysctl.conf";
        std::string procSys    = "/proc/sys";
        std::vector<std::string> worldWritableRoots = {"/etc", "/usr", "/bin", "/sbin"};

        // Required owner of passwd/shadow/group.
        uid_t criticalFileOwner = 0;

        // Prefix set by rootedAt(); empty for the live host.
        std::string root;

        bool isRooted() const { return !root.empty(); }

        /**
         * @brief Maps an absolute host path (as named inside a config file)
         * to where it lives in this layout.
         */
        std::string hostPath(const std::string& path) const;

        static HostLayout live();

        /**
         * @brief Same layout with every path rebased under prefix.
         */
        static HostLayout rootedAt(const std::string& prefix);

        /**
         * @brief live(), or rootedAt($BULWARK_ROOT) when that variable is set.
         */
        static HostLayout fromEnvironment();
    };

    /**
     * @brief What a check module needs to probe and remediate a host.
     */
    struct HostContext {
        HostLayout layout;
        std::shared_ptr<ICommandRunner> runner;
        bool privileged = false;
    };
}

#endif
