// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef SYSCTL_MODULE_HPP
#define SYSCTL_MODULE_HPP

#include <string>
#include "core/CheckRegistry.hpp"
#include "core/HostLayout.hpp"

namespace Bulwark::Modules {

    /**
     * @brief Native kernel hardening.
     * Reads and writes the kernel parameters straight through /proc/sys, without
     * the external sysctl binary, and persists them in sysctl.conf.
     */
    class SysctlModule {
    public:
        explicit SysctlModule(Core::HostContext context);

        std::string getName() const { return "SysctlHardening"; }

        void registerChecks(Core::CheckRegistry& registry) const;

        // "net.ipv4.ip_forward" -> "<procSys>/net/ipv4/ip_forward"
        static std::string procPath(const std::string& procSys, const std::string& key);

    private:
        Core::HostContext ctx;
    };
}

#endif
