// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef SERVICE_MODULE_HPP
#define SERVICE_MODULE_HPP

#include <string>
#include <vector>
#include "core/CheckRegistry.hpp"
#include "core/HostLayout.hpp"

namespace Bulwark::Modules {

    /**
     * @brief Legacy cleartext services (telnet, rsh, rlogin, ftp) managed by systemd.
     */
    class ServiceModule {
    public:
        explicit ServiceModule(Core::HostContext context);

        std::string getName() const { return "ServiceHardening"; }

        void registerChecks(Core::CheckRegistry& registry) const;

        // Risky services that have a unit file and are active, in baseline order.
        static std::vector<std::string> activeRiskyServices(Core::ICommandRunner& runner);

    private:
        Core::HostContext ctx;
    };
}

#endif
