// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef FIREWALL_MODULE_HPP
#define FIREWALL_MODULE_HPP

#include <string>
#include "core/CheckRegistry.hpp"
#include "core/HostLayout.hpp"

namespace Bulwark::Modules {

    enum class FirewallFrontend { UFW, FIREWALLD, IPTABLES, NONE };

    /**
     * @brief Perimeter firewall. ufw is preferred, then firewalld; a bare
     * iptables binary cannot be judged and is left for manual review.
     */
    class FirewallModule {
    public:
        explicit FirewallModule(Core::HostContext context);

        std::string getName() const { return "FirewallStatus"; }

        void registerChecks(Core::CheckRegistry& registry) const;

        static FirewallFrontend detect(const Core::ICommandRunner& runner);

    private:
        Core::HostContext ctx;
    };
}

#endif
