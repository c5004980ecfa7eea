// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef SSH_MODULE_HPP
#define SSH_MODULE_HPP

#include <string>
#include "core/CheckRegistry.hpp"
#include "core/HostLayout.hpp"

namespace Bulwark::Modules {

    /**
     * @brief sshd_config directives: root login, password auth, protocol,
     * X11 forwarding, auth attempts. One check per directive.
     */
    class SshModule {
    public:
        explicit SshModule(Core::HostContext context);

        std::string getName() const { return "SshHardening"; }

        void registerChecks(Core::CheckRegistry& registry) const;

    private:
        Core::HostContext ctx;
    };
}

#endif
