// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef ACCOUNT_MODULE_HPP
#define ACCOUNT_MODULE_HPP

#include <set>
#include <string>
#include <vector>
#include "core/CheckRegistry.hpp"
#include "core/HostLayout.hpp"

namespace Bulwark::Modules {

    /**
     * @brief Account policy: password ageing, empty passwords, extra UID 0 accounts.
     */
    class AccountModule {
    public:
        explicit AccountModule(Core::HostContext context);

        std::string getName() const { return "AccountPolicy"; }

        void registerChecks(Core::CheckRegistry& registry) const;

        // Accounts whose shadow password field is empty.
        static std::vector<std::string> emptyPasswordAccounts(const std::string& shadowText);

        // Accounts other than root with UID 0 in passwd.
        static std::vector<std::string> extraRootAccounts(const std::string& passwdText);

        // Accounts whose shadow hash starts with '!' or '*'.
        static std::set<std::string> lockedAccounts(const std::string& shadowText);

    private:
        Core::HostContext ctx;
    };
}

#endif
