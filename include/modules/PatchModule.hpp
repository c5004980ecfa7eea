// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef PATCH_MODULE_HPP
#define PATCH_MODULE_HPP

#include <cstddef>
#include <string>
#include "core/CheckRegistry.hpp"
#include "core/HostLayout.hpp"

namespace Bulwark::Modules {

    class PatchModule {
    public:
        explicit PatchModule(Core::HostContext context);

        std::string getName() const { return "PatchManagement"; }

        void registerChecks(Core::CheckRegistry& registry) const;

        /**
         * @brief Number of pending upgrades reported by apt, else yum.
         * Throws ToolMissingError when neither is installed. The package
         * index is not refreshed.
         */
        static std::size_t pendingUpdates(Core::ICommandRunner& runner);

    private:
        Core::HostContext ctx;
    };
}

#endif
