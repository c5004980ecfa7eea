// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef MODULE_CATALOG_HPP
#define MODULE_CATALOG_HPP

#include "core/CheckRegistry.hpp"
#include "core/HostLayout.hpp"

namespace Bulwark::Core {
    class EventBus;
}

namespace Bulwark::Modules {

    /**
     * @brief Registry with every built-in check, grouped by category in report order:
     * remote access, perimeter, patching, accounts, file permissions, kernel,
     * services, audit. When bus is given, each module announces its checks on it.
     */
    Core::CheckRegistry buildDefaultRegistry(const Core::HostContext& ctx, Core::EventBus* bus = nullptr);
}

#endif
