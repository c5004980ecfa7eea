// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#pragma once

namespace Bulwark::Core {

enum class PrivilegeLevel {
    None,
    Root
};

struct PrivilegeContext {
    PrivilegeLevel level = PrivilegeLevel::None;

    const char* reason = nullptr;

    bool isRoot() const { return level == PrivilegeLevel::Root; }

    // From the effective uid of this process.
    static PrivilegeContext detect();
};

} // namespace Bulwark::Core
