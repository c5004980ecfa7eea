// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_INITIALIZER_HPP
#define BULWARK_INITIALIZER_HPP

namespace Bulwark::Init {
    /**
     * @brief True when the effective uid is root.
     */
    bool isRoot();

    /**
     * @brief Removes loader/interpreter injection variables and pins PATH to
     * the trusted directories before any external tool is executed.
     */
    void purgeUnsafeEnvironment();
}

#endif
