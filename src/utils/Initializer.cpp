// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "utils/Initializer.hpp"
#include "utils/ConfigTemplates.hpp"

#include <cstdlib>
#include <unistd.h>

namespace Bulwark::Init {

    void purgeUnsafeEnvironment() {
        for (const auto& name : BulwarkTemplates::UNSAFE_ENV_VARS) {
            unsetenv(name.c_str());
        }
        setenv("PATH", BulwarkTemplates::TRUSTED_PATH.c_str(), 1);
    }

    bool isRoot() {
        return geteuid() == 0;
    }
}
