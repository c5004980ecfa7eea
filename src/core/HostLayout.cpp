// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/HostLayout.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace Bulwark::Core {

    namespace {
        std::string rebase(const std::string& prefix, const std::string& path) {
            return (fs::path(prefix) / fs::path(path).relative_path()).string();
        }
    }

    HostLayout HostLayout::live() {
        return HostLayout{};
    }

    HostLayout HostLayout::rootedAt(const std::string& prefix) {
        HostLayout layout;
        layout.root = prefix;
        layout.sshdConfig = rebase(prefix, layout.sshdConfig);
        layout.loginDefs  = rebase(prefix, layout.loginDefs);
        layout.passwd     = rebase(prefix, layout.passwd);
        layout.shadow     = rebase(prefix, layout.shadow);
        layout.group      = rebase(prefix, layout.group);
        layout.sysctlConf = rebase(prefix, layout.sysctlConf);
        layout.procSys    = rebase(prefix, layout.procSys);
        for (auto& dir : layout.worldWritableRoots) {
            dir = rebase(prefix, dir);
        }
        return layout;
    }

    std::string HostLayout::hostPath(const std::string& path) const {
        return isRooted() ? rebase(root, path) : path;
    }

    HostLayout HostLayout::fromEnvironment() {
        const char* root = std::getenv("BULWARK_ROOT");
        if (root != nullptr && *root != '\0') {
            return rootedAt(root);
        }
        return live();
    }
}
