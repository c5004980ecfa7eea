// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef FILE_PERMISSION_MODULE_HPP
#define FILE_PERMISSION_MODULE_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "core/CheckRegistry.hpp"
#include "core/HostLayout.hpp"

namespace Bulwark::Modules {

    struct WorldWritableScan {
        std::size_t total = 0;
        std::vector<std::string> sample;  // first WORLD_WRITABLE_REPORT_LIMIT paths
        std::size_t unreadable = 0;       // directories the scan could not enter
    };

    class FilePermissionModule {
    public:
        explicit FilePermissionModule(Core::HostContext context);

        std::string getName() const { return "FilePermissions"; }

        void registerChecks(Core::CheckRegistry& registry) const;

        /**
         * @brief Walks roots for world-writable regular files.
         * Symlinks are not followed and the walk never leaves the device of
         * the root it started from. Missing roots are skipped; unreadable
         * directories are skipped and counted.
         */
        static WorldWritableScan scanWorldWritable(const std::vector<std::string>& roots,
                                                   std::size_t sampleLimit);

        // "0644" style rendering of the permission bits.
        static std::string modeString(unsigned mode);

    private:
        Core::HostContext ctx;
    };
}

#endif
