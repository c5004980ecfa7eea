// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_TEST_SCRATCH_HOST_HPP
#define BULWARK_TEST_SCRATCH_HOST_HPP

#include <string>
#include <vector>
#include <sys/types.h>
#include "core/HostLayout.hpp"

namespace BulwarkTest {

    /**
     * @brief Throwaway directory tree standing in for a host root.
     * Removed on destruction.
     */
    class ScratchHost {
    public:
        ScratchHost();
        ~ScratchHost();

        ScratchHost(const ScratchHost&) = delete;
        ScratchHost& operator=(const ScratchHost&) = delete;

        const std::string& root() const { return rootDir; }

        // Rooted layout; critical files are expected to belong to the test user.
        Bulwark::Core::HostLayout layout() const;

        // Writes content to an absolute path (parents created) and sets mode.
        void write(const std::string& path, const std::string& content, mode_t mode = 0644) const;
        std::string read(const std::string& path) const;
        mode_t modeOf(const std::string& path) const;

        // <procSys>/<key with slashes>
        void setSysctl(const std::string& key, const std::string& value) const;
        std::string sysctl(const std::string& key) const;

        // Backup files created next to path, sorted by name.
        std::vector<std::string> backupsOf(const std::string& path) const;

        /**
         * @brief Files for a host where every file-based check passes:
         * sshd_config, login.defs, passwd, shadow, group, sysctl values.
         */
        void populateCompliant() const;

    private:
        std::string rootDir;
    };
}

#endif
