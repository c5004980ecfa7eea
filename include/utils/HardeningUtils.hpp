// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef HARDENINGUTILS_HPP
#define HARDENINGUTILS_HPP

#include <string>

namespace BulwarkUtils {

    /**
     * @brief Reads a whole file for a probe.
     * Throws ToolMissingError if it does not exist, PermissionDeniedError if it
     * cannot be opened for lack of privilege.
     */
    std::string readProbeFile(const std::string& path);

    /**
     * @brief Replaces the content of path in place (mode and owner are kept;
     * the file is created if absent). Throws RemediationError.
     */
    void writeConfigFile(const std::string& path, const std::string& content);

    /**
     * @brief Read-only snapshot of path next to it:
     * <path>.backup.<YYYYmmdd_HHMMSS>[-n], mode 0400.
     * Returns the backup path. Throws RemediationError.
     */
    std::string createBackup(const std::string& sourcePath);

    // Timestamp used in backup names.
    std::string backupTimestamp();
}

#endif
