// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "utils/HardeningUtils.hpp"
#include "core/Errors.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace BulwarkUtils {

    using Bulwark::Core::PermissionDeniedError;
    using Bulwark::Core::RemediationError;
    using Bulwark::Core::ToolMissingError;

    std::string readProbeFile(const std::string& path) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            throw ToolMissingError(path + " not found");
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            if (errno == EACCES || errno == EPERM) {
                throw PermissionDeniedError("cannot read " + path + " (root required)");
            }
            throw std::runtime_error("cannot open " + path + ": " + std::strerror(errno));
        }

        std::ostringstream ss;
        ss << file.rdbuf();
        if (file.bad()) {
            throw std::runtime_error("read error on " + path);
        }
        return ss.str();
    }

    void writeConfigFile(const std::string& path, const std::string& content) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw RemediationError("cannot open " + path + " for writing: " + std::strerror(errno));
        }
        file << content;
        file.flush();
        if (!file) {
            throw RemediationError("write to " + path + " failed");
        }
    }

    std::string backupTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);
        std::tm local {};
        localtime_r(&in_time_t, &local);
        std::stringstream ss;
        ss << std::put_time(&local, "%Y%m%d_%H%M%S");
        return ss.str();
    }

    std::string createBackup(const std::string& sourcePath) {
        std::error_code ec;
        if (!fs::is_regular_file(sourcePath, ec)) {
            throw RemediationError("cannot back up " + sourcePath + ": not a regular file");
        }

        const std::string base = sourcePath + ".backup." + backupTimestamp();
        std::string bPath = base;
        for (int n = 1; fs::exists(bPath, ec); ++n) {
            bPath = base + "-" + std::to_string(n);
        }

        if (!fs::copy_file(sourcePath, bPath, fs::copy_options::none, ec)) {
            throw RemediationError("backup of " + sourcePath + " failed: " + ec.message());
        }

        fs::permissions(bPath, fs::perms::owner_read, fs::perm_options::replace, ec);
        if (ec) {
            throw RemediationError("cannot make backup " + bPath + " read-only: " + ec.message());
        }
        return bPath;
    }
}
