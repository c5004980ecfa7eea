// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "modules/FilePermissionModule.hpp"
#include "core/Errors.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/StringUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Bulwark::Modules {

    using Core::Category;
    using Core::Check;
    using Core::Finding;
    using BulwarkTemplates::FileModeExpectation;

    namespace {

        std::string hostPath(const Core::HostLayout& layout, const std::string& key) {
            if (key == "passwd") return layout.passwd;
            if (key == "shadow") return layout.shadow;
            if (key == "group") return layout.group;
            throw std::invalid_argument("unknown host path key: " + key);
        }

        struct stat statCritical(const std::string& path) {
            struct stat st {};
            if (stat(path.c_str(), &st) != 0) {
                if (errno == ENOENT) {
                    throw Core::ToolMissingError(path + " not found");
                }
                if (errno == EACCES) {
                    throw Core::PermissionDeniedError("cannot stat " + path);
                }
                throw std::runtime_error("stat " + path + ": " + std::strerror(errno));
            }
            return st;
        }

        std::string acceptedList(const FileModeExpectation& rule) {
            std::vector<std::string> modes;
            for (mode_t m : rule.acceptedModes) {
                modes.push_back(FilePermissionModule::modeString(m));
            }
            return BulwarkUtils::join(modes, ", ");
        }

        Finding probeMode(const std::string& path, uid_t owner, const FileModeExpectation& rule) {
            const struct stat st = statCritical(path);
            const mode_t mode = st.st_mode & 07777;
            const bool modeOk = std::find(rule.acceptedModes.begin(), rule.acceptedModes.end(), mode)
                                != rule.acceptedModes.end();

            if (!modeOk) {
                return Finding::fail(path + " has incorrect permissions: " +
                                     FilePermissionModule::modeString(mode) + " (should be " +
                                     acceptedList(rule) + ")");
            }
            if (st.st_uid != owner) {
                return Finding::fail(path + " is owned by uid " + std::to_string(st.st_uid) +
                                     " (should be " + std::to_string(owner) + ")");
            }
            return Finding::pass(path + " has correct permissions (" +
                                 FilePermissionModule::modeString(mode) + ")");
        }

        void applyMode(const std::string& path, uid_t owner, const FileModeExpectation& rule) {
            const struct stat st = statCritical(path);

            if (st.st_uid != owner && chown(path.c_str(), owner, static_cast<gid_t>(-1)) != 0) {
                throw Core::RemediationError("chown " + path + ": " + std::strerror(errno));
            }
            // chown may clear setuid/setgid bits, so the mode is set afterwards.
            if (chmod(path.c_str(), rule.remediationMode) != 0) {
                throw Core::RemediationError("chmod " + path + ": " + std::strerror(errno));
            }
        }
    }

    FilePermissionModule::FilePermissionModule(Core::HostContext context) : ctx(std::move(context)) {}

    std::string FilePermissionModule::modeString(unsigned mode) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%03o", mode & 07777);
        return buf;
    }

    WorldWritableScan FilePermissionModule::scanWorldWritable(const std::vector<std::string>& roots,
                                                              std::size_t sampleLimit) {
        WorldWritableScan scan;

        for (const auto& root : roots) {
            struct stat rootStat {};
            if (lstat(root.c_str(), &rootStat) != 0 || !S_ISDIR(rootStat.st_mode)) continue;
            if (access(root.c_str(), R_OK | X_OK) != 0) {
                ++scan.unreadable;
                continue;
            }

            std::error_code ec;
            fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
            if (ec) continue;

            for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (ec) {
                    ec.clear();
                    continue;
                }
                struct stat st {};
                if (lstat(it->path().c_str(), &st) != 0) continue;

                if (S_ISDIR(st.st_mode)) {
                    if (st.st_dev != rootStat.st_dev) {
                        it.disable_recursion_pending();
                    } else if (access(it->path().c_str(), R_OK | X_OK) != 0) {
                        ++scan.unreadable;
                        it.disable_recursion_pending();
                    }
                    continue;
                }
                if (S_ISREG(st.st_mode) && (st.st_mode & S_IWOTH)) {
                    ++scan.total;
                    if (scan.sample.size() < sampleLimit) {
                        scan.sample.push_back(it->path().string());
                    }
                }
            }
        }
        return scan;
    }

    void FilePermissionModule::registerChecks(Core::CheckRegistry& registry) const {
        const uid_t owner = ctx.layout.criticalFileOwner;

        for (const auto& rule : BulwarkTemplates::FILE_MODE_BASELINE) {
            const std::string path = hostPath(ctx.layout, rule.hostPathKey);

            Check::Definition def;
            def.id = rule.checkId;
            def.title = rule.title;
            def.category = Category::FILE_PERMISSIONS;
            def.evaluate = [path, owner, rule] { return probeMode(path, owner, rule); };
            def.remediate = [path, owner, rule] { applyMode(path, owner, rule); };
            def.mutates = true;
            def.targetFiles = {path};
            registry.registerCheck(Check(std::move(def)));
        }

        const std::vector<std::string> roots = ctx.layout.worldWritableRoots;
        const bool privileged = ctx.privileged;
        Check::Definition def;
        def.id = "perms.world_writable";
        def.title = "World-writable files";
        def.category = Category::FILE_PERMISSIONS;
        def.evaluate = [roots, privileged] {
            const auto scan = scanWorldWritable(roots, BulwarkTemplates::WORLD_WRITABLE_REPORT_LIMIT);

            std::string skipped;
            if (scan.unreadable > 0) {
                skipped = std::to_string(scan.unreadable) + " unreadable director" +
                          (scan.unreadable == 1 ? "y" : "ies") + " skipped";
                if (!privileged) skipped += "; run as root for a complete scan";
            }

            if (scan.total == 0) {
                if (!skipped.empty()) {
                    return Finding::warn("No world-writable files found, but the scan is incomplete (" +
                                         skipped + ")").manualOnly();
                }
                return Finding::pass("No world-writable files found in system directories");
            }
            std::string message = "Found " + std::to_string(scan.total) +
                                  " world-writable file(s): " + BulwarkUtils::join(scan.sample, ", ");
            if (scan.total > scan.sample.size()) {
                message += " ...";
            }
            message += " (manual review recommended";
            if (!skipped.empty()) message += "; " + skipped;
            return Finding::warn(message + ")").manualOnly();
        };
        registry.registerCheck(Check(std::move(def)));
    }
}
