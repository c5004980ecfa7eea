// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/BackupLedger.hpp"
#include "core/EventBus.hpp"
#include "utils/HardeningUtils.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace Bulwark::Core {

    BackupLedger::BackupLedger(EventBus& busRef) : bus(busRef) {}

    std::string BackupLedger::ensureBackup(const std::string& path) {
        auto it = taken.find(path);
        if (it != taken.end()) {
            return it->second;
        }

        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return "";
        }

        std::string backup = BulwarkUtils::createBackup(path);
        taken.emplace(path, backup);
        bus.pushEvent("BACKUP", "Backed up " + path + " -> " + backup);
        return backup;
    }

    bool BackupLedger::hasBackup(const std::string& path) const {
        return taken.count(path) > 0;
    }
}
