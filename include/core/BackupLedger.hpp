// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_BACKUP_LEDGER_HPP
#define BULWARK_BACKUP_LEDGER_HPP

#include <map>
#include <string>

namespace Bulwark::Core {

    class EventBus;

    /**
     * @brief Per-run record of which files have been snapshotted.
     *
     * The first ensureBackup() for a path copies it aside; later calls in the
     * same run return the existing snapshot, which holds the pre-run content.
     * Not safe against a second engine instance writing the same files.
     */
    class BackupLedger {
    public:
        explicit BackupLedger(EventBus& busRef);

        /**
         * @brief Backup path for path, creating it on first use.
         * Returns "" when path does not exist yet (nothing to preserve).
         * Throws RemediationError if the snapshot cannot be written.
         */
        std::string ensureBackup(const std::string& path);

        bool hasBackup(const std::string& path) const;

        // original path -> backup path
        const std::map<std::string, std::string>& backups() const { return taken; }

    private:
        EventBus& bus;
        std::map<std::string, std::string> taken;
    };
}

#endif
