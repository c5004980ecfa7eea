// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include <gtest/gtest.h>

#include <regex>
#include <vector>

#include "core/BackupLedger.hpp"
#include "core/Errors.hpp"
#include "core/EventBus.hpp"
#include "support/ScratchHost.hpp"
#include "utils/HardeningUtils.hpp"

using namespace Bulwark::Core;
using BulwarkTest::ScratchHost;

TEST(BackupTest, BackupNameCarriesTimestampAndIsReadOnly)
{
    ScratchHost host;
    const std::string file = host.layout().loginDefs;
    host.write(file, "PASS_MAX_DAYS 99999\n");

    const std::string backup = BulwarkUtils::createBackup(file);

    EXPECT_TRUE(std::regex_match(backup, std::regex(".*/login\\.defs\\.backup\\.[0-9]{8}_[0-9]{6}(-[0-9]+)?")))
        << backup;
    EXPECT_EQ(host.read(backup), "PASS_MAX_DAYS 99999\n");
    EXPECT_EQ(host.modeOf(backup), 0400u);
}

TEST(BackupTest, SecondBackupInSameSecondGetsCounter)
{
    ScratchHost host;
    const std::string file = host.layout().group;
    host.write(file, "root:x:0:\n");

    const std::string first = BulwarkUtils::createBackup(file);
    const std::string second = BulwarkUtils::createBackup(file);

    EXPECT_NE(first, second);
    EXPECT_EQ(host.backupsOf(file).size(), 2u);
}

TEST(BackupTest, MissingSourceIsRemediationError)
{
    ScratchHost host;
    EXPECT_THROW(BulwarkUtils::createBackup(host.root() + "/etc/nope"), RemediationError);
}

TEST(BackupLedgerTest, OneBackupPerFilePerRun)
{
    ScratchHost host;
    const std::string file = host.layout().sshdConfig;
    host.write(file, "PermitRootLogin yes\n");

    EventBus bus;
    std::vector<EngineEvent> events;
    bus.subscribe([&events](const EngineEvent& e) { events.push_back(e); });

    BackupLedger ledger(bus);
    const std::string first = ledger.ensureBackup(file);
    host.write(file, "PermitRootLogin no\n");
    const std::string again = ledger.ensureBackup(file);

    EXPECT_EQ(first, again);
    EXPECT_TRUE(ledger.hasBackup(file));
    ASSERT_EQ(host.backupsOf(file).size(), 1u);
    // The snapshot keeps the pre-run content.
    EXPECT_EQ(host.read(first), "PermitRootLogin yes\n");

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].source, "BACKUP");
}

TEST(BackupLedgerTest, AbsentFileIsNotBackedUp)
{
    ScratchHost host;
    EventBus bus;
    BackupLedger ledger(bus);

    EXPECT_EQ(ledger.ensureBackup(host.layout().sysctlConf), "");
    EXPECT_FALSE(ledger.hasBackup(host.layout().sysctlConf));
    EXPECT_TRUE(ledger.backups().empty());
}
