// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

#include "core/BackupLedger.hpp"
#include "core/CheckRegistry.hpp"
#include "core/Confirmation.hpp"
#include "core/EventBus.hpp"
#include "core/Remediator.hpp"
#include "support/ScratchHost.hpp"

namespace fs = std::filesystem;

using namespace Bulwark::Core;
using BulwarkTest::ScratchHost;

namespace {

CheckResult failing(const Check& check)
{
    CheckResult r;
    r.checkId = check.id();
    r.title = check.title();
    r.status = CheckStatus::FAIL;
    r.message = "broken";
    return r;
}

} // namespace

class RemediatorTest : public ::testing::Test {
protected:
    ScratchHost host;
    EventBus bus;
    BackupLedger backups{bus};
    int runs = 0;

    Check makeCheck(const std::string& id, bool confirm, std::vector<std::string> targets = {},
                    Check::Action action = nullptr)
    {
        Check::Definition def;
        def.id = id;
        def.title = "Fix " + id;
        def.evaluate = [] { return Finding::fail("broken"); };
        def.remediate = action ? std::move(action) : Check::Action([this] { ++runs; });
        def.requiresConfirmation = confirm;
        def.mutates = !targets.empty();
        def.targetFiles = std::move(targets);
        return Check(std::move(def));
    }
};

TEST_F(RemediatorTest, OnlyActionableNonPassingResultsAreEligible)
{
    Check c = makeCheck("c", false);
    CheckResult r = failing(c);
    EXPECT_TRUE(Remediator::eligible(c, r));

    r.status = CheckStatus::PASS;
    EXPECT_FALSE(Remediator::eligible(c, r));

    r = failing(c);
    r.fault = ProbeFault::TOOL_MISSING;
    EXPECT_FALSE(Remediator::eligible(c, r));

    r = failing(c);
    r.actionable = false;
    EXPECT_FALSE(Remediator::eligible(c, r));
}

TEST_F(RemediatorTest, DeclineLeavesActionUnrun)
{
    PresetConfirmation confirm(Decision::DECLINE);
    Remediator remediator(bus, confirm, backups);

    Check c = makeCheck("risky", true);
    CheckResult r = failing(c);
    EXPECT_EQ(remediator.remediate(c, r), RemediationOutcome::DECLINED);
    EXPECT_EQ(runs, 0);
    EXPECT_EQ(confirm.asked(), std::vector<std::string>{"risky"});
}

TEST_F(RemediatorTest, ChecksWithoutConfirmationAreNotAsked)
{
    PresetConfirmation confirm(Decision::DECLINE);
    Remediator remediator(bus, confirm, backups);

    Check c = makeCheck("plain", false);
    CheckResult r = failing(c);
    EXPECT_EQ(remediator.remediate(c, r), RemediationOutcome::APPLIED);
    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(confirm.asked().empty());
}

TEST_F(RemediatorTest, PerCheckDecisionOverridesFallback)
{
    PresetConfirmation confirm(Decision::DECLINE, {{"yes", Decision::ACCEPT}});
    Remediator remediator(bus, confirm, backups);

    Check c = makeCheck("yes", true);
    CheckResult r = failing(c);
    EXPECT_EQ(remediator.remediate(c, r), RemediationOutcome::APPLIED);
}

TEST_F(RemediatorTest, BackupIsTakenBeforeTheWrite)
{
    const std::string file = host.layout().loginDefs;
    host.write(file, "PASS_MAX_DAYS 99999\n");

    PresetConfirmation confirm(Decision::ACCEPT);
    Remediator remediator(bus, confirm, backups);

    bool backedUpFirst = false;
    Check c = makeCheck("defs", false, {file}, [&] {
        backedUpFirst = backups.hasBackup(file);
        host.write(file, "PASS_MAX_DAYS 90\n");
    });
    CheckResult r = failing(c);

    EXPECT_EQ(remediator.remediate(c, r), RemediationOutcome::APPLIED);
    EXPECT_TRUE(backedUpFirst);
    ASSERT_EQ(host.backupsOf(file).size(), 1u);
    EXPECT_EQ(host.read(host.backupsOf(file)[0]), "PASS_MAX_DAYS 99999\n");
}

TEST_F(RemediatorTest, BackupFailureSkipsTheAction)
{
    // A directory cannot be snapshotted.
    const std::string dir = host.root() + "/etc/not-a-file";
    fs::create_directories(dir);

    PresetConfirmation confirm(Decision::ACCEPT);
    Remediator remediator(bus, confirm, backups);

    Check c = makeCheck("dir", false, {dir});
    CheckResult r = failing(c);

    EXPECT_EQ(remediator.remediate(c, r), RemediationOutcome::FAILED);
    EXPECT_EQ(runs, 0);
    EXPECT_NE(r.message.find("backup failed"), std::string::npos);
}

TEST_F(RemediatorTest, FailureIsLocalToItsCheck)
{
    PresetConfirmation confirm(Decision::ACCEPT);
    Remediator remediator(bus, confirm, backups);

    CheckRegistry registry;
    registry.registerCheck(makeCheck("first", false, {}, [] { throw std::runtime_error("disk full"); }));
    registry.registerCheck(makeCheck("second", false));

    std::vector<CheckResult> results = {failing(registry.checks()[0]), failing(registry.checks()[1])};
    remediator.remediateAll(registry, results);

    EXPECT_EQ(results[0].remediation, RemediationOutcome::FAILED);
    EXPECT_EQ(results[0].message, "broken (remediation failed: disk full)");
    EXPECT_EQ(results[1].remediation, RemediationOutcome::APPLIED);
    EXPECT_EQ(runs, 1);
}

TEST_F(RemediatorTest, IneligibleResultsAreSkippedByRemediateAll)
{
    PresetConfirmation confirm(Decision::ACCEPT);
    Remediator remediator(bus, confirm, backups);

    CheckRegistry registry;
    registry.registerCheck(makeCheck("ok", false));
    std::vector<CheckResult> results = {failing(registry.checks()[0])};
    results[0].status = CheckStatus::PASS;

    remediator.remediateAll(registry, results);
    EXPECT_EQ(results[0].remediation, RemediationOutcome::NOT_ATTEMPTED);
    EXPECT_EQ(runs, 0);
}

TEST(TerminalConfirmationTest, OnlyYesAccepts)
{
    Check::Definition def;
    def.id = "ssh.password_authentication";
    def.title = "SSH password authentication";
    def.evaluate = [] { return Finding::pass(""); };
    Check check(def);

    std::istringstream in("y\nno\n\n");
    std::ostringstream out;
    TerminalConfirmation confirm(in, out);

    EXPECT_EQ(confirm.confirm(check), Decision::ACCEPT);
    EXPECT_EQ(confirm.confirm(check), Decision::DECLINE);
    EXPECT_EQ(confirm.confirm(check), Decision::DECLINE);
    // EOF
    EXPECT_EQ(confirm.confirm(check), Decision::DECLINE);

    EXPECT_NE(out.str().find("Apply \"SSH password authentication\" [ssh.password_authentication]? (y/N): "),
              std::string::npos);
}
