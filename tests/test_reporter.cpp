// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include <gtest/gtest.h>

#include <sstream>

#include "core/Reporter.hpp"

using namespace Bulwark::Core;

namespace {

CheckResult result(const std::string& id, Category category, CheckStatus status,
                   RemediationOutcome outcome = RemediationOutcome::NOT_ATTEMPTED)
{
    CheckResult r;
    r.checkId = id;
    r.title = "Title " + id;
    r.category = category;
    r.status = status;
    r.message = "message " + id;
    r.remediation = outcome;
    return r;
}

std::string renderText(const RunReport& report, Mode mode, bool colour = false)
{
    std::ostringstream out;
    Reporter().render(report, mode, out, colour);
    return out.str();
}

} // namespace

TEST(ReporterTest, WorstStatusWins)
{
    EXPECT_EQ(Reporter::worstOf({}), CheckStatus::PASS);
    EXPECT_EQ(Reporter::worstOf({result("a", Category::PATCHING, CheckStatus::PASS),
                                 result("b", Category::PATCHING, CheckStatus::WARN)}),
              CheckStatus::WARN);
    EXPECT_EQ(Reporter::worstOf({result("a", Category::PATCHING, CheckStatus::FAIL),
                                 result("b", Category::PATCHING, CheckStatus::WARN)}),
              CheckStatus::FAIL);
}

TEST(ReporterTest, SummaryCountsAndExitCode)
{
    auto report = Reporter::summarize({
        result("a", Category::REMOTE_ACCESS, CheckStatus::PASS, RemediationOutcome::APPLIED),
        result("b", Category::REMOTE_ACCESS, CheckStatus::WARN, RemediationOutcome::DECLINED),
        result("c", Category::PERIMETER, CheckStatus::FAIL, RemediationOutcome::FAILED),
        result("d", Category::PERIMETER, CheckStatus::PASS),
    });

    EXPECT_EQ(report.passCount, 2u);
    EXPECT_EQ(report.warnCount, 1u);
    EXPECT_EQ(report.failCount, 1u);
    EXPECT_EQ(report.appliedCount, 1u);
    EXPECT_EQ(report.declinedCount, 1u);
    EXPECT_EQ(report.failedRemediationCount, 1u);
    EXPECT_EQ(report.runStatus, CheckStatus::FAIL);
    EXPECT_EQ(report.exitCode(), 1);
    EXPECT_EQ(report.results.size(), 4u);
}

TEST(ReporterTest, WarnOnlyRunExitsZero)
{
    auto report = Reporter::summarize({result("a", Category::PATCHING, CheckStatus::WARN)});
    EXPECT_EQ(report.exitCode(), 0);
    EXPECT_EQ(Reporter::summarize({}).exitCode(), 0);
}

TEST(ReporterTest, SectionsFollowFirstAppearanceOrder)
{
    auto report = Reporter::summarize({
        result("ssh", Category::REMOTE_ACCESS, CheckStatus::PASS),
        result("fw", Category::PERIMETER, CheckStatus::FAIL),
    });
    const std::string text = renderText(report, Mode::AUDIT);

    const auto ssh = text.find("SSH Security Configuration");
    const auto fw = text.find("Firewall Configuration");
    ASSERT_NE(ssh, std::string::npos);
    ASSERT_NE(fw, std::string::npos);
    EXPECT_LT(ssh, fw);

    EXPECT_NE(text.find("[PASS] Title ssh: message ssh"), std::string::npos);
    EXPECT_NE(text.find("[FAIL] Title fw: message fw"), std::string::npos);
    EXPECT_NE(text.find("Run with --apply"), std::string::npos);
    EXPECT_NE(text.find("Security hardening is needed!"), std::string::npos);
    EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST(ReporterTest, ApplyShowsOutcomesAndFollowUps)
{
    auto report = Reporter::summarize({
        result("a", Category::KERNEL_PARAMETERS, CheckStatus::PASS, RemediationOutcome::APPLIED),
        result("b", Category::KERNEL_PARAMETERS, CheckStatus::WARN, RemediationOutcome::DECLINED),
    });
    const std::string text = renderText(report, Mode::APPLY);

    EXPECT_NE(text.find("       -> applied"), std::string::npos);
    EXPECT_NE(text.find("       -> declined"), std::string::npos);
    EXPECT_NE(text.find("Changes applied: 1"), std::string::npos);
    EXPECT_NE(text.find("Changes declined: 1"), std::string::npos);
    EXPECT_NE(text.find("systemctl restart sshd"), std::string::npos);
    EXPECT_NE(text.find("Security is good but could be improved"), std::string::npos);
    EXPECT_EQ(text.find("Run with --apply"), std::string::npos);
}

TEST(ReporterTest, StrongVerdictAndColour)
{
    auto report = Reporter::summarize({result("a", Category::AUDIT_SUBSYSTEM, CheckStatus::PASS)});
    const std::string text = renderText(report, Mode::AUDIT, true);
    EXPECT_NE(text.find("System security posture is strong!"), std::string::npos);
    EXPECT_NE(text.find("\033[0;32m"), std::string::npos);
}

TEST(ReporterTest, HeaderNamesModeAndPrivilege)
{
    std::ostringstream audit;
    Reporter().renderHeader(audit, Mode::AUDIT, false, false);
    EXPECT_NE(audit.str().find("no changes will be made"), std::string::npos);
    EXPECT_NE(audit.str().find("Not running as root"), std::string::npos);

    std::ostringstream apply;
    Reporter().renderHeader(apply, Mode::APPLY, true, false);
    EXPECT_NE(apply.str().find("changes WILL be made"), std::string::npos);
    EXPECT_EQ(apply.str().find("Not running as root"), std::string::npos);
}
