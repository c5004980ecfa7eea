// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include <gtest/gtest.h>

#include <memory>

#include "core/Errors.hpp"
#include "modules/SshModule.hpp"
#include "support/FakeCommandRunner.hpp"
#include "support/ScratchHost.hpp"

using namespace Bulwark::Core;
using Bulwark::Modules::SshModule;
using BulwarkTest::FakeCommandRunner;
using BulwarkTest::ScratchHost;

class SshModuleTest : public ::testing::Test {
protected:
    ScratchHost host;
    CheckRegistry registry;

    void SetUp() override
    {
        HostContext ctx;
        ctx.layout = host.layout();
        ctx.runner = std::make_shared<FakeCommandRunner>();
        SshModule(ctx).registerChecks(registry);
    }

    void writeConfig(const std::string& text) { host.write(host.layout().sshdConfig, text); }
    std::string config() { return host.read(host.layout().sshdConfig); }

    const Check& check(const std::string& id)
    {
        const Check* c = registry.find(id);
        if (c == nullptr) throw std::runtime_error("no check " + id);
        return *c;
    }
};

TEST_F(SshModuleTest, RegistersFiveRemoteAccessChecksInOrder)
{
    ASSERT_EQ(registry.size(), 5u);
    EXPECT_EQ(registry.checks()[0].id(), "ssh.permit_root_login");
    EXPECT_EQ(registry.checks()[4].id(), "ssh.max_auth_tries");
    for (const auto& c : registry.checks()) {
        EXPECT_EQ(c.category(), Category::REMOTE_ACCESS);
        EXPECT_TRUE(c.mutates());
        EXPECT_EQ(c.targetFiles(), std::vector<std::string>{host.layout().sshdConfig});
    }
    EXPECT_TRUE(check("ssh.password_authentication").requiresConfirmation());
    EXPECT_FALSE(check("ssh.permit_root_login").requiresConfirmation());
}

TEST_F(SshModuleTest, HardenedConfigPasses)
{
    host.populateCompliant();
    for (const auto& c : registry.checks()) {
        EXPECT_EQ(c.evaluate().status, CheckStatus::PASS) << c.id();
    }
}

TEST_F(SshModuleTest, RootLoginAllowedFails)
{
    writeConfig("PermitRootLogin yes\n");
    auto f = check("ssh.permit_root_login").evaluate();
    EXPECT_EQ(f.status, CheckStatus::FAIL);
    EXPECT_NE(f.message.find("currently yes"), std::string::npos);
}

TEST_F(SshModuleTest, RootLoginKeyOnlyVariantsPass)
{
    writeConfig("PermitRootLogin without-password\n");
    EXPECT_EQ(check("ssh.permit_root_login").evaluate().status, CheckStatus::PASS);
    writeConfig("PermitRootLogin prohibit-password\n");
    EXPECT_EQ(check("ssh.permit_root_login").evaluate().status, CheckStatus::PASS);
}

TEST_F(SshModuleTest, AbsentRequiredDirectiveFails)
{
    writeConfig("UsePAM yes\n");
    EXPECT_EQ(check("ssh.permit_root_login").evaluate().status, CheckStatus::FAIL);
    EXPECT_EQ(check("ssh.x11_forwarding").evaluate().status, CheckStatus::FAIL);
}

TEST_F(SshModuleTest, AbsentProtocolIsSafeDefault)
{
    writeConfig("UsePAM yes\n");
    EXPECT_EQ(check("ssh.protocol").evaluate().status, CheckStatus::PASS);

    writeConfig("Protocol 2,1\n");
    EXPECT_EQ(check("ssh.protocol").evaluate().status, CheckStatus::FAIL);
}

TEST_F(SshModuleTest, SoftFindingsWarn)
{
    writeConfig("PasswordAuthentication yes\nX11Forwarding yes\nMaxAuthTries 6\n");
    EXPECT_EQ(check("ssh.password_authentication").evaluate().status, CheckStatus::WARN);
    EXPECT_EQ(check("ssh.x11_forwarding").evaluate().status, CheckStatus::WARN);
    EXPECT_EQ(check("ssh.max_auth_tries").evaluate().status, CheckStatus::WARN);

    writeConfig("MaxAuthTries many\n");
    EXPECT_EQ(check("ssh.max_auth_tries").evaluate().status, CheckStatus::WARN);
}

TEST_F(SshModuleTest, MissingConfigIsToolMissing)
{
    EXPECT_THROW(check("ssh.permit_root_login").evaluate(), ToolMissingError);
}

TEST_F(SshModuleTest, RemediationRewritesOnlyTheDirective)
{
    writeConfig("# sshd config\nPort 22\nPermitRootLogin yes\n\nMatch User git\n    X11Forwarding yes\n");

    check("ssh.permit_root_login").remediate();
    check("ssh.x11_forwarding").remediate();

    EXPECT_EQ(config(),
              "# sshd config\nPort 22\nPermitRootLogin prohibit-password\n\nX11Forwarding no\n"
              "Match User git\n    X11Forwarding yes\n");
    EXPECT_EQ(check("ssh.permit_root_login").evaluate().status, CheckStatus::PASS);
    EXPECT_EQ(check("ssh.x11_forwarding").evaluate().status, CheckStatus::PASS);
}

TEST_F(SshModuleTest, RemediationIsIdempotent)
{
    writeConfig("#MaxAuthTries 6\nUsePAM yes\n");

    check("ssh.max_auth_tries").remediate();
    const std::string once = config();
    check("ssh.max_auth_tries").remediate();

    EXPECT_EQ(config(), once);
    EXPECT_EQ(once, "MaxAuthTries 4\nUsePAM yes\n");
}

TEST_F(SshModuleTest, IncludedDropInIsTheEffectiveValue)
{
    const std::string dropIn = host.layout().hostPath("/etc/ssh/sshd_config.d/50-cloud-init.conf");
    writeConfig("Include /etc/ssh/sshd_config.d/*.conf\nPasswordAuthentication no\nPermitRootLogin no\n");
    host.write(dropIn, "PasswordAuthentication yes\n");

    auto f = check("ssh.password_authentication").evaluate();
    EXPECT_EQ(f.status, CheckStatus::WARN);
    EXPECT_NE(f.message.find("currently yes"), std::string::npos);
    EXPECT_NE(f.message.find("50-cloud-init.conf"), std::string::npos);
    EXPECT_EQ(check("ssh.permit_root_login").evaluate().status, CheckStatus::PASS);
}

TEST_F(SshModuleTest, RemediationPlacesDirectiveAheadOfInclude)
{
    const std::string dropIn = host.layout().hostPath("/etc/ssh/sshd_config.d/50-cloud-init.conf");
    writeConfig("Include /etc/ssh/sshd_config.d/*.conf\nPasswordAuthentication no\nPermitRootLogin no\n");
    host.write(dropIn, "PasswordAuthentication yes\n");

    check("ssh.password_authentication").remediate();

    EXPECT_EQ(config(), "PasswordAuthentication no\nInclude /etc/ssh/sshd_config.d/*.conf\nPermitRootLogin no\n");
    EXPECT_EQ(host.read(dropIn), "PasswordAuthentication yes\n");
    EXPECT_EQ(check("ssh.password_authentication").evaluate().status, CheckStatus::PASS);
}

TEST_F(SshModuleTest, RelativeIncludeResolvesNextToSshdConfig)
{
    writeConfig("Include sshd_config.d/*.conf\n");
    host.write(host.layout().hostPath("/etc/ssh/sshd_config.d/10-x11.conf"), "X11Forwarding yes\n");

    EXPECT_EQ(check("ssh.x11_forwarding").evaluate().status, CheckStatus::WARN);

    check("ssh.x11_forwarding").remediate();
    EXPECT_EQ(config(), "X11Forwarding no\nInclude sshd_config.d/*.conf\n");
    EXPECT_EQ(check("ssh.x11_forwarding").evaluate().status, CheckStatus::PASS);
}

TEST_F(SshModuleTest, IncludeWithoutMatchesIsIgnored)
{
    writeConfig("Include /etc/ssh/sshd_config.d/*.conf\nPermitRootLogin no\n");
    EXPECT_EQ(check("ssh.permit_root_login").evaluate().status, CheckStatus::PASS);
}
