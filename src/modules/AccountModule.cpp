// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "modules/AccountModule.hpp"
#include "core/Errors.hpp"
#include "core/SafeExecutor.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/HardeningUtils.hpp"
#include "utils/KeyValueConfig.hpp"
#include "utils/StringUtils.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace Bulwark::Modules {

    using Core::Category;
    using Core::Check;
    using Core::Finding;
    using BulwarkUtils::KeyValueConfig;

    namespace {

        const std::string PASS_MAX_DAYS_KEY = "PASS_MAX_DAYS";

        KeyValueConfig loadLoginDefs(const std::string& path) {
            std::error_code ec;
            if (!fs::exists(path, ec)) {
                throw Core::ToolMissingError("login.defs not found (" + path + ")");
            }
            return KeyValueConfig::parse(BulwarkUtils::readProbeFile(path),
                                         KeyValueConfig::loginDefsDialect());
        }

        void lockAccounts(Core::ICommandRunner& runner, const std::vector<std::string>& users) {
            for (const auto& user : users) {
                Core::runChecked(runner, "passwd", {"-l", user});
            }
        }

        // Extra UID 0 accounts that still accept a password.
        std::vector<std::string> unlockedExtraRoots(const std::string& passwdPath,
                                                    const std::string& shadowPath) {
            const auto extras = AccountModule::extraRootAccounts(
                BulwarkUtils::readProbeFile(passwdPath));
            const auto locked = AccountModule::lockedAccounts(
                BulwarkUtils::readProbeFile(shadowPath));

            std::vector<std::string> unlocked;
            for (const auto& user : extras) {
                if (locked.count(user) == 0) unlocked.push_back(user);
            }
            return unlocked;
        }
    }

    AccountModule::AccountModule(Core::HostContext context) : ctx(std::move(context)) {}

    std::vector<std::string> AccountModule::emptyPasswordAccounts(const std::string& shadowText) {
        std::vector<std::string> accounts;
        for (const auto& line : BulwarkUtils::splitLines(shadowText)) {
            if (BulwarkUtils::trim(line).empty() || line[0] == '#') continue;
            const auto fields = BulwarkUtils::splitFields(line, ':');
            if (fields.size() >= 2 && !fields[0].empty() && fields[1].empty()) {
                accounts.push_back(fields[0]);
            }
        }
        return accounts;
    }

    std::vector<std::string> AccountModule::extraRootAccounts(const std::string& passwdText) {
        std::vector<std::string> accounts;
        for (const auto& line : BulwarkUtils::splitLines(passwdText)) {
            if (BulwarkUtils::trim(line).empty() || line[0] == '#') continue;
            const auto fields = BulwarkUtils::splitFields(line, ':');
            if (fields.size() >= 3 && fields[2] == "0" && fields[0] != "root") {
                accounts.push_back(fields[0]);
            }
        }
        return accounts;
    }

    std::set<std::string> AccountModule::lockedAccounts(const std::string& shadowText) {
        std::set<std::string> locked;
        for (const auto& line : BulwarkUtils::splitLines(shadowText)) {
            const auto fields = BulwarkUtils::splitFields(line, ':');
            if (fields.size() < 2 || fields[0].empty()) continue;
            if (!fields[1].empty() && (fields[1][0] == '!' || fields[1][0] == '*')) {
                locked.insert(fields[0]);
            }
        }
        return locked;
    }

    void AccountModule::registerChecks(Core::CheckRegistry& registry) const {
        const Core::HostLayout layout = ctx.layout;
        const std::shared_ptr<Core::ICommandRunner> runner = ctx.runner;

        {
            Check::Definition def;
            def.id = "account.password_max_days";
            def.title = "Password maximum age";
            def.category = Category::ACCOUNT_POLICY;
            def.evaluate = [layout] {
                const auto config = loadLoginDefs(layout.loginDefs);
                const auto value = config.get(PASS_MAX_DAYS_KEY);
                const std::string limit = std::to_string(BulwarkTemplates::PASS_MAX_DAYS_LIMIT);
                if (!value) {
                    return Finding::fail(PASS_MAX_DAYS_KEY + " is not set: password max age should be " +
                                         limit + " days or less");
                }
                const auto days = BulwarkUtils::parseInteger(*value);
                if (!days) {
                    return Finding::fail(PASS_MAX_DAYS_KEY + " has an invalid value (" + *value + ")");
                }
                // login.defs(5): -1 turns password ageing off.
                if (*days < 0) {
                    return Finding::warn(PASS_MAX_DAYS_KEY + " is " + *value +
                                         ": password ageing disabled (should be " + limit +
                                         " days or less)");
                }
                if (*days <= BulwarkTemplates::PASS_MAX_DAYS_LIMIT) {
                    return Finding::pass("Password expiration is set to " + *value + " days");
                }
                return Finding::warn("Password max age should be " + limit +
                                     " days or less (currently " + *value + ")");
            };
            def.remediate = [layout] {
                auto config = loadLoginDefs(layout.loginDefs);
                if (config.set(PASS_MAX_DAYS_KEY, std::to_string(BulwarkTemplates::PASS_MAX_DAYS_LIMIT))) {
                    BulwarkUtils::writeConfigFile(layout.loginDefs, config.serialize());
                }
            };
            def.mutates = true;
            def.targetFiles = {layout.loginDefs};
            registry.registerCheck(Check(std::move(def)));
        }

        {
            Check::Definition def;
            def.id = "account.empty_passwords";
            def.title = "Empty password accounts";
            def.category = Category::ACCOUNT_POLICY;
            def.evaluate = [layout] {
                const auto accounts = emptyPasswordAccounts(BulwarkUtils::readProbeFile(layout.shadow));
                if (accounts.empty()) {
                    return Finding::pass("No accounts with empty passwords");
                }
                return Finding::fail("Accounts with empty passwords: " + BulwarkUtils::join(accounts, ", "));
            };
            def.remediate = [layout, runner] {
                lockAccounts(*runner, emptyPasswordAccounts(BulwarkUtils::readProbeFile(layout.shadow)));
            };
            def.mutates = true;
            def.targetFiles = {layout.shadow};
            registry.registerCheck(Check(std::move(def)));
        }

        {
            Check::Definition def;
            def.id = "account.uid_zero";
            def.title = "UID 0 accounts";
            def.category = Category::ACCOUNT_POLICY;
            def.evaluate = [layout] {
                const auto extras = extraRootAccounts(BulwarkUtils::readProbeFile(layout.passwd));
                if (extras.empty()) {
                    return Finding::pass("Only root has UID 0");
                }
                const auto unlocked = unlockedExtraRoots(layout.passwd, layout.shadow);
                if (!unlocked.empty()) {
                    return Finding::fail("Non-root accounts with UID 0: " + BulwarkUtils::join(unlocked, ", "));
                }
                return Finding::warn("Locked non-root accounts with UID 0: " + BulwarkUtils::join(extras, ", ") +
                                     " - manual review recommended").manualOnly();
            };
            def.remediate = [layout, runner] {
                lockAccounts(*runner, unlockedExtraRoots(layout.passwd, layout.shadow));
            };
            def.requiresConfirmation = true;
            def.mutates = true;
            def.targetFiles = {layout.shadow};
            registry.registerCheck(Check(std::move(def)));
        }
    }
}
