// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "modules/SshModule.hpp"
#include "core/Errors.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/HardeningUtils.hpp"
#include "utils/KeyValueConfig.hpp"
#include "utils/StringUtils.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <glob.h>

namespace fs = std::filesystem;

namespace Bulwark::Modules {

    using Core::Category;
    using Core::Check;
    using Core::CheckStatus;
    using Core::Finding;
    using BulwarkUtils::KeyValueConfig;

    namespace {

        struct DirectiveRule {
            std::string checkId;
            std::string title;
            std::string key;
            std::string fixValue;
            CheckStatus severity;
            bool absentIsSafe;
            bool requiresConfirmation;
            std::function<bool(const std::string&)> compliant;
            std::string passMessage;
            std::string failMessage;
        };

        bool isOneOf(const std::string& value, std::initializer_list<const char*> accepted) {
            const std::string v = BulwarkUtils::toLower(value);
            for (const char* a : accepted) {
                if (v == a) return true;
            }
            return false;
        }

        std::vector<DirectiveRule> directiveRules() {
            return {
                {
                    "ssh.permit_root_login", "SSH root login", "PermitRootLogin",
                    "prohibit-password", CheckStatus::FAIL, false, false,
                    [](const std::string& v) {
                        return isOneOf(v, {"no", "prohibit-password", "without-password"});
                    },
                    "Root login is disabled or restricted",
                    "Root login should be disabled"
                },
                {
                    "ssh.password_authentication", "SSH password authentication",
                    "PasswordAuthentication", "no", CheckStatus::WARN, false, true,
                    [](const std::string& v) { return isOneOf(v, {"no"}); },
                    "Password authentication is disabled (key-based only)",
                    "Consider disabling password authentication for key-based auth only"
                },
                {
                    "ssh.protocol", "SSH protocol version", "Protocol",
                    "2", CheckStatus::FAIL, true, false,
                    [](const std::string& v) { return BulwarkUtils::trim(v) == "2"; },
                    "SSH Protocol 2 is enforced",
                    "SSH should use Protocol 2 only"
                },
                {
                    "ssh.x11_forwarding", "SSH X11 forwarding", "X11Forwarding",
                    "no", CheckStatus::WARN, false, false,
                    [](const std::string& v) { return isOneOf(v, {"no"}); },
                    "X11 forwarding is disabled",
                    "X11 forwarding should be disabled unless needed"
                },
                {
                    "ssh.max_auth_tries", "SSH max authentication attempts", "MaxAuthTries",
                    std::to_string(BulwarkTemplates::SSH_MAX_AUTH_TRIES), CheckStatus::WARN, false, false,
                    [](const std::string& v) {
                        auto n = BulwarkUtils::parseInteger(v);
                        return n && *n >= 1 && *n <= BulwarkTemplates::SSH_MAX_AUTH_TRIES;
                    },
                    "MaxAuthTries is set to a secure value",
                    "MaxAuthTries should be set to " +
                        std::to_string(BulwarkTemplates::SSH_MAX_AUTH_TRIES) + " or less"
                },
            };
        }

        const char* const INCLUDE_KEY = "Include";

        // sshd itself refuses deeper nesting.
        const int MAX_INCLUDE_DEPTH = 16;

        struct EffectiveValue {
            std::string value;
            std::string source;
        };

        KeyValueConfig loadSshdConfig(const std::string& path) {
            std::error_code ec;
            if (!fs::exists(path, ec)) {
                throw Core::ToolMissingError("SSH server not installed or config not found (" + path + ")");
            }
            return KeyValueConfig::parse(BulwarkUtils::readProbeFile(path),
                                         KeyValueConfig::sshdDialect());
        }

        // Relative Include patterns are resolved against the sshd_config directory.
        std::vector<std::string> expandInclude(const Core::HostLayout& layout, const std::string& pattern) {
            const std::string resolved = fs::path(pattern).is_absolute()
                ? layout.hostPath(pattern)
                : (fs::path(layout.sshdConfig).parent_path() / pattern).string();

            glob_t matches {};
            const int rc = ::glob(resolved.c_str(), 0, nullptr, &matches);
            std::vector<std::string> files;
            if (rc == 0) {
                for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
                    std::error_code ec;
                    if (fs::is_regular_file(matches.gl_pathv[i], ec)) files.emplace_back(matches.gl_pathv[i]);
                }
            }
            globfree(&matches);
            if (rc != 0 && rc != GLOB_NOMATCH) {
                throw std::runtime_error("cannot expand Include " + pattern);
            }
            return files;
        }

        // First assignment of key in file order, descending into Include files
        // where they appear.
        std::optional<EffectiveValue> lookup(const Core::HostLayout& layout, const std::string& path,
                                             const KeyValueConfig& config, const std::string& key,
                                             int depth) {
            const std::string lowered = BulwarkUtils::toLower(key);
            for (const auto& entry : config.globalEntries()) {
                const std::string entryKey = BulwarkUtils::toLower(entry.key);
                if (entryKey == lowered) {
                    return EffectiveValue{entry.value, path};
                }
                if (entryKey != BulwarkUtils::toLower(INCLUDE_KEY) || depth >= MAX_INCLUDE_DEPTH) continue;

                std::istringstream patterns(entry.value);
                std::string pattern;
                while (patterns >> pattern) {
                    for (const auto& file : expandInclude(layout, pattern)) {
                        const KeyValueConfig included = KeyValueConfig::parse(
                            BulwarkUtils::readProbeFile(file), KeyValueConfig::sshdDialect());
                        if (auto found = lookup(layout, file, included, key, depth + 1)) return found;
                    }
                }
            }
            return std::nullopt;
        }

        Finding probeDirective(const Core::HostLayout& layout, const DirectiveRule& rule) {
            const KeyValueConfig config = loadSshdConfig(layout.sshdConfig);
            const auto effective = lookup(layout, layout.sshdConfig, config, rule.key, 0);

            if (!effective) {
                if (rule.absentIsSafe) {
                    return Finding::pass(rule.passMessage + " (default)");
                }
                return Finding::fail(rule.key + " is not set: " + rule.failMessage);
            }
            if (rule.compliant(effective->value)) {
                return Finding::pass(rule.passMessage);
            }
            std::string currently = "currently " + effective->value;
            if (effective->source != layout.sshdConfig) {
                currently += ", set in " + effective->source;
            }
            return Finding::of(rule.severity, rule.failMessage + " (" + currently + ")");
        }

        // Drop-in files are left alone; the directive is placed ahead of any
        // Include in sshd_config so it is the value sshd reads first.
        void applyDirective(const std::string& path, const DirectiveRule& rule) {
            KeyValueConfig config = loadSshdConfig(path);
            if (config.setBefore(rule.key, rule.fixValue, INCLUDE_KEY)) {
                BulwarkUtils::writeConfigFile(path, config.serialize());
            }
        }
    }

    SshModule::SshModule(Core::HostContext context) : ctx(std::move(context)) {}

    void SshModule::registerChecks(Core::CheckRegistry& registry) const {
        const Core::HostLayout layout = ctx.layout;
        const std::string path = layout.sshdConfig;

        for (const auto& rule : directiveRules()) {
            Check::Definition def;
            def.id = rule.checkId;
            def.title = rule.title;
            def.category = Category::REMOTE_ACCESS;
            def.evaluate = [layout, rule] { return probeDirective(layout, rule); };
            def.remediate = [path, rule] { applyDirective(path, rule); };
            def.requiresConfirmation = rule.requiresConfirmation;
            def.mutates = true;
            def.targetFiles = {path};
            registry.registerCheck(Check(std::move(def)));
        }
    }
}
