// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "modules/SysctlModule.hpp"
#include "core/Errors.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/HardeningUtils.hpp"
#include "utils/KeyValueConfig.hpp"
#include "utils/StringUtils.hpp"
#include "utils/SysctlPolicy.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace Bulwark::Modules {

    using Core::Category;
    using Core::Check;
    using Core::Finding;
    using BulwarkTemplates::SysctlExpectation;

    namespace {

        std::string readParameter(const std::string& procSys, const std::string& key) {
            return BulwarkUtils::trim(
                BulwarkUtils::readProbeFile(SysctlModule::procPath(procSys, key)));
        }

        // Runtime value, written natively.
        void writeParameter(const std::string& procSys, const std::string& key, const std::string& value) {
            const std::string path = SysctlModule::procPath(procSys, key);
            std::ofstream procFile(path);
            if (!procFile.is_open()) {
                throw Core::RemediationError("kernel parameter not writable: " + path);
            }
            procFile << value << '\n';
            procFile.close();
            if (procFile.fail()) {
                throw Core::RemediationError("write to kernel parameter failed: " + path);
            }
        }

        Finding probeParameter(const std::string& procSys, const SysctlExpectation& rule) {
            const std::string current = readParameter(procSys, rule.key);
            if (current == rule.expected) {
                return Finding::pass(rule.passMessage);
            }
            return Finding::of(rule.severity,
                               rule.failMessage + " (" + rule.key + " = " + current + ")");
        }

        void applyParameter(const std::string& procSys, const std::string& sysctlConf,
                            const SysctlExpectation& rule) {
            std::vector<std::string> keys = {rule.key};
            keys.insert(keys.end(), rule.companions.begin(), rule.companions.end());

            std::vector<std::string> assignments;
            for (const auto& key : keys) {
                assignments.push_back(key + "=" + rule.expected);
            }
            Security::validateSysctlArgs(assignments);

            for (const auto& key : keys) {
                writeParameter(procSys, key, rule.expected);
            }

            std::string text;
            std::error_code ec;
            if (fs::exists(sysctlConf, ec)) {
                text = BulwarkUtils::readProbeFile(sysctlConf);
            }
            auto config = BulwarkUtils::KeyValueConfig::parse(
                text, BulwarkUtils::KeyValueConfig::sysctlDialect());

            bool changed = false;
            for (const auto& key : keys) {
                changed = config.set(key, rule.expected) || changed;
            }
            if (changed) {
                BulwarkUtils::writeConfigFile(sysctlConf, config.serialize());
            }
        }
    }

    SysctlModule::SysctlModule(Core::HostContext context) : ctx(std::move(context)) {}

    std::string SysctlModule::procPath(const std::string& procSys, const std::string& key) {
        return procSys + "/" + BulwarkUtils::replaceAll(key, ".", "/");
    }

    void SysctlModule::registerChecks(Core::CheckRegistry& registry) const {
        const std::string procSys = ctx.layout.procSys;
        const std::string sysctlConf = ctx.layout.sysctlConf;

        for (const auto& rule : BulwarkTemplates::SYSCTL_BASELINE) {
            Check::Definition def;
            def.id = rule.checkId;
            def.title = rule.title;
            def.category = Category::KERNEL_PARAMETERS;
            def.evaluate = [procSys, rule] { return probeParameter(procSys, rule); };
            def.remediate = [procSys, sysctlConf, rule] { applyParameter(procSys, sysctlConf, rule); };
            def.mutates = true;
            def.targetFiles = {sysctlConf};
            registry.registerCheck(Check(std::move(def)));
        }
    }
}
