// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "support/FakeCommandRunner.hpp"
#include "core/Errors.hpp"
#include "utils/ExecPolicyRegistry.hpp"

namespace BulwarkTest {

    FakeCommandRunner::FakeCommandRunner() {
        Bulwark::Security::ExecPolicyRegistry::instance().initDefaults();
    }

    void FakeCommandRunner::install(const std::string& tool) {
        installed.insert(tool);
    }

    void FakeCommandRunner::uninstall(const std::string& tool) {
        installed.erase(tool);
    }

    void FakeCommandRunner::script(const std::string& tool, const std::vector<std::string>& args,
                                   CommandResult res) {
        installed.insert(tool);
        scripted[{tool, args}] = std::move(res);
    }

    void FakeCommandRunner::onTool(const std::string& tool, Handler handler) {
        installed.insert(tool);
        handlers[tool] = std::move(handler);
    }

    bool FakeCommandRunner::available(const std::string& tool) const {
        return installed.count(tool) > 0;
    }

    CommandResult FakeCommandRunner::run(const std::string& tool, const std::vector<std::string>& args) {
        if (!available(tool)) {
            throw Bulwark::Core::ToolMissingError(tool + " not found in trusted paths");
        }
        Bulwark::Security::ExecPolicyRegistry::instance().enforce(tool, args);
        log.emplace_back(tool, args);

        auto it = scripted.find({tool, args});
        if (it != scripted.end()) return it->second;

        auto h = handlers.find(tool);
        if (h != handlers.end()) return h->second(args);

        return result(0);
    }

    bool FakeCommandRunner::called(const std::string& tool, const std::vector<std::string>& args) const {
        for (const auto& c : log) {
            if (c.first == tool && c.second == args) return true;
        }
        return false;
    }

    std::size_t FakeCommandRunner::callCount(const std::string& tool) const {
        std::size_t n = 0;
        for (const auto& c : log) {
            if (c.first == tool) ++n;
        }
        return n;
    }

    CommandResult FakeCommandRunner::result(int exitCode, std::string output, std::string errors) {
        CommandResult r;
        r.exitCode = exitCode;
        r.output = std::move(output);
        r.errors = std::move(errors);
        return r;
    }
}
