// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef SAFE_EXECUTOR_HPP
#define SAFE_EXECUTOR_HPP

#include <string>
#include <vector>

namespace Bulwark::Core {

    class EventBus;

    struct CommandResult {
        int exitCode = -1;
        std::string output;   // stdout
        std::string errors;   // stderr

        bool succeeded() const { return exitCode == 0; }
    };

    /**
     * @brief Port through which checks query and drive external tools.
     * Tools are named (e.g. "systemctl"), never given as a path or a shell string.
     */
    class ICommandRunner {
    public:
        virtual ~ICommandRunner() = default;

        virtual bool available(const std::string& tool) const = 0;

        /**
         * @brief Runs tool with args and waits for it.
         * Throws ToolMissingError if the tool cannot be resolved and
         * Security::ExecPolicyError if the argument vector is rejected.
         * A non-zero exit is not an exception; inspect CommandResult.
         */
        virtual CommandResult run(const std::string& tool, const std::vector<std::string>& args) = 0;
    };

    /**
     * @brief run() for remediation steps: a non-zero exit becomes RemediationError.
     */
    CommandResult runChecked(ICommandRunner& runner, const std::string& tool,
                             const std::vector<std::string>& args);

    class SafeExecutor : public ICommandRunner {
    public:
        explicit SafeExecutor(EventBus* bus = nullptr);

        bool available(const std::string& tool) const override;

        /**
         * @brief "Prepared statement" execution: binary and argument vector kept apart.
         * fork/execv, no shell; stdout and stderr captured separately.
         */
        CommandResult run(const std::string& tool, const std::vector<std::string>& args) override;

        // Absolute path of tool inside the trusted directories, or "" if absent.
        static std::string resolve(const std::string& tool);

    private:
        EventBus* bus;
    };
}

#endif
