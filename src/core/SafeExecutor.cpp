// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/SafeExecutor.hpp"
#include "core/Errors.hpp"
#include "core/EventBus.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/ExecPolicyRegistry.hpp"

#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace Bulwark::Core {

    namespace {

        bool isExecutableFile(const std::string& path) {
            struct stat st {};
            if (stat(path.c_str(), &st) != 0) return false;
            return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
        }

        // Drains both pipes until the child closes them.
        void collect(int outFd, int errFd, std::string& out, std::string& err) {
            pollfd fds[2] = {{outFd, POLLIN, 0}, {errFd, POLLIN, 0}};
            int open = 2;
            char buffer[4096];

            while (open > 0) {
                int ret = poll(fds, 2, -1);
                if (ret < 0) {
                    if (errno == EINTR) continue;
                    break;
                }
                for (int i = 0; i < 2; ++i) {
                    if (fds[i].fd < 0 || fds[i].revents == 0) continue;
                    ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
                    if (n > 0) {
                        (i == 0 ? out : err).append(buffer, static_cast<size_t>(n));
                    } else if (n == 0 || errno != EINTR) {
                        close(fds[i].fd);
                        fds[i].fd = -1;
                        --open;
                    }
                }
            }
            for (auto& p : fds) {
                if (p.fd >= 0) close(p.fd);
            }
        }
    }

    CommandResult runChecked(ICommandRunner& runner, const std::string& tool,
                             const std::vector<std::string>& args) {
        CommandResult result = runner.run(tool, args);
        if (!result.succeeded()) {
            std::string line = tool;
            for (const auto& a : args) line += " " + a;
            std::string detail = result.errors;
            while (!detail.empty() && (detail.back() == '\n' || detail.back() == ' ')) detail.pop_back();
            throw RemediationError(line + " exited with " + std::to_string(result.exitCode) +
                                   (detail.empty() ? "" : ": " + detail));
        }
        return result;
    }

    SafeExecutor::SafeExecutor(EventBus* busPtr) : bus(busPtr) {}

    std::string SafeExecutor::resolve(const std::string& tool) {
        if (tool.empty() || tool.find('/') != std::string::npos) return "";
        for (const auto& dir : BulwarkTemplates::TRUSTED_EXEC_DIRS) {
            std::string candidate = dir + "/" + tool;
            if (isExecutableFile(candidate)) return candidate;
        }
        return "";
    }

    bool SafeExecutor::available(const std::string& tool) const {
        return !resolve(tool).empty();
    }

    CommandResult SafeExecutor::run(const std::string& tool, const std::vector<std::string>& args) {
        const std::string binary = resolve(tool);
        if (binary.empty()) {
            throw ToolMissingError(tool + " not found in trusted paths");
        }
        Security::ExecPolicyRegistry::instance().enforce(tool, args);

        if (bus) {
            std::string line = binary;
            for (const auto& a : args) line += " " + a;
            bus->pushEvent("EXEC", line);
        }

        int outPipe[2];
        int errPipe[2];
        if (pipe2(outPipe, O_CLOEXEC) != 0) {
            throw std::runtime_error("pipe failed for " + tool);
        }
        if (pipe2(errPipe, O_CLOEXEC) != 0) {
            close(outPipe[0]);
            close(outPipe[1]);
            throw std::runtime_error("pipe failed for " + tool);
        }

        pid_t pid = fork();
        if (pid == -1) {
            close(outPipe[0]); close(outPipe[1]);
            close(errPipe[0]); close(errPipe[1]);
            throw std::runtime_error("fork failed for " + tool);
        }

        if (pid == 0) { // child
            int devNull = open("/dev/null", O_RDONLY);
            if (devNull >= 0) dup2(devNull, STDIN_FILENO);
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(errPipe[1], STDERR_FILENO);

            std::vector<char*> c_args;
            c_args.push_back(const_cast<char*>(binary.c_str()));
            for (const auto& arg : args) {
                c_args.push_back(const_cast<char*>(arg.c_str()));
            }
            c_args.push_back(nullptr);

            execv(binary.c_str(), c_args.data());
            _exit(127);
        }

        close(outPipe[1]);
        close(errPipe[1]);

        CommandResult result;
        collect(outPipe[0], errPipe[0], result.output, result.errors);

        int status = 0;
        while (waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR) {
                throw std::runtime_error("waitpid failed for " + tool);
            }
        }

        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exitCode = 128 + WTERMSIG(status);
        }
        return result;
    }
}
