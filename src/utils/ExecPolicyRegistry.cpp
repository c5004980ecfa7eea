// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "utils/ExecPolicyRegistry.hpp"

#include <algorithm>
#include <cctype>

namespace Bulwark::Security {

namespace {

// Validator accepting only the listed argument vectors.
std::function<void(const std::vector<std::string>&)>
exactForms(const std::string& tool, std::vector<std::vector<std::string>> forms) {
    return [tool, forms = std::move(forms)](const std::vector<std::string>& args) {
        if (std::find(forms.begin(), forms.end(), args) == forms.end()) {
            std::string joined;
            for (const auto& a : args) joined += " " + a;
            throw ExecPolicyError("argument vector not allowed for " + tool + ":" + joined);
        }
    };
}

void validateSystemctlArgs(const std::vector<std::string>& args) {
    static const std::vector<std::string> verbs = {
        "is-active", "list-unit-files", "start", "stop", "enable", "disable"
    };
    static const std::vector<std::string> options = {
        "--quiet", "--no-legend", "--no-pager"
    };

    if (args.empty() || std::find(verbs.begin(), verbs.end(), args[0]) == verbs.end())
        throw ExecPolicyError("systemctl verb not allowed");

    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto& a = args[i];
        if (std::find(options.begin(), options.end(), a) != options.end()) continue;
        if (!isValidUnitName(a))
            throw ExecPolicyError("invalid unit name: " + a);
    }
}

void validatePasswdArgs(const std::vector<std::string>& args) {
    if (args.size() != 2 || args[0] != "-l")
        throw ExecPolicyError("passwd may only be used to lock an account");
    if (!isValidUserName(args[1]))
        throw ExecPolicyError("invalid user name: " + args[1]);
}

} // namespace

bool isValidUserName(const std::string& name) {
    if (name.empty() || name.size() > 32 || name[0] == '-') return false;

    // A trailing '$' is allowed (machine accounts).
    auto end = name.back() == '$' ? name.end() - 1 : name.end();
    if (end == name.begin()) return false;
    return std::all_of(name.begin(), end, [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

bool isValidUnitName(const std::string& name) {
    if (name.empty() || name.size() > 255 || name[0] == '-') return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == '@' || c == ':';
    });
}

ExecPolicyRegistry& ExecPolicyRegistry::instance() {
    static ExecPolicyRegistry inst;
    return inst;
}

void ExecPolicyRegistry::registerPolicy(const std::string& tool,
                                        const ExecPolicy& policy) {
    policies.emplace(tool, policy);
}

const ExecPolicy& ExecPolicyRegistry::getPolicy(const std::string& tool) const {
    auto it = policies.find(tool);
    if (it == policies.end()) {
        throw ExecPolicyError("No ExecPolicy registered for tool: " + tool);
    }
    return it->second;
}

bool ExecPolicyRegistry::hasPolicy(const std::string& tool) const {
    return policies.count(tool) > 0;
}

void ExecPolicyRegistry::enforce(const std::string& tool,
                                 const std::vector<std::string>& args) const {
    const auto& policy = getPolicy(tool);
    if (args.size() > policy.maxArgs) {
        throw ExecPolicyError(tool + ": too many arguments");
    }
    for (const auto& a : args) {
        if (a.size() > policy.maxArgLen) {
            throw ExecPolicyError(tool + ": argument too long");
        }
    }
    if (policy.validate) {
        policy.validate(args);
    }
}

void ExecPolicyRegistry::initDefaults() {
    registerPolicy("systemctl", ExecPolicy{4, 128, validateSystemctlArgs});

    registerPolicy("passwd", ExecPolicy{2, 32, validatePasswdArgs});

    registerPolicy("ufw", ExecPolicy{2, 16, exactForms("ufw", {
        {"status"},
        {"--force", "enable"},
    })});

    registerPolicy("apt", ExecPolicy{2, 16, exactForms("apt", {
        {"list", "--upgradable"},
    })});

    registerPolicy("apt-get", ExecPolicy{3, 16, exactForms("apt-get", {
        {"upgrade", "-y"},
        {"install", "-y", "auditd"},
    })});

    registerPolicy("yum", ExecPolicy{3, 16, exactForms("yum", {
        {"check-update", "-q"},
        {"update", "-y"},
        {"install", "-y", "audit"},
    })});
}

} // namespace Bulwark::Security
