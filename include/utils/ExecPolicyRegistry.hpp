// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "utils/ExecPolicy.hpp"

namespace Bulwark::Security {

/**
 * @brief Allow-list of executable tools. SafeExecutor refuses any tool
 * without a registered policy.
 */
class ExecPolicyRegistry {
public:
    static ExecPolicyRegistry& instance();

    // First registration wins.
    void registerPolicy(const std::string& tool,
                        const ExecPolicy& policy);

    const ExecPolicy& getPolicy(const std::string& tool) const;

    bool hasPolicy(const std::string& tool) const;

    /**
     * @brief Applies the tool's policy to args: count, length, then validator.
     * Throws ExecPolicyError, including when no policy is registered.
     */
    void enforce(const std::string& tool, const std::vector<std::string>& args) const;

    // Policies for every tool the check modules drive. Safe to call repeatedly.
    void initDefaults();

private:
    ExecPolicyRegistry() = default;

    std::unordered_map<std::string, ExecPolicy> policies;
};

// Shared validators.
bool isValidUserName(const std::string& name);
bool isValidUnitName(const std::string& name);

}
