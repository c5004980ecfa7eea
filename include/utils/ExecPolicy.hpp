// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Bulwark::Security {

class ExecPolicyError : public std::runtime_error {
public:
    explicit ExecPolicyError(const std::string& what) : std::runtime_error(what) {}
};

struct ExecPolicy {
    std::size_t maxArgs;
    std::size_t maxArgLen;

    // Structural + semantic validation; throws ExecPolicyError.
    std::function<void(const std::vector<std::string>&)> validate;
};

}
