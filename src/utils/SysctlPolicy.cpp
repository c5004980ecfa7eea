// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "utils/SysctlPolicy.hpp"
#include "utils/ExecPolicy.hpp"

#include <cctype>

namespace Bulwark::Security {

void validateSysctlArgs(const std::vector<std::string>& args) {
    for (const auto& a : args) {
        auto pos = a.find('=');
        if (pos == std::string::npos || pos == 0 || pos + 1 == a.size())
            throw ExecPolicyError("sysctl arg must be key=value");

        if (a.find(';') != std::string::npos ||
            a.find('&') != std::string::npos ||
            a.find('|') != std::string::npos ||
            a.find('`') != std::string::npos ||
            a.find('$') != std::string::npos)
            throw ExecPolicyError("illegal character in sysctl arg");

        for (std::size_t i = 0; i < pos; ++i) {
            unsigned char c = static_cast<unsigned char>(a[i]);
            if (!std::isalnum(c) && c != '.' && c != '_' && c != '-')
                throw ExecPolicyError("illegal character in sysctl key: " + a.substr(0, pos));
        }
        if (a.find("..") != std::string::npos)
            throw ExecPolicyError("sysctl key must not contain '..'");
    }
}

}
