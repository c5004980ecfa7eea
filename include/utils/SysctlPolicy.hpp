// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#pragma once

#include <string>
#include <vector>

namespace Bulwark::Security {

// Every arg must be key=value with a dotted key and no shell metacharacters.
void validateSysctlArgs(const std::vector<std::string>& args);

}
