// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#pragma once

#include <string>
#include <vector>
#include "core/Check.hpp"

namespace Bulwark::Core {

/**
 * @brief Ordered catalog of checks. Enumeration order is registration order,
 * and every later phase (evaluation, remediation, report) follows it.
 */
class CheckRegistry {
public:
    // Throws std::runtime_error on a duplicate id.
    void registerCheck(Check check);

    const std::vector<Check>& checks() const { return entries; }

    const Check* find(const std::string& id) const;

    // Categories in order of first appearance.
    std::vector<Category> categories() const;

    std::vector<const Check*> inCategory(Category category) const;

    std::size_t size() const { return entries.size(); }

private:
    std::vector<Check> entries;
};

}
