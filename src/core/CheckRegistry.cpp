// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/CheckRegistry.hpp"

#include <algorithm>
#include <stdexcept>

namespace Bulwark::Core {

void CheckRegistry::registerCheck(Check check) {
    if (find(check.id()) != nullptr) {
        throw std::runtime_error("Check already registered: " + check.id());
    }
    entries.push_back(std::move(check));
}

const Check* CheckRegistry::find(const std::string& id) const {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Check& c) { return c.id() == id; });
    return it == entries.end() ? nullptr : &*it;
}

std::vector<Category> CheckRegistry::categories() const {
    std::vector<Category> order;
    for (const auto& c : entries) {
        if (std::find(order.begin(), order.end(), c.category()) == order.end()) {
            order.push_back(c.category());
        }
    }
    return order;
}

std::vector<const Check*> CheckRegistry::inCategory(Category category) const {
    std::vector<const Check*> out;
    for (const auto& c : entries) {
        if (c.category() == category) out.push_back(&c);
    }
    return out;
}

} // namespace Bulwark::Core
