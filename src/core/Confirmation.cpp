// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "core/Confirmation.hpp"
#include "core/Check.hpp"
#include "utils/StringUtils.hpp"

#include <istream>
#include <ostream>

namespace Bulwark::Core {

    TerminalConfirmation::TerminalConfirmation(std::istream& inRef, std::ostream& outRef)
        : in(inRef), out(outRef) {}

    Decision TerminalConfirmation::confirm(const Check& check) {
        out << "Apply \"" << check.title() << "\" [" << check.id() << "]? (y/N): " << std::flush;

        std::string reply;
        if (!std::getline(in, reply)) {
            out << std::endl;
            return Decision::DECLINE;
        }
        reply = BulwarkUtils::trim(reply);
        return (reply == "y" || reply == "Y") ? Decision::ACCEPT : Decision::DECLINE;
    }

    PresetConfirmation::PresetConfirmation(Decision fallbackDecision,
                                           std::map<std::string, Decision> decisions)
        : fallback(fallbackDecision), perCheck(std::move(decisions)) {}

    Decision PresetConfirmation::confirm(const Check& check) {
        askedIds.push_back(check.id());
        auto it = perCheck.find(check.id());
        return it == perCheck.end() ? fallback : it->second;
    }
}
