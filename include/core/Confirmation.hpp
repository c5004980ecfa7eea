// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_CONFIRMATION_HPP
#define BULWARK_CONFIRMATION_HPP

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace Bulwark::Core {

    class Check;

    enum class Decision { ACCEPT, DECLINE };

    /**
     * @brief Confirmation gate for risky remediations.
     */
    class IConfirmation {
    public:
        virtual ~IConfirmation() = default;
        virtual Decision confirm(const Check& check) = 0;
    };

    /**
     * @brief Interactive y/N prompt. Anything but y/Y, including EOF, declines.
     */
    class TerminalConfirmation : public IConfirmation {
    public:
        TerminalConfirmation(std::istream& in, std::ostream& out);
        Decision confirm(const Check& check) override;

    private:
        std::istream& in;
        std::ostream& out;
    };

    /**
     * @brief Pre-supplied decisions for non-interactive runs and tests.
     */
    class PresetConfirmation : public IConfirmation {
    public:
        explicit PresetConfirmation(Decision fallback,
                                    std::map<std::string, Decision> perCheck = {});
        Decision confirm(const Check& check) override;

        // Check ids in the order they were asked about.
        const std::vector<std::string>& asked() const { return askedIds; }

    private:
        Decision fallback;
        std::map<std::string, Decision> perCheck;
        std::vector<std::string> askedIds;
    };
}

#endif
