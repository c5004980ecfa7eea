// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef STRINGUTILS_HPP
#define STRINGUTILS_HPP

#include <optional>
#include <string>
#include <vector>

namespace BulwarkUtils {
    /**
     * @brief Replaces every occurrence of from with to.
     */
    std::string replaceAll(std::string str, const std::string& from, const std::string& to);

    /**
     * @brief Strips leading and trailing whitespace (config line cleanup).
     */
    std::string trim(const std::string& s);

    std::string toLower(std::string s);

    bool startsWith(const std::string& s, const std::string& prefix);

    // Splits on a single delimiter, keeping empty fields (passwd/shadow format).
    std::vector<std::string> splitFields(const std::string& line, char delimiter);

    std::vector<std::string> splitLines(const std::string& text);

    // Whole-string decimal integer, or nullopt.
    std::optional<long> parseInteger(const std::string& s);

    std::string join(const std::vector<std::string>& parts, const std::string& separator);
}

#endif
