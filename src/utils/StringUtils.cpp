// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "utils/StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace BulwarkUtils {
    std::string replaceAll(std::string str, const std::string& from, const std::string& to) {
        if(from.empty()) return str;
        size_t start_pos = 0;
        while((start_pos = str.find(from, start_pos)) != std::string::npos) {
            str.replace(start_pos, from.length(), to);
            start_pos += to.length();
        }
        return str;
    }

    std::string trim(const std::string& s) {
        const auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        const auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool startsWith(const std::string& s, const std::string& prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    std::vector<std::string> splitFields(const std::string& line, char delimiter) {
        std::vector<std::string> fields;
        std::string field;
        std::istringstream iss(line);
        while (std::getline(iss, field, delimiter)) {
            fields.push_back(field);
        }
        // getline drops a trailing empty field
        if (!line.empty() && line.back() == delimiter) fields.emplace_back();
        return fields;
    }

    std::vector<std::string> splitLines(const std::string& text) {
        std::vector<std::string> lines;
        std::string line;
        std::istringstream iss(text);
        while (std::getline(iss, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::optional<long> parseInteger(const std::string& s) {
        const std::string t = trim(s);
        if (t.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        long value = std::strtol(t.c_str(), &end, 10);
        if (errno != 0 || end == t.c_str() || *end != '\0') return std::nullopt;
        return value;
    }

    std::string join(const std::vector<std::string>& parts, const std::string& separator) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) out += separator;
            out += parts[i];
        }
        return out;
    }
}
