// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#include "utils/KeyValueConfig.hpp"
#include "utils/StringUtils.hpp"

#include <algorithm>
#include <cctype>

namespace BulwarkUtils {

    namespace {
        bool isKeyChar(unsigned char c, bool dotted) {
            return std::isalnum(c) || c == '_' || (dotted && (c == '.' || c == '-' || c == '/'));
        }
    }

    KeyValueConfig::Dialect KeyValueConfig::sshdDialect() {
        Dialect d;
        d.separator = Separator::WHITESPACE;
        d.caseInsensitiveKeys = true;
        d.matchBlocks = true;
        return d;
    }

    KeyValueConfig::Dialect KeyValueConfig::loginDefsDialect() {
        Dialect d;
        d.separator = Separator::WHITESPACE;
        return d;
    }

    KeyValueConfig::Dialect KeyValueConfig::sysctlDialect() {
        Dialect d;
        d.separator = Separator::EQUALS;
        d.lastWins = true;
        return d;
    }

    KeyValueConfig::KeyValueConfig(Dialect d) : dialect(d) {}

    KeyValueConfig KeyValueConfig::parse(const std::string& text, Dialect dialect) {
        KeyValueConfig config(dialect);
        config.trailingNewline = text.empty() || text.back() == '\n';
        for (const auto& raw : splitLines(text)) {
            config.lines.push_back(config.classify(raw));
        }
        return config;
    }

    bool KeyValueConfig::splitEntry(const std::string& body, std::string& key, std::string& value) const {
        if (dialect.separator == Separator::EQUALS) {
            auto pos = body.find('=');
            if (pos == std::string::npos) return false;
            key = trim(body.substr(0, pos));
            value = trim(body.substr(pos + 1));
            if (key.empty()) return false;
            return std::all_of(key.begin(), key.end(),
                               [](unsigned char c) { return isKeyChar(c, true); });
        }

        // "Keyword value" or "Keyword=value"
        auto pos = body.find_first_of(" \t=");
        if (pos == std::string::npos || pos == 0) return false;
        key = body.substr(0, pos);
        std::string rest = trim(body.substr(pos));
        if (!rest.empty() && rest[0] == '=') rest = trim(rest.substr(1));
        value = rest;
        if (value.empty()) return false;
        return std::all_of(key.begin(), key.end(),
                           [](unsigned char c) { return isKeyChar(c, false); });
    }

    KeyValueConfig::Line KeyValueConfig::classify(const std::string& raw) const {
        Line line;
        line.raw = raw;

        std::string body = trim(raw);
        if (body.empty()) return line;

        bool commented = body[0] == '#';
        if (commented) {
            body = trim(body.substr(1));
        }

        std::string key, value;
        if (!splitEntry(body, key, value)) return line;

        line.key = key;
        line.value = value;
        if (commented) {
            line.kind = Kind::COMMENTED_ENTRY;
        } else if (dialect.matchBlocks && sameKey(key, "Match")) {
            line.kind = Kind::MATCH;
        } else {
            line.kind = Kind::ENTRY;
        }
        return line;
    }

    bool KeyValueConfig::sameKey(const std::string& a, const std::string& b) const {
        if (dialect.caseInsensitiveKeys) return toLower(a) == toLower(b);
        return a == b;
    }

    std::size_t KeyValueConfig::globalEnd() const {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (lines[i].kind == Kind::MATCH) return i;
        }
        return lines.size();
    }

    std::string KeyValueConfig::render(const std::string& key, const std::string& value) const {
        if (dialect.separator == Separator::EQUALS) return key + "=" + value;
        return key + " " + value;
    }

    std::optional<std::string> KeyValueConfig::get(const std::string& key) const {
        std::optional<std::string> found;
        const std::size_t end = globalEnd();
        for (std::size_t i = 0; i < end; ++i) {
            const auto& l = lines[i];
            if (l.kind != Kind::ENTRY || !sameKey(l.key, key)) continue;
            found = l.value;
            if (!dialect.lastWins) break;
        }
        return found;
    }

    bool KeyValueConfig::set(const std::string& key, const std::string& value) {
        const std::size_t end = globalEnd();
        bool sawActive = false;
        bool changed = false;

        for (std::size_t i = 0; i < end; ++i) {
            auto& l = lines[i];
            if (l.kind != Kind::ENTRY || !sameKey(l.key, key)) continue;
            sawActive = true;
            if (l.value != value) {
                l.raw = render(key, value);
                l.key = key;
                l.value = value;
                changed = true;
            }
        }
        if (sawActive) return changed;

        for (std::size_t i = 0; i < end; ++i) {
            auto& l = lines[i];
            if (l.kind != Kind::COMMENTED_ENTRY || !sameKey(l.key, key)) continue;
            l.raw = render(key, value);
            l.kind = Kind::ENTRY;
            l.key = key;
            l.value = value;
            return true;
        }

        Line added;
        added.raw = render(key, value);
        added.kind = Kind::ENTRY;
        added.key = key;
        added.value = value;
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(end), added);
        if (end == lines.size() - 1) trailingNewline = true;
        return true;
    }

    bool KeyValueConfig::setBefore(const std::string& key, const std::string& value,
                                   const std::string& anchorKey) {
        const bool changed = set(key, value);

        const std::size_t end = globalEnd();
        std::size_t anchor = end;
        std::size_t first = end;
        for (std::size_t i = 0; i < end; ++i) {
            const auto& l = lines[i];
            if (l.kind != Kind::ENTRY) continue;
            if (anchor == end && sameKey(l.key, anchorKey)) anchor = i;
            if (first == end && sameKey(l.key, key)) first = i;
        }
        if (anchor == end || first == end || first < anchor) return changed;

        const Line moved = lines[first];
        lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(first));
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(anchor), moved);
        return true;
    }

    std::vector<KeyValueConfig::Entry> KeyValueConfig::globalEntries() const {
        std::vector<Entry> entries;
        const std::size_t end = globalEnd();
        for (std::size_t i = 0; i < end; ++i) {
            if (lines[i].kind == Kind::ENTRY) entries.push_back({lines[i].key, lines[i].value});
        }
        return entries;
    }

    std::string KeyValueConfig::serialize() const {
        std::string out;
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (i) out += "\n";
            out += lines[i].raw;
        }
        if (!lines.empty() && trailingNewline) out += "\n";
        return out;
    }
}
