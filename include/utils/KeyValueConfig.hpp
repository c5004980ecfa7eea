// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef KEY_VALUE_CONFIG_HPP
#define KEY_VALUE_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>

namespace BulwarkUtils {

    /**
     * @brief Line-preserving model of a key/value configuration file.
     *
     * Only lines touched by set() are rewritten; comments, blank lines and
     * unknown lines survive serialize() unchanged.
     */
    class KeyValueConfig {
    public:
        enum class Separator { WHITESPACE, EQUALS };

        struct Dialect {
            Separator separator = Separator::WHITESPACE;
            bool caseInsensitiveKeys = false;
            // sshd_config: a "Match" line ends the global section.
            bool matchBlocks = false;
            // sysctl.conf: the last assignment is the effective one.
            bool lastWins = false;
        };

        static Dialect sshdDialect();
        static Dialect loginDefsDialect();
        static Dialect sysctlDialect();

        explicit KeyValueConfig(Dialect dialect);

        static KeyValueConfig parse(const std::string& text, Dialect dialect);

        /**
         * @brief Effective value of key in the global section.
         */
        std::optional<std::string> get(const std::string& key) const;

        /**
         * @brief Makes key = value effective.
         *
         * Rewrites every active assignment of key in the global section; if there
         * is none, revives the first commented-out assignment; otherwise inserts
         * before the first Match block or appends. Returns false when nothing changed.
         */
        bool set(const std::string& key, const std::string& value);

        /**
         * @brief Like set(), then moves the first assignment of key ahead of the
         * first anchorKey line of the global section (sshd_config: first value
         * wins, so a directive must precede any Include that could override it).
         */
        bool setBefore(const std::string& key, const std::string& value, const std::string& anchorKey);

        struct Entry {
            std::string key;
            std::string value;
        };

        // Active assignments of the global section, in file order.
        std::vector<Entry> globalEntries() const;

        std::string serialize() const;

        std::size_t lineCount() const { return lines.size(); }

    private:
        enum class Kind { OTHER, ENTRY, COMMENTED_ENTRY, MATCH };

        struct Line {
            std::string raw;
            Kind kind = Kind::OTHER;
            std::string key;
            std::string value;
        };

        Dialect dialect;
        std::vector<Line> lines;
        bool trailingNewline = true;

        Line classify(const std::string& raw) const;
        bool splitEntry(const std::string& body, std::string& key, std::string& value) const;
        bool sameKey(const std::string& a, const std::string& b) const;
        std::size_t globalEnd() const;
        std::string render(const std::string& key, const std::string& value) const;
    };
}

#endif
