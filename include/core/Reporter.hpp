// © 2026 Beatrix Zselezny. All rights reserved.
// Bulwark Hardening Engine

#ifndef BULWARK_REPORTER_HPP
#define BULWARK_REPORTER_HPP

#include <cstddef>
#include <iosfwd>
#include <vector>
#include "core/Check.hpp"
#include "core/ModeController.hpp"

namespace Bulwark::Core {

    /**
     * @brief Final, immutable outcome of a run. Counts are folded from results.
     */
    struct RunReport {
        std::vector<CheckResult> results;
        std::size_t passCount = 0;
        std::size_t warnCount = 0;
        std::size_t failCount = 0;
        std::size_t appliedCount = 0;
        std::size_t declinedCount = 0;
        std::size_t failedRemediationCount = 0;
        CheckStatus runStatus = CheckStatus::PASS;

        int exitCode() const { return runStatus == CheckStatus::FAIL ? 1 : 0; }
    };

    class Reporter {
    public:
        // Worst status, FAIL > WARN > PASS. PASS for an empty list.
        static CheckStatus worstOf(const std::vector<CheckResult>& results);

        static RunReport summarize(std::vector<CheckResult> results);

        void renderHeader(std::ostream& out, Mode mode, bool privileged, bool colour) const;

        /**
         * @brief Category sections in result order, then the summary and verdict.
         * Reads the report only.
         */
        void render(const RunReport& report, Mode mode, std::ostream& out, bool colour) const;
    };
}

#endif
