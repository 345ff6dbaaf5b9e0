//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef AUA_FORMATTER_HPP
#define AUA_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Text output of the `aua` commands: aligned tables, counts,
 * durations and the run / improvement summaries.
 */

#include "aua/engine/run_summary.hpp"
#include "aua/types.hpp"
#include "aua/usage/improvement_filter.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace aua::cli
{
    namespace colors {

        extern const char* const RESET;
        extern const char* const BOLD;
        extern const char* const YELLOW;

        /**
         * True when stdout is a terminal and NO_COLOR is unset.
         */
        bool enabled();

    }  // namespace colors

    /**
     * Columns are sized to their widest cell. Numeric columns are right
     * aligned.
     */
    class Table {
    public:
        struct Column {
            std::string header;
            bool numeric = false;
        };

        explicit Table(std::vector<Column> columns);

        void add_row(std::vector<std::string> cells);

        void render(std::ostream& out) const;

    private:
        std::vector<Column> columns_;
        std::vector<std::vector<std::string>> rows_;
    };

    /**
     * "850ms", "12.4s", "3m 05s", "1h 02m".
     */
    [[nodiscard]] std::string format_duration(Duration d);

    /**
     * 1234567 -> "1,234,567"
     */
    [[nodiscard]] std::string format_count(std::uint64_t count);

    [[nodiscard]] std::string colorize(std::string_view text, const char* color);

    class SummaryPrinter {
    public:
        explicit SummaryPrinter(std::ostream& out);

        void print_run_summary(const engine::RunSummary& summary) const;

        /**
         * Lists per-file failures, at most `limit` of them (0 = all).
         */
        void print_failures(const std::vector<engine::FileFailure>& failures, std::size_t limit = 10) const;

        /**
         * Report totals, then the first `limit` rarely called callables and
         * rare argument values (0 = all).
         */
        void print_report_summary(const usage::ImprovementReport& report, std::size_t limit = 10) const;

    private:
        void print_heading(std::string_view title) const;
        void print_field(std::string_view label, const std::string& value) const;
        void print_more(std::size_t shown, std::size_t total) const;

        std::ostream& out_;
    };

}  // namespace aua::cli

#endif //AUA_FORMATTER_HPP
