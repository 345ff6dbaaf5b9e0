//
// Created by gregorian-rayne on 10/18/26.
//

#include "aua/cli/formatter.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace aua::cli
{
    namespace colors {

        const char* const RESET = "\033[0m";
        const char* const BOLD = "\033[1m";
        const char* const YELLOW = "\033[33m";

        bool enabled() {
            static const bool on = isatty(fileno(stdout)) != 0 && std::getenv("NO_COLOR") == nullptr;
            return on;
        }

    }  // namespace colors

    std::string format_duration(const Duration d) {
        using namespace std::chrono;
        const auto ms = std::max<long long>(0, duration_cast<milliseconds>(d).count());

        std::ostringstream ss;
        if (ms < 1000) {
            ss << ms << "ms";
        } else if (ms < 60'000) {
            ss << std::fixed << std::setprecision(1) << static_cast<double>(ms) / 1000.0 << "s";
        } else if (ms < 3'600'000) {
            ss << ms / 60'000 << "m " << std::setfill('0') << std::setw(2) << (ms / 1000) % 60 << "s";
        } else {
            ss << ms / 3'600'000 << "h " << std::setfill('0') << std::setw(2) << (ms / 60'000) % 60 << "m";
        }
        return ss.str();
    }

    std::string format_count(const std::uint64_t count) {
        const std::string digits = std::to_string(count);
        std::string grouped;
        grouped.reserve(digits.size() + digits.size() / 3);
        for (std::size_t i = 0; i < digits.size(); ++i) {
            if (i > 0 && (digits.size() - i) % 3 == 0) {
                grouped.push_back(',');
            }
            grouped.push_back(digits[i]);
        }
        return grouped;
    }

    std::string colorize(const std::string_view text, const char* color) {
        if (!colors::enabled()) {
            return std::string(text);
        }
        return color + std::string(text) + colors::RESET;
    }

    // Table

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(std::vector<std::string> cells) {
        cells.resize(columns_.size());
        rows_.push_back(std::move(cells));
    }

    void Table::render(std::ostream& out) const {
        std::vector<std::size_t> widths;
        widths.reserve(columns_.size());
        for (std::size_t c = 0; c < columns_.size(); ++c) {
            std::size_t width = columns_[c].header.size();
            for (const auto& row : rows_) {
                width = std::max(width, row[c].size());
            }
            widths.push_back(width);
        }

        const auto emit = [&](const std::vector<std::string>& cells) {
            for (std::size_t c = 0; c < columns_.size(); ++c) {
                const auto w = static_cast<int>(widths[c]);
                out << (columns_[c].numeric ? std::right : std::left) << std::setw(w) << cells[c];
                out << (c + 1 < columns_.size() ? "  " : "\n");
            }
        };

        std::vector<std::string> header;
        std::vector<std::string> rule;
        for (std::size_t c = 0; c < columns_.size(); ++c) {
            header.push_back(columns_[c].header);
            rule.emplace_back(widths[c], '-');
        }
        emit(header);
        emit(rule);
        for (const auto& row : rows_) {
            emit(row);
        }
    }

    // SummaryPrinter

    SummaryPrinter::SummaryPrinter(std::ostream& out)
        : out_(out)
    {}

    void SummaryPrinter::print_heading(const std::string_view title) const {
        out_ << "\n" << colorize(title, colors::BOLD) << "\n" << std::string(title.size(), '=') << "\n";
    }

    void SummaryPrinter::print_field(const std::string_view label, const std::string& value) const {
        out_ << "  " << std::left << std::setw(22) << (std::string(label) + ":") << value << "\n";
    }

    void SummaryPrinter::print_more(const std::size_t shown, const std::size_t total) const {
        if (shown < total) {
            out_ << "  ... and " << format_count(total - shown) << " more\n";
        }
    }

    void SummaryPrinter::print_run_summary(const engine::RunSummary& summary) const {
        print_heading("Usage extraction");

        const auto problem = [](const std::size_t n) {
            return n > 0 ? colorize(format_count(n), colors::YELLOW) : format_count(n);
        };

        print_field("Files", format_count(summary.total_files));
        print_field("Analyzed", format_count(summary.analyzed));
        print_field("Resumed", format_count(summary.resumed));
        print_field("Not importing package", format_count(summary.irrelevant));
        print_field("Unreadable", problem(summary.read_failures));
        print_field("Syntax errors", problem(summary.parse_failures));
        print_field("Checkpoint failures", problem(summary.checkpoint_failures));
        print_field("Resolved calls", format_count(summary.resolved_calls));
        print_field("Unresolved calls", format_count(summary.unresolved_calls));
        print_field("Elapsed", format_duration(summary.elapsed));

        if (summary.cancelled) {
            out_ << "\n" << colorize("Interrupted before every file was processed.", colors::YELLOW) << "\n";
        }
    }

    void SummaryPrinter::print_failures(const std::vector<engine::FileFailure>& failures, const std::size_t limit) const {
        if (failures.empty()) {
            return;
        }
        print_heading("Skipped files");

        Table table({{"File"}, {"Error"}, {"Message"}});
        const std::size_t shown = limit == 0 ? failures.size() : std::min(limit, failures.size());
        std::for_each(failures.begin(), failures.begin() + static_cast<std::ptrdiff_t>(shown),
                      [&table](const engine::FileFailure& f) {
                          table.add_row({f.path, error_code_to_string(f.code), f.message});
                      });
        table.render(out_);
        print_more(shown, failures.size());
    }

    void SummaryPrinter::print_report_summary(const usage::ImprovementReport& report, const std::size_t limit) const {
        print_heading("Improvement report");

        print_field("Threshold", "< " + format_count(report.threshold) + " calls");
        print_field("Rarely called", format_count(report.rarely_called.size()));
        print_field("Rare argument values", format_count(report.rare_values.size()));
        print_field("Classes used", format_count(report.used_classes.size()));
        print_field("Classes never used", format_count(report.unused_classes.size()));

        const std::uint64_t cutoff = report.threshold == 0 ? 0 : report.threshold - 1;
        for (const auto& row : report.affected_files) {
            if (row.call_cutoff == cutoff && row.parameter_cutoff == cutoff) {
                print_field("Files affected", format_count(row.files));
                break;
            }
        }

        const auto shown_of = [limit](const std::size_t total) {
            return limit == 0 ? total : std::min(limit, total);
        };

        if (!report.rarely_called.empty()) {
            out_ << "\n";
            Table table({{"Callable"}, {"Calls", true}});
            const std::size_t shown = shown_of(report.rarely_called.size());
            for (std::size_t i = 0; i < shown; ++i) {
                table.add_row({report.rarely_called[i].qualified_name, format_count(report.rarely_called[i].count)});
            }
            table.render(out_);
            print_more(shown, report.rarely_called.size());
        }

        if (!report.rare_values.empty()) {
            out_ << "\n";
            Table table({{"Callable"}, {"Parameter"}, {"Value"}, {"Calls", true}});
            const std::size_t shown = shown_of(report.rare_values.size());
            for (std::size_t i = 0; i < shown; ++i) {
                const auto& flagged = report.rare_values[i];
                table.add_row({flagged.qualified_name, flagged.parameter, flagged.value.key(),
                               format_count(flagged.count)});
            }
            table.render(out_);
            print_more(shown, report.rare_values.size());
        }
    }

}  // namespace aua::cli
