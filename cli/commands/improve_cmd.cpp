//
// Created by gregorian-rayne on 10/18/26.
//

#include "aua/cli/commands/command.hpp"
#include "aua/cli/formatter.hpp"

#include "aua/api/api_description.hpp"
#include "aua/export/usage_json.hpp"
#include "aua/usage/improvement_filter.hpp"
#include "aua/utils/json_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <optional>
#include <iostream>

namespace aua::cli
{
    namespace fs = std::filesystem;

    /**
     * Improve command - flags rarely used API elements and argument values.
     */
    class ImproveCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "improve";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Report API elements and argument values used less often than a threshold";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: aua improve --usages FILE --out DIR [OPTIONS]\n"
                   "\n"
                   "Examples:\n"
                   "  aua improve --api sklearn.json --usages results/sklearn__usages.json --out report/\n"
                   "  aua improve --usages merged.json --out report/ --min 5";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"api", 'a', "API description, to include never-called elements", false, true, "", "FILE"},
                {"usages", 'u', "Usages document", true, true, "", "FILE"},
                {"out", 'o', "Output directory for the report", true, true, "", "DIR"},
                {"min", 'm', "Flag counts strictly below this threshold", false, true, "", "N"},
                {"config", 'c', "Configuration file (TOML)", false, true, "", "FILE"},
                {"top", 't', "Number of flagged callables to print (0=all)", false, true, "10", "N"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (auto missing = Command::validate(args); !missing.empty()) {
                return missing;
            }
            if (args.has("min")) {
                const auto min = args.get_int("min");
                if (!min || *min < 0) {
                    return "--min must be a non-negative integer";
                }
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            auto prepared = prepare(args);
            if (prepared.is_err()) {
                print_error(prepared.error().to_string());
                return 1;
            }
            const core::Config& config = prepared.value();

            auto document = export_json::read_usages(*args.get("usages"));
            if (document.is_err()) {
                print_error("Cannot read usages document: " + document.error().to_string());
                return 1;
            }

            std::optional<api::ApiDescription> api;
            if (const auto api_path = args.get("api")) {
                auto loaded = api::ApiDescription::load(*api_path);
                if (loaded.is_err()) {
                    print_error("Cannot load API description: " + loaded.error().to_string());
                    return 1;
                }
                api = std::move(loaded).value();
            }

            usage::ImprovementOptions options;
            options.threshold = static_cast<std::uint64_t>(
                args.get_int("min").value_or(static_cast<int>(config.analysis.min_usages)));

            const auto report = usage::build_improvement_report(
                document.value().aggregate, api ? &*api : nullptr, options);

            const fs::path out_dir = *args.get("out");
            export_json::DocumentMetadata metadata = document.value().metadata;
            if (api) {
                metadata = {api->distribution(), api->package(), api->version()};
            }
            const fs::path out_file = out_dir /
                (metadata.distribution + "__" + metadata.package + "__" + metadata.version + "__improvements.json");

            auto report_json = export_json::report_to_json(report);
            report_json["distribution"] = metadata.distribution;
            report_json["package"] = metadata.package;
            report_json["version"] = metadata.version;

            if (auto written = json_utils::write_file(out_file, report_json); written.is_err()) {
                print_error(written.error().to_string());
                return 1;
            }
            spdlog::info("Wrote {}", out_file.string());

            if (is_json()) {
                std::cout << report_json.dump(2) << "\n";
            } else if (!is_quiet()) {
                SummaryPrinter printer(std::cout);
                printer.print_report_summary(report, static_cast<std::size_t>(std::max(0, args.get_int("top").value_or(10))));
                std::cout << "\nReport written to " << out_file.string() << "\n";
            }

            return 0;
        }
    };

    namespace {
        struct ImproveCommandRegistrar {
            ImproveCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ImproveCommand>()
                );
            }
        } improve_registrar;
    }
}  // namespace aua::cli
