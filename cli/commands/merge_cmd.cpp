//
// Created by gregorian-rayne on 10/18/26.
//

#include "aua/cli/commands/command.hpp"
#include "aua/cli/formatter.hpp"

#include "aua/export/usage_json.hpp"
#include "aua/usage/usage_aggregate.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

namespace aua::cli
{
    namespace fs = std::filesystem;

    namespace {

        /**
         * Sums the numeric counters of several run summaries and concatenates
         * their failure lists.
         */
        nlohmann::json merge_summaries(const std::vector<nlohmann::json>& summaries) {
            nlohmann::json merged = nlohmann::json::object();
            nlohmann::json failures = nlohmann::json::array();
            bool cancelled = false;

            for (const auto& summary : summaries) {
                for (const auto& [key, value] : summary.items()) {
                    if (key == "failures" && value.is_array()) {
                        for (const auto& failure : value) {
                            failures.push_back(failure);
                        }
                    } else if (key == "cancelled" && value.is_boolean()) {
                        cancelled = cancelled || value.get<bool>();
                    } else if (value.is_number_unsigned() || value.is_number_integer()) {
                        const auto current = merged.contains(key) ? merged[key].get<std::int64_t>() : 0;
                        merged[key] = current + value.get<std::int64_t>();
                    } else if (value.is_number_float()) {
                        const auto current = merged.contains(key) ? merged[key].get<double>() : 0.0;
                        merged[key] = current + value.get<double>();
                    }
                }
            }

            merged["cancelled"] = cancelled;
            merged["failures"] = std::move(failures);
            merged["batches"] = summaries.size();
            return merged;
        }

    }  // namespace

    /**
     * Merge command - combines usages documents of separate batches.
     */
    class MergeCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "merge";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Merge usages documents produced from separate corpus batches";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: aua merge --out FILE <usages-files...>\n"
                   "\n"
                   "Examples:\n"
                   "  aua merge --out all.json batch1/*__usages.json batch2/*__usages.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"out", 'o', "Merged usages document", true, true, "", "FILE"},
                {"force", 'f', "Merge documents of different distributions or versions", false, false, "", ""},
                {"config", 'c', "Configuration file (TOML), for logging settings", false, true, "", "FILE"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (auto missing = Command::validate(args); !missing.empty()) {
                return missing;
            }
            if (args.positional().empty()) {
                return "No usages documents specified. Use 'aua merge --out FILE <files...>'";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            if (auto prepared = prepare(args); prepared.is_err()) {
                print_error(prepared.error().to_string());
                return 1;
            }

            std::vector<export_json::UsagesDocument> documents;
            documents.reserve(args.positional().size());

            for (const auto& path : args.positional()) {
                auto document = export_json::read_usages(path);
                if (document.is_err()) {
                    print_error("Cannot read " + path + ": " + document.error().to_string());
                    return 1;
                }
                documents.push_back(std::move(document).value());
                print_verbose("Read " + path);
            }

            const auto& first = documents.front().metadata;
            for (std::size_t i = 1; i < documents.size(); ++i) {
                const auto& other = documents[i].metadata;
                if (other.distribution != first.distribution || other.package != first.package ||
                    other.version != first.version) {
                    const std::string message = "Document " + args.positional()[i] + " describes " +
                                                other.distribution + " " + other.version + ", expected " +
                                                first.distribution + " " + first.version;
                    if (!args.get_flag("force")) {
                        print_error(message + " (use --force to merge anyway)");
                        return 1;
                    }
                    print_warning(message);
                }
            }

            std::vector<usage::PartialAggregate> aggregates;
            std::vector<nlohmann::json> summaries;
            aggregates.reserve(documents.size());
            for (auto& document : documents) {
                aggregates.push_back(std::move(document.aggregate));
                if (document.summary) {
                    summaries.push_back(std::move(*document.summary));
                }
            }

            export_json::UsagesDocument merged;
            merged.metadata = first;
            merged.aggregate = usage::merge_all(aggregates);
            if (!summaries.empty()) {
                merged.summary = merge_summaries(summaries);
            }

            const fs::path out_file = *args.get("out");
            if (auto written = export_json::write_usages(out_file, merged); written.is_err()) {
                print_error(written.error().to_string());
                return 1;
            }
            spdlog::info("Merged {} document(s) into {}", documents.size(), out_file.string());

            if (is_json()) {
                nlohmann::json output;
                output["output"] = out_file.string();
                output["documents"] = documents.size();
                output["resolved_calls"] = merged.aggregate.resolved_calls();
                output["unresolved_calls"] = merged.aggregate.unresolved_calls;
                std::cout << output.dump(2) << "\n";
            } else {
                print("Merged " + format_count(documents.size()) + " documents (" +
                      format_count(merged.aggregate.resolved_calls()) + " resolved calls) into " +
                      out_file.string());
            }

            return 0;
        }
    };

    namespace {
        struct MergeCommandRegistrar {
            MergeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<MergeCommand>()
                );
            }
        } merge_registrar;
    }
}  // namespace aua::cli
