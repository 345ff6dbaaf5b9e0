//
// Created by gregorian-rayne on 10/17/26.
//

#include "aua/export/usage_json.hpp"
#include "aua/utils/json_utils.hpp"

#include <chrono>
#include <vector>

namespace aua::export_json {

    namespace {

        std::uint64_t count_value(const json& value) {
            if (value.is_number_unsigned()) {
                return value.get<std::uint64_t>();
            }
            if (value.is_number_integer()) {
                const auto signed_value = value.get<std::int64_t>();
                return signed_value > 0 ? static_cast<std::uint64_t>(signed_value) : 0;
            }
            return 0;
        }

        std::map<std::string, std::uint64_t> read_counts(const json& object) {
            std::map<std::string, std::uint64_t> result;
            if (!object.is_object()) {
                return result;
            }
            for (const auto& [key, value] : object.items()) {
                result[key] = count_value(value);
            }
            return result;
        }

        json counts_to_json(const std::map<std::string, std::uint64_t>& counts) {
            json result = json::object();
            for (const auto& [key, count] : counts) {
                result[key] = count;
            }
            return result;
        }

        json histogram_to_json(const usage::Histogram& histogram) {
            json result = json::object();
            for (const auto& [value, count] : histogram) {
                result[value.key()] = count;
            }
            return result;
        }

        json files_to_json(const usage::FileSet& files) {
            return json(std::vector<std::string>(files.begin(), files.end()));
        }

        usage::FileSet read_files(const json& array) {
            usage::FileSet files;
            if (!array.is_array()) {
                return files;
            }
            for (const auto& file : array) {
                if (file.is_string()) {
                    files.insert(file.get<std::string>());
                }
            }
            return files;
        }

        double to_ms(const Duration d) {
            return static_cast<double>(std::chrono::duration_cast<std::chrono::microseconds>(d).count()) / 1000.0;
        }

        json distribution_to_json(const std::vector<std::uint64_t>& distribution, const char* key) {
            json result = json::array();
            for (std::size_t i = 0; i < distribution.size(); ++i) {
                result.push_back({{"at_most", i}, {key, distribution[i]}});
            }
            return result;
        }

    }  // namespace

    json aggregate_to_json(const usage::PartialAggregate& aggregate) {
        json output;
        output["calls"] = counts_to_json(aggregate.call_counts);

        json parameters = json::object();
        for (const auto& [element, histograms] : aggregate.parameter_histograms) {
            json entry = json::object();
            for (const auto& [parameter, histogram] : histograms) {
                entry[parameter] = histogram_to_json(histogram);
            }
            parameters[element] = std::move(entry);
        }
        output["parameters"] = std::move(parameters);

        output["unresolved_calls"] = aggregate.unresolved_calls;
        output["unresolved_by_reason"] = counts_to_json(aggregate.unresolved_by_reason);
        output["malformed_calls"] = aggregate.malformed_calls;

        json call_files = json::object();
        for (const auto& [element, files] : aggregate.call_files) {
            call_files[element] = files_to_json(files);
        }
        output["call_files"] = std::move(call_files);

        json value_files = json::object();
        for (const auto& [element, parameters] : aggregate.value_files) {
            json entry = json::object();
            for (const auto& [parameter, values] : parameters) {
                json bins = json::object();
                for (const auto& [value, files] : values) {
                    bins[value.key()] = files_to_json(files);
                }
                entry[parameter] = std::move(bins);
            }
            value_files[element] = std::move(entry);
        }
        output["value_files"] = std::move(value_files);
        return output;
    }

    usage::PartialAggregate aggregate_from_json(const json& document) {
        usage::PartialAggregate aggregate;
        if (!document.is_object()) {
            return aggregate;
        }

        if (const auto it = document.find("calls"); it != document.end()) {
            aggregate.call_counts = read_counts(*it);
        }

        if (const auto it = document.find("parameters"); it != document.end() && it->is_object()) {
            for (const auto& [element, histograms] : it->items()) {
                if (!histograms.is_object()) {
                    continue;
                }
                auto& target = aggregate.parameter_histograms[element];
                for (const auto& [parameter, bins] : histograms.items()) {
                    auto& histogram = target[parameter];
                    for (const auto& [key, count] : read_counts(bins)) {
                        histogram[ValueSignature::from_key(key)] += count;
                    }
                }
            }
        }

        if (const auto it = document.find("unresolved_calls"); it != document.end()) {
            aggregate.unresolved_calls = count_value(*it);
        }
        if (const auto it = document.find("unresolved_by_reason"); it != document.end()) {
            aggregate.unresolved_by_reason = read_counts(*it);
        }
        if (const auto it = document.find("malformed_calls"); it != document.end()) {
            aggregate.malformed_calls = count_value(*it);
        }

        if (const auto it = document.find("call_files"); it != document.end() && it->is_object()) {
            for (const auto& [element, files] : it->items()) {
                auto read = read_files(files);
                if (!read.empty()) {
                    aggregate.call_files[element] = std::move(read);
                }
            }
        }
        if (const auto it = document.find("value_files"); it != document.end() && it->is_object()) {
            for (const auto& [element, parameters] : it->items()) {
                if (!parameters.is_object()) {
                    continue;
                }
                for (const auto& [parameter, bins] : parameters.items()) {
                    if (!bins.is_object()) {
                        continue;
                    }
                    for (const auto& [key, files] : bins.items()) {
                        auto read = read_files(files);
                        if (!read.empty()) {
                            auto& target = aggregate.value_files[element][parameter][ValueSignature::from_key(key)];
                            target.insert(read.begin(), read.end());
                        }
                    }
                }
            }
        }
        return aggregate;
    }

    json summary_to_json(const engine::RunSummary& summary) {
        json output;
        output["total_files"] = summary.total_files;
        output["analyzed"] = summary.analyzed;
        output["resumed"] = summary.resumed;
        output["irrelevant"] = summary.irrelevant;
        output["read_failures"] = summary.read_failures;
        output["parse_failures"] = summary.parse_failures;
        output["checkpoint_failures"] = summary.checkpoint_failures;
        output["resolved_calls"] = summary.resolved_calls;
        output["unresolved_calls"] = summary.unresolved_calls;
        output["elapsed_ms"] = to_ms(summary.elapsed);
        output["cancelled"] = summary.cancelled;

        json failures = json::array();
        for (const auto& failure : summary.failures) {
            failures.push_back({
                {"path", failure.path},
                {"error", error_code_to_string(failure.code)},
                {"message", failure.message}
            });
        }
        output["failures"] = std::move(failures);
        return output;
    }

    json usages_to_json(const UsagesDocument& document) {
        json output;
        output["schema_version"] = kSchemaVersion;
        output["distribution"] = document.metadata.distribution;
        output["package"] = document.metadata.package;
        output["version"] = document.metadata.version;
        output.update(aggregate_to_json(document.aggregate));
        if (document.summary) {
            output["summary"] = *document.summary;
        }
        return output;
    }

    Result<UsagesDocument, Error> usages_from_json(const json& document) {
        if (!document.is_object()) {
            return Result<UsagesDocument, Error>::failure(
                Error::parse_error("usages document must be a JSON object")
            );
        }
        const int schema = json_utils::get_or<int>(document, "schema_version", kSchemaVersion);
        if (schema > kSchemaVersion) {
            return Result<UsagesDocument, Error>::failure(
                Error::parse_error("unsupported usages schema version", std::to_string(schema))
            );
        }

        UsagesDocument result;
        result.metadata.distribution = json_utils::get_or<std::string>(document, "distribution", "");
        result.metadata.package = json_utils::get_or<std::string>(document, "package", "");
        result.metadata.version = json_utils::get_or<std::string>(document, "version", "");
        result.aggregate = aggregate_from_json(document);
        if (const auto it = document.find("summary"); it != document.end() && it->is_object()) {
            result.summary = *it;
        }
        return Result<UsagesDocument, Error>::success(std::move(result));
    }

    json report_to_json(const usage::ImprovementReport& report) {
        json output;
        output["schema_version"] = kSchemaVersion;
        output["threshold"] = report.threshold;

        json callables = json::array();
        for (const auto& flagged : report.rarely_called) {
            callables.push_back({{"qname", flagged.qualified_name}, {"count", flagged.count}});
        }
        output["rarely_called"] = std::move(callables);

        json values = json::array();
        for (const auto& flagged : report.rare_values) {
            values.push_back({
                {"qname", flagged.qualified_name},
                {"parameter", flagged.parameter},
                {"value", flagged.value.key()},
                {"count", flagged.count}
            });
        }
        output["rare_values"] = std::move(values);

        output["classes"] = {
            {"used", report.used_classes},
            {"unused", report.unused_classes},
            {"number_of_used", report.used_classes.size()},
            {"number_of_unused", report.unused_classes.size()}
        };

        json parameters = json::array();
        for (const auto& summary : report.parameters) {
            parameters.push_back({
                {"qname", summary.qualified_name},
                {"parameter", summary.parameter},
                {"most_common", summary.most_common.key()},
                {"most_common_count", summary.most_common_count},
                {"deviating", summary.deviating}
            });
        }
        output["parameters"] = std::move(parameters);

        output["distributions"] = {
            {"constructors_called_at_most", distribution_to_json(report.constructors_called_at_most, "classes")},
            {"functions_called_at_most", distribution_to_json(report.functions_called_at_most, "functions")},
            {"parameters_deviating_at_most", distribution_to_json(report.parameters_deviating_at_most, "parameters")}
        };

        json affected = json::array();
        for (const auto& row : report.affected_files) {
            affected.push_back({
                {"call_cutoff", row.call_cutoff},
                {"parameter_cutoff", row.parameter_cutoff},
                {"affected_files", row.files}
            });
        }
        output["affected_files"] = std::move(affected);
        return output;
    }

    std::string usages_file_name(const DocumentMetadata& metadata) {
        return metadata.distribution + "__" + metadata.package + "__" + metadata.version + "__usages.json";
    }

    Result<void, Error> write_usages(const std::filesystem::path& path, const UsagesDocument& document) {
        return json_utils::write_file(path, usages_to_json(document));
    }

    Result<UsagesDocument, Error> read_usages(const std::filesystem::path& path) {
        return json_utils::read_file(path).and_then([](const json& document) {
            return usages_from_json(document);
        });
    }

}  // namespace aua::export_json
