//
// Created by gregorian-rayne on 10/17/26.
//

#ifndef AUA_EXPORT_USAGE_JSON_HPP
#define AUA_EXPORT_USAGE_JSON_HPP

/**
 * @file usage_json.hpp
 * @brief JSON forms of aggregates, usages documents, reports and summaries.
 *
 * Usages document layout:
 * @code
 *     {
 *       "schema_version": 1,
 *       "distribution": "scikit-learn", "package": "sklearn", "version": "1.5.0",
 *       "calls": {"sklearn.svm.SVC.__init__": 12},
 *       "parameters": {"sklearn.svm.SVC.__init__": {"C": {"1.0": 3, "<default>": 9}}},
 *       "unresolved_calls": 40,
 *       "unresolved_by_reason": {"not-imported": 31, "rebound": 9},
 *       "malformed_calls": 0,
 *       "call_files": {"sklearn.svm.SVC.__init__": ["a.py", "b/c.py"]},
 *       "value_files": {"sklearn.svm.SVC.__init__": {"C": {"1.0": ["a.py"]}}},
 *       "summary": {...}
 *     }
 * @endcode
 *
 * Readers are lenient: missing keys read as empty, unknown keys are ignored.
 */

#include "aua/engine/run_summary.hpp"
#include "aua/result.hpp"
#include "aua/usage/improvement_filter.hpp"
#include "aua/usage/usage_aggregate.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace aua::export_json {

    using json = nlohmann::json;

    inline constexpr int kSchemaVersion = 1;

    struct DocumentMetadata {
        std::string distribution;
        std::string package;
        std::string version;
    };

    struct UsagesDocument {
        DocumentMetadata metadata;
        usage::PartialAggregate aggregate;
        std::optional<json> summary;
    };

    [[nodiscard]] json aggregate_to_json(const usage::PartialAggregate& aggregate);
    [[nodiscard]] usage::PartialAggregate aggregate_from_json(const json& document);

    [[nodiscard]] json summary_to_json(const engine::RunSummary& summary);

    [[nodiscard]] json usages_to_json(const UsagesDocument& document);
    [[nodiscard]] Result<UsagesDocument, Error> usages_from_json(const json& document);

    [[nodiscard]] json report_to_json(const usage::ImprovementReport& report);

    /**
     * `<distribution>__<package>__<version>__usages.json`
     */
    [[nodiscard]] std::string usages_file_name(const DocumentMetadata& metadata);

    Result<void, Error> write_usages(const std::filesystem::path& path, const UsagesDocument& document);
    Result<UsagesDocument, Error> read_usages(const std::filesystem::path& path);

}  // namespace aua::export_json

#endif //AUA_EXPORT_USAGE_JSON_HPP
