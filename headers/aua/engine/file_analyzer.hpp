//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef AUA_ENGINE_FILE_ANALYZER_HPP
#define AUA_ENGINE_FILE_ANALYZER_HPP

/**
 * @file file_analyzer.hpp
 * @brief The pure per-file step: text to PartialAggregate.
 *
 * Nothing here touches shared state, so one analyzer is used concurrently
 * by every worker of the engine.
 */

#include "aua/api/api_description.hpp"
#include "aua/error.hpp"
#include "aua/types.hpp"
#include "aua/usage/usage_aggregate.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aua::engine {

    struct AnalysisLimits {
        std::size_t max_file_bytes = 4 * 1024 * 1024;
        std::size_t max_nesting_depth = 200;
        std::chrono::milliseconds file_timeout{0};  ///< Zero disables the deadline
    };

    struct FileAnalysis {
        FileOutcome outcome = FileOutcome::Analyzed;
        usage::PartialAggregate aggregate;
        std::optional<Error> error;  ///< Set for SyntaxError outcomes
    };

    class FileAnalyzer {
    public:
        /**
         * @param packages Names whose mention makes a file relevant. The
         *        package of `api` is always included.
         * @param relevance_filter Skip parsing of files that mention none.
         */
        FileAnalyzer(const api::ApiDescription& api,
                     std::vector<std::string> packages,
                     bool relevance_filter,
                     AnalysisLimits limits);

        [[nodiscard]] FileAnalysis analyze(const std::string& relative_path, std::string_view text) const;

        [[nodiscard]] bool is_relevant(std::string_view text) const;

        [[nodiscard]] const AnalysisLimits& limits() const noexcept { return limits_; }

    private:
        const api::ApiDescription& api_;
        std::vector<std::string> packages_;
        bool relevance_filter_;
        AnalysisLimits limits_;
    };

}  // namespace aua::engine

#endif //AUA_ENGINE_FILE_ANALYZER_HPP
