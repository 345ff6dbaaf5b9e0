//
// Created by gregorian-rayne on 10/16/26.
//

#ifndef AUA_USAGE_IMPROVEMENT_FILTER_HPP
#define AUA_USAGE_IMPROVEMENT_FILTER_HPP

/**
 * @file improvement_filter.hpp
 * @brief Threshold step over a final aggregate.
 *
 * With threshold T, every callable and every (callable, parameter, value)
 * whose count is strictly below T is flagged as a simplification candidate.
 * A count equal to T is kept. When an API description is supplied, callables
 * that were never called are included with a count of zero, and an explicit
 * argument equal to the parameter's declared default counts as a use of the
 * default.
 *
 * The affected-files table answers: if every callable called at most
 * `call_cutoff` times were removed, and every parameter deviating at most
 * `parameter_cutoff` times were fixed to its most common value, how many
 * files would need changes?
 */

#include "aua/api/api_description.hpp"
#include "aua/usage/usage_aggregate.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace aua::usage {

    struct FlaggedCallable {
        std::string qualified_name;
        std::uint64_t count = 0;
    };

    struct FlaggedValue {
        std::string qualified_name;
        std::string parameter;
        ValueSignature value;
        std::uint64_t count = 0;
    };

    /**
     * Most common value of one parameter and how many calls deviate from it.
     */
    struct ParameterSummary {
        std::string qualified_name;
        std::string parameter;
        ValueSignature most_common;
        std::uint64_t most_common_count = 0;
        std::uint64_t deviating = 0;
    };

    struct AffectedFiles {
        std::uint64_t call_cutoff = 0;
        std::uint64_t parameter_cutoff = 0;
        std::uint64_t files = 0;
    };

    struct ImprovementReport {
        std::uint64_t threshold = 1;

        std::vector<FlaggedCallable> rarely_called;
        std::vector<FlaggedValue> rare_values;

        std::vector<std::string> used_classes;
        std::vector<std::string> unused_classes;

        std::vector<ParameterSummary> parameters;

        /// Entry i = number of items whose count is at most i.
        std::vector<std::uint64_t> constructors_called_at_most;
        std::vector<std::uint64_t> functions_called_at_most;
        std::vector<std::uint64_t> parameters_deviating_at_most;

        /// One row per cutoff pair with parameter_cutoff >= call_cutoff, both
        /// up to the distribution limit. Empty when no file was recorded.
        std::vector<AffectedFiles> affected_files;
    };

    struct ImprovementOptions {
        std::uint64_t threshold = 1;
        std::size_t distribution_limit = 100;  ///< Longest "at most i" table
    };

    /**
     * Builds the report. `api` may be null, in which case only elements that
     * appear in the aggregate are considered and no class analysis is done.
     */
    [[nodiscard]] ImprovementReport build_improvement_report(const PartialAggregate& aggregate,
                                                             const api::ApiDescription* api,
                                                             const ImprovementOptions& options = {});

    /**
     * "At most i" table over a list of counts, for i in [0, min(max, limit)].
     */
    [[nodiscard]] std::vector<std::uint64_t> at_most_distribution(const std::vector<std::uint64_t>& counts,
                                                                  std::size_t limit);

    /**
     * Histogram with explicit occurrences of `declared_default` moved into the
     * <default> bucket.
     */
    [[nodiscard]] Histogram fold_declared_default(const Histogram& histogram,
                                                  const ValueSignature& declared_default);

}  // namespace aua::usage

#endif //AUA_USAGE_IMPROVEMENT_FILTER_HPP
