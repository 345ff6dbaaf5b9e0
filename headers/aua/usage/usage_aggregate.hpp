//
// Created by gregorian-rayne on 10/16/26.
//

#ifndef AUA_USAGE_USAGE_AGGREGATE_HPP
#define AUA_USAGE_USAGE_AGGREGATE_HPP

/**
 * @file usage_aggregate.hpp
 * @brief Usage counts of one file or batch, and how to combine them.
 *
 * Merging is a key-wise sum (a union for the file sets), so it is
 * associative and commutative:
 * @code
 *     merge(merge(a, b), c) == merge(a, merge(b, c))
 *     merge(a, b) == merge(b, a)
 * @endcode
 * Ordered maps keep the serialized form independent of processing order.
 */

#include "aua/types.hpp"
#include "aua/utils/parallel.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace aua::usage {

    using Histogram = std::map<ValueSignature, std::uint64_t>;
    using FileSet = std::set<std::string>;

    struct PartialAggregate {
        std::map<std::string, std::uint64_t> call_counts;
        std::map<std::string, std::map<std::string, Histogram>> parameter_histograms;
        std::uint64_t unresolved_calls = 0;
        std::map<std::string, std::uint64_t> unresolved_by_reason;
        std::uint64_t malformed_calls = 0;

        /// Files calling each element.
        std::map<std::string, FileSet> call_files;
        /// Files passing each value explicitly, by element and parameter.
        std::map<std::string, std::map<std::string, std::map<ValueSignature, FileSet>>> value_files;

        [[nodiscard]] bool empty() const noexcept;

        /**
         * Sum of all resolved call counts.
         */
        [[nodiscard]] std::uint64_t resolved_calls() const noexcept;

        /**
         * Adds `other` into this aggregate.
         */
        void merge_from(const PartialAggregate& other);

        bool operator==(const PartialAggregate&) const = default;
    };

    [[nodiscard]] PartialAggregate merge(PartialAggregate a, const PartialAggregate& b);

    /**
     * Sequential fold over all aggregates.
     */
    [[nodiscard]] PartialAggregate merge_all(const std::vector<PartialAggregate>& aggregates);

    /**
     * Pairwise tree reduction on the pool. Same result as merge_all().
     */
    [[nodiscard]] PartialAggregate parallel_merge(std::vector<PartialAggregate> aggregates,
                                                  parallel::ThreadPool& pool);

    /**
     * Total number of observations in a histogram.
     */
    [[nodiscard]] std::uint64_t total(const Histogram& histogram) noexcept;

}  // namespace aua::usage

#endif //AUA_USAGE_USAGE_AGGREGATE_HPP
