//
// Created by gregorian-rayne on 10/16/26.
//

#include "aua/usage/usage_aggregate.hpp"

namespace aua::usage {

    bool PartialAggregate::empty() const noexcept {
        return call_counts.empty() && parameter_histograms.empty() &&
               unresolved_calls == 0 && malformed_calls == 0;
    }

    std::uint64_t PartialAggregate::resolved_calls() const noexcept {
        std::uint64_t sum = 0;
        for (const auto& [name, count] : call_counts) {
            sum += count;
        }
        return sum;
    }

    void PartialAggregate::merge_from(const PartialAggregate& other) {
        for (const auto& [name, count] : other.call_counts) {
            call_counts[name] += count;
        }
        for (const auto& [element, parameters] : other.parameter_histograms) {
            auto& target = parameter_histograms[element];
            for (const auto& [parameter, histogram] : parameters) {
                auto& bins = target[parameter];
                for (const auto& [value, count] : histogram) {
                    bins[value] += count;
                }
            }
        }
        unresolved_calls += other.unresolved_calls;
        for (const auto& [reason, count] : other.unresolved_by_reason) {
            unresolved_by_reason[reason] += count;
        }
        malformed_calls += other.malformed_calls;

        for (const auto& [element, files] : other.call_files) {
            call_files[element].insert(files.begin(), files.end());
        }
        for (const auto& [element, parameters] : other.value_files) {
            auto& target = value_files[element];
            for (const auto& [parameter, values] : parameters) {
                auto& bins = target[parameter];
                for (const auto& [value, files] : values) {
                    bins[value].insert(files.begin(), files.end());
                }
            }
        }
    }

    PartialAggregate merge(PartialAggregate a, const PartialAggregate& b) {
        a.merge_from(b);
        return a;
    }

    PartialAggregate merge_all(const std::vector<PartialAggregate>& aggregates) {
        PartialAggregate result;
        for (const auto& aggregate : aggregates) {
            result.merge_from(aggregate);
        }
        return result;
    }

    PartialAggregate parallel_merge(std::vector<PartialAggregate> aggregates, parallel::ThreadPool& pool) {
        return parallel::tree_reduce(
            std::move(aggregates),
            PartialAggregate{},
            [](PartialAggregate a, PartialAggregate b) {
                return merge(std::move(a), b);
            },
            pool
        );
    }

    std::uint64_t total(const Histogram& histogram) noexcept {
        std::uint64_t sum = 0;
        for (const auto& [value, count] : histogram) {
            sum += count;
        }
        return sum;
    }

}  // namespace aua::usage
