//
// Created by gregorian-rayne on 10/16/26.
//

#ifndef AUA_USAGE_USAGE_AGGREGATOR_HPP
#define AUA_USAGE_USAGE_AGGREGATOR_HPP

#include "aua/api/api_description.hpp"
#include "aua/usage/usage_aggregate.hpp"

#include <vector>

namespace aua::usage {

    /**
     * Folds call sites into a PartialAggregate.
     *
     * A resolved call adds one to its target's count and one observation per
     * bound parameter, and records its file against the target and against
     * every value passed explicitly. An unresolved call only counts as
     * unresolved.
     */
    class UsageAggregator {
    public:
        explicit UsageAggregator(const api::ApiDescription& api);

        void add(const CallSite& site);
        void add_all(const std::vector<CallSite>& sites);

        [[nodiscard]] const PartialAggregate& aggregate() const noexcept { return aggregate_; }

        /**
         * Moves the aggregate out and resets the aggregator.
         */
        [[nodiscard]] PartialAggregate take();

    private:
        void add_unresolved(UnresolvedReason reason);

        const api::ApiDescription& api_;
        PartialAggregate aggregate_;
    };

}  // namespace aua::usage

#endif //AUA_USAGE_USAGE_AGGREGATOR_HPP
