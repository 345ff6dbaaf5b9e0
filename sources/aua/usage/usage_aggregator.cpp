//
// Created by gregorian-rayne on 10/16/26.
//

#include "aua/usage/usage_aggregator.hpp"
#include "aua/binding/argument_binder.hpp"

namespace aua::usage {

    UsageAggregator::UsageAggregator(const api::ApiDescription& api) : api_(api) {}

    void UsageAggregator::add(const CallSite& site) {
        if (const auto* unresolved = site.unresolved()) {
            add_unresolved(unresolved->reason);
            return;
        }

        const auto& target = *site.resolved();
        const ApiElement* element = api_.find(target.qualified_name);
        if (element == nullptr) {
            add_unresolved(UnresolvedReason::NotInApi);
            return;
        }

        ++aggregate_.call_counts[element->qualified_name];
        const std::string& file = site.location.file;
        if (!file.empty()) {
            aggregate_.call_files[element->qualified_name].insert(file);
        }

        const auto binding = binding::bind_call(site, *element);
        if (binding.malformed) {
            ++aggregate_.malformed_calls;
        }
        if (binding.bindings.empty()) {
            return;
        }
        auto& parameters = aggregate_.parameter_histograms[element->qualified_name];
        for (const auto& bound : binding.bindings) {
            ++parameters[bound.parameter][bound.value];
            if (!file.empty() && bound.value.kind != SignatureKind::UsesDefault) {
                aggregate_.value_files[element->qualified_name][bound.parameter][bound.value].insert(file);
            }
        }
    }

    void UsageAggregator::add_all(const std::vector<CallSite>& sites) {
        for (const auto& site : sites) {
            add(site);
        }
    }

    PartialAggregate UsageAggregator::take() {
        PartialAggregate result = std::move(aggregate_);
        aggregate_ = PartialAggregate{};
        return result;
    }

    void UsageAggregator::add_unresolved(const UnresolvedReason reason) {
        ++aggregate_.unresolved_calls;
        ++aggregate_.unresolved_by_reason[to_string(reason)];
    }

}  // namespace aua::usage
