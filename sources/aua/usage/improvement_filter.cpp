//
// Created by gregorian-rayne on 10/16/26.
//

#include "aua/usage/improvement_filter.hpp"
#include "aua/utils/string_utils.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <optional>
#include <set>

namespace aua::usage {

    namespace {

        bool is_constructor(const std::string& qualified_name) {
            const auto bare = string_utils::last_component(qualified_name);
            return bare == "__init__" || bare == "__new__";
        }

        std::uint64_t count_of(const PartialAggregate& aggregate, const std::string& name) {
            const auto it = aggregate.call_counts.find(name);
            return it == aggregate.call_counts.end() ? 0 : it->second;
        }

        std::optional<ValueSignature> declared_default(const api::ApiDescription* api,
                                                       const std::string& element,
                                                       const std::string& parameter) {
            const ApiElement* found = api == nullptr ? nullptr : api->find(element);
            if (found == nullptr) {
                return std::nullopt;
            }
            for (const auto& formal : found->parameters) {
                if (formal.name == parameter && formal.default_value) {
                    return ValueSignature::literal(*formal.default_value);
                }
            }
            return std::nullopt;
        }

        const FileSet* files_passing(const PartialAggregate& aggregate, const std::string& element,
                                     const std::string& parameter, const ValueSignature& value) {
            const auto by_element = aggregate.value_files.find(element);
            if (by_element == aggregate.value_files.end()) {
                return nullptr;
            }
            const auto by_parameter = by_element->second.find(parameter);
            if (by_parameter == by_element->second.end()) {
                return nullptr;
            }
            const auto files = by_parameter->second.find(value);
            return files == by_parameter->second.end() ? nullptr : &files->second;
        }

        /**
         * Smallest call cutoff and smallest parameter cutoff at which a file
         * is affected. A file calling nothing removable keeps `never`.
         */
        struct FileCutoffs {
            std::uint64_t call;
            std::uint64_t parameter;
        };

        class AffectedFilesTable {
        public:
            explicit AffectedFilesTable(const std::size_t limit) : limit_(limit) {}

            void lower_call(const std::string& file, const std::uint64_t cutoff) {
                auto& entry = entry_for(file);
                entry.call = std::min(entry.call, cutoff);
            }

            void lower_parameter(const std::string& file, const std::uint64_t cutoff) {
                auto& entry = entry_for(file);
                entry.parameter = std::min(entry.parameter, cutoff);
            }

            /**
             * affected(c, p) = |call <= c| + |parameter <= p| - |both|.
             * Cutoffs above the limit all land in the overflow slot.
             */
            [[nodiscard]] std::vector<AffectedFiles> rows() const {
                std::vector<AffectedFiles> result;
                if (files_.empty()) {
                    return result;
                }

                const std::size_t size = limit_ + 2;
                std::vector<std::uint64_t> by_call(size, 0);
                std::vector<std::uint64_t> by_parameter(size, 0);
                std::vector<std::vector<std::uint64_t>> both(size, std::vector<std::uint64_t>(size, 0));
                for (const auto& [file, cutoffs] : files_) {
                    const std::size_t c = slot(cutoffs.call);
                    const std::size_t p = slot(cutoffs.parameter);
                    ++by_call[c];
                    ++by_parameter[p];
                    ++both[c][p];
                }

                for (std::size_t i = 1; i < size; ++i) {
                    by_call[i] += by_call[i - 1];
                    by_parameter[i] += by_parameter[i - 1];
                }
                for (std::size_t c = 0; c < size; ++c) {
                    for (std::size_t p = 0; p < size; ++p) {
                        if (c > 0) both[c][p] += both[c - 1][p];
                        if (p > 0) both[c][p] += both[c][p - 1];
                        if (c > 0 && p > 0) both[c][p] -= both[c - 1][p - 1];
                    }
                }

                for (std::size_t c = 0; c <= limit_; ++c) {
                    for (std::size_t p = c; p <= limit_; ++p) {
                        result.push_back({c, p, by_call[c] + by_parameter[p] - both[c][p]});
                    }
                }
                return result;
            }

        private:
            static constexpr std::uint64_t never = std::numeric_limits<std::uint64_t>::max();

            FileCutoffs& entry_for(const std::string& file) {
                return files_.try_emplace(file, FileCutoffs{never, never}).first->second;
            }

            [[nodiscard]] std::size_t slot(const std::uint64_t cutoff) const {
                return static_cast<std::size_t>(std::min<std::uint64_t>(cutoff, limit_ + 1));
            }

            std::size_t limit_;
            std::map<std::string, FileCutoffs> files_;
        };

    }  // namespace

    std::vector<std::uint64_t> at_most_distribution(const std::vector<std::uint64_t>& counts,
                                                    const std::size_t limit) {
        if (counts.empty()) {
            return {};
        }
        const std::uint64_t max = *std::max_element(counts.begin(), counts.end());
        const std::size_t length = static_cast<std::size_t>(std::min<std::uint64_t>(max, limit)) + 1;

        std::vector<std::uint64_t> sorted = counts;
        std::sort(sorted.begin(), sorted.end());

        std::vector<std::uint64_t> result(length);
        for (std::size_t i = 0; i < length; ++i) {
            result[i] = static_cast<std::uint64_t>(
                std::upper_bound(sorted.begin(), sorted.end(), static_cast<std::uint64_t>(i)) - sorted.begin()
            );
        }
        return result;
    }

    Histogram fold_declared_default(const Histogram& histogram, const ValueSignature& declared_default) {
        Histogram folded = histogram;
        const auto explicit_default = folded.find(declared_default);
        if (explicit_default != folded.end()) {
            folded[ValueSignature::uses_default()] += explicit_default->second;
            folded.erase(declared_default);
        }
        return folded;
    }

    ImprovementReport build_improvement_report(const PartialAggregate& aggregate,
                                               const api::ApiDescription* api,
                                               const ImprovementOptions& options) {
        ImprovementReport report;
        report.threshold = options.threshold;

        std::set<std::string> callables;
        for (const auto& [name, count] : aggregate.call_counts) {
            callables.insert(name);
        }
        if (api != nullptr) {
            for (const auto* element : api->callables()) {
                callables.insert(element->qualified_name);
            }
        }

        AffectedFilesTable affected(options.distribution_limit);
        for (const auto& [element, files] : aggregate.call_files) {
            const std::uint64_t count = count_of(aggregate, element);
            for (const auto& file : files) {
                affected.lower_call(file, count);
            }
        }

        std::vector<std::uint64_t> constructor_counts;
        std::vector<std::uint64_t> function_counts;
        for (const auto& name : callables) {
            const std::uint64_t count = count_of(aggregate, name);
            if (count < options.threshold) {
                report.rarely_called.push_back({name, count});
            }
            (is_constructor(name) ? constructor_counts : function_counts).push_back(count);
        }

        std::vector<std::uint64_t> deviations;
        for (const auto& [element, parameters] : aggregate.parameter_histograms) {
            for (const auto& [parameter, observed] : parameters) {
                const auto default_value = declared_default(api, element, parameter);
                const Histogram histogram = default_value ? fold_declared_default(observed, *default_value) : observed;

                ParameterSummary summary;
                summary.qualified_name = element;
                summary.parameter = parameter;

                for (const auto& [value, count] : histogram) {
                    if (count < options.threshold) {
                        report.rare_values.push_back({element, parameter, value, count});
                    }
                    if (count > summary.most_common_count) {
                        summary.most_common = value;
                        summary.most_common_count = count;
                    }
                }
                summary.deviating = total(histogram) - summary.most_common_count;
                deviations.push_back(summary.deviating);

                for (const auto& [value, count] : histogram) {
                    if (value == summary.most_common) {
                        continue;
                    }
                    const bool explicit_default = value.kind == SignatureKind::UsesDefault && default_value;
                    if (const FileSet* files = files_passing(aggregate, element, parameter,
                                                             explicit_default ? *default_value : value)) {
                        for (const auto& file : *files) {
                            affected.lower_parameter(file, summary.deviating);
                        }
                    }
                }
                report.parameters.push_back(std::move(summary));
            }
        }

        if (api != nullptr) {
            for (const auto& class_name : api->classes()) {
                const auto members = api->members_of(class_name);
                const bool used = std::any_of(members.begin(), members.end(), [&](const ApiElement* member) {
                    return count_of(aggregate, member->qualified_name) > 0;
                });
                (used ? report.used_classes : report.unused_classes).push_back(class_name);
            }
            std::sort(report.used_classes.begin(), report.used_classes.end());
            std::sort(report.unused_classes.begin(), report.unused_classes.end());
        }

        report.constructors_called_at_most = at_most_distribution(constructor_counts, options.distribution_limit);
        report.functions_called_at_most = at_most_distribution(function_counts, options.distribution_limit);
        report.parameters_deviating_at_most = at_most_distribution(deviations, options.distribution_limit);
        report.affected_files = affected.rows();
        return report;
    }

}  // namespace aua::usage
