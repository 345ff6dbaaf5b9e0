//
// Created by gregorian-rayne on 10/18/26.
//

#include "aua/engine/file_analyzer.hpp"
#include "aua/python/syntax_tree.hpp"
#include "aua/resolve/call_resolver.hpp"
#include "aua/usage/usage_aggregator.hpp"

#include <algorithm>

namespace aua::engine {

    namespace {

        FileAnalysis syntax_error(const std::string& relative_path, const Error& error) {
            FileAnalysis result;
            result.outcome = FileOutcome::SyntaxError;
            const std::string where = error.context() ? relative_path + ":" + *error.context() : relative_path;
            result.error = Error::parse_error(error.message(), where);
            return result;
        }

    }  // namespace

    FileAnalyzer::FileAnalyzer(const api::ApiDescription& api,
                               std::vector<std::string> packages,
                               const bool relevance_filter,
                               const AnalysisLimits limits)
        : api_(api)
        , packages_(std::move(packages))
        , relevance_filter_(relevance_filter)
        , limits_(limits) {
        if (!api_.package().empty() &&
            std::find(packages_.begin(), packages_.end(), api_.package()) == packages_.end()) {
            packages_.push_back(api_.package());
        }
        packages_.erase(std::remove(packages_.begin(), packages_.end(), std::string{}), packages_.end());
    }

    bool FileAnalyzer::is_relevant(const std::string_view text) const {
        if (!relevance_filter_ || packages_.empty()) {
            return true;
        }
        return std::any_of(packages_.begin(), packages_.end(), [text](const std::string& package) {
            return text.find(package) != std::string_view::npos;
        });
    }

    FileAnalysis FileAnalyzer::analyze(const std::string& relative_path, const std::string_view text) const {
        FileAnalysis result;

        if (limits_.max_file_bytes > 0 && text.size() > limits_.max_file_bytes) {
            result.outcome = FileOutcome::SyntaxError;
            result.error = Error::parse_error(
                "file exceeds " + std::to_string(limits_.max_file_bytes) + " bytes", relative_path);
            return result;
        }

        if (!is_relevant(text)) {
            result.outcome = FileOutcome::Irrelevant;
            return result;
        }

        python::ParseLimits parse_limits;
        parse_limits.max_nesting_depth = limits_.max_nesting_depth;
        if (limits_.file_timeout.count() > 0) {
            parse_limits.deadline = std::chrono::steady_clock::now() + limits_.file_timeout;
        }

        auto tree = python::SyntaxTree::parse(text, parse_limits);
        if (tree.is_err()) {
            return syntax_error(relative_path, tree.error());
        }

        auto sites = resolve::find_call_sites(api_, tree.value(), relative_path, parse_limits.deadline);
        if (sites.is_err()) {
            return syntax_error(relative_path, sites.error());
        }

        usage::UsageAggregator aggregator(api_);
        aggregator.add_all(sites.value());
        result.aggregate = aggregator.take();
        result.outcome = FileOutcome::Analyzed;
        return result;
    }

}  // namespace aua::engine
