//
// Created by gregorian-rayne on 10/18/26.
//

#include "aua/engine/usage_engine.hpp"
#include "aua/utils/file_utils.hpp"
#include "aua/utils/hash_utils.hpp"
#include "aua/utils/parallel.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <mutex>

namespace aua::engine {

    const char* to_string(const FileStatus status) noexcept {
        switch (status) {
        case FileStatus::Analyzed: return "analyzed";
        case FileStatus::Resumed: return "resumed";
        case FileStatus::Irrelevant: return "irrelevant";
        case FileStatus::ReadFailed: return "read-failed";
        case FileStatus::ParseFailed: return "parse-failed";
        case FileStatus::Cancelled: return "cancelled";
        }
        return "unknown";
    }

    UsageEngine::UsageEngine(const api::ApiDescription& api, storage::CheckpointStore* store, EngineOptions options)
        : api_(api)
        , store_(store)
        , options_(std::move(options)) {}

    bool UsageEngine::stop_requested() const noexcept {
        return cancelled_.load() || (external_cancel_ != nullptr && external_cancel_->load());
    }

    UsageEngine::FileResult UsageEngine::process(const SourceFile& file, const FileAnalyzer& analyzer) const {
        FileResult result;
        if (stop_requested()) {
            return result;
        }

        std::string text;
        if (file.absolute_path.empty()) {
            text = file.text;
        } else {
            auto content = file_utils::read_file(file.absolute_path);
            if (content.is_err()) {
                spdlog::warn("Cannot read {}: {}", file.relative_path, content.error().message());
                result.status = FileStatus::ReadFailed;
                result.failure = FileFailure{file.relative_path, content.error().code(), content.error().message()};
                return result;
            }
            text = std::move(content).value();
        }

        auto fingerprint = hash_utils::compute_sha256(text);
        if (fingerprint.is_err()) {
            spdlog::warn("Cannot fingerprint {}: {}", file.relative_path, fingerprint.error().message());
            result.status = FileStatus::ReadFailed;
            result.failure = FileFailure{file.relative_path, fingerprint.error().code(), fingerprint.error().message()};
            return result;
        }

        if (store_ != nullptr && store_->is_processed(file.relative_path, fingerprint.value())) {
            auto record = store_->load(file.relative_path);
            if (record.is_ok() && record.value().fingerprint == fingerprint.value()) {
                spdlog::debug("Resuming {} from checkpoint", file.relative_path);
                result.status = FileStatus::Resumed;
                result.aggregate = std::move(record.value().aggregate);
                return result;
            }
            spdlog::debug("Checkpoint of {} unusable, reprocessing", file.relative_path);
        }

        FileAnalysis analysis = analyzer.analyze(file.relative_path, text);

        std::optional<std::string> error_message;
        switch (analysis.outcome) {
        case FileOutcome::Analyzed:
            result.status = FileStatus::Analyzed;
            break;
        case FileOutcome::Irrelevant:
            result.status = FileStatus::Irrelevant;
            break;
        case FileOutcome::SyntaxError:
            result.status = FileStatus::ParseFailed;
            if (analysis.error) {
                spdlog::warn("Parse error in {}", analysis.error->to_string());
                error_message = analysis.error->message();
                result.failure = FileFailure{file.relative_path, analysis.error->code(), analysis.error->message()};
            }
            break;
        }

        if (store_ != nullptr) {
            auto saved = store_->record_processed(file.relative_path, fingerprint.value(),
                                                  analysis.outcome, analysis.aggregate, error_message);
            if (saved.is_err()) {
                spdlog::warn("{}", saved.error().to_string());
                result.checkpoint_failed = true;
            }
        }

        result.aggregate = std::move(analysis.aggregate);
        return result;
    }

    Result<EngineResult, Error> UsageEngine::run(const std::vector<SourceFile>& files) {
        const auto start = std::chrono::steady_clock::now();

        const FileAnalyzer analyzer(api_, options_.packages, options_.relevance_filter, options_.limits);
        parallel::ThreadPool pool(options_.num_threads);

        spdlog::info("Analyzing {} file(s) on {} thread(s)", files.size(), pool.size());

        std::mutex progress_mutex;
        std::size_t completed = 0;

        std::vector<FileResult> results;
        try {
            results = parallel::map(files, [&](const SourceFile& file) {
                FileResult file_result = process(file, analyzer);
                if (progress_ && file_result.status != FileStatus::Cancelled) {
                    std::lock_guard lock(progress_mutex);
                    ++completed;
                    progress_(FileProgress{completed, files.size(), file.relative_path, file_result.status});
                }
                return file_result;
            }, pool);
        } catch (const std::exception& e) {
            return Result<EngineResult, Error>::failure(
                Error::internal_error(std::string("Analysis worker failed: ") + e.what())
            );
        }

        EngineResult output;
        RunSummary& summary = output.summary;
        summary.total_files = files.size();

        std::vector<usage::PartialAggregate> aggregates;
        aggregates.reserve(results.size());

        for (auto& file_result : results) {
            switch (file_result.status) {
            case FileStatus::Analyzed: ++summary.analyzed; break;
            case FileStatus::Resumed: ++summary.resumed; break;
            case FileStatus::Irrelevant: ++summary.irrelevant; break;
            case FileStatus::ReadFailed: ++summary.read_failures; break;
            case FileStatus::ParseFailed: ++summary.parse_failures; break;
            case FileStatus::Cancelled: summary.cancelled = true; break;
            }
            if (file_result.checkpoint_failed) {
                ++summary.checkpoint_failures;
            }
            if (file_result.failure) {
                summary.failures.push_back(std::move(*file_result.failure));
            }
            if (!file_result.aggregate.empty()) {
                aggregates.push_back(std::move(file_result.aggregate));
            }
        }
        if (stop_requested()) {
            summary.cancelled = true;
        }

        try {
            output.aggregate = usage::parallel_merge(std::move(aggregates), pool);
        } catch (const std::exception& e) {
            return Result<EngineResult, Error>::failure(
                Error::internal_error(std::string("Merge failed: ") + e.what())
            );
        }

        summary.resolved_calls = output.aggregate.resolved_calls();
        summary.unresolved_calls = output.aggregate.unresolved_calls;
        summary.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);

        spdlog::info("Processed {}/{} file(s): {} analyzed, {} resumed, {} irrelevant, {} read failure(s), {} parse failure(s)",
                     summary.processed(), summary.total_files, summary.analyzed, summary.resumed,
                     summary.irrelevant, summary.read_failures, summary.parse_failures);
        if (summary.cancelled) {
            spdlog::info("Run was cancelled; rerun with the same checkpoint directory to resume");
        }

        return Result<EngineResult, Error>::success(std::move(output));
    }

}  // namespace aua::engine
