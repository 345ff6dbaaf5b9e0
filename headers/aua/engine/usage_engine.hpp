//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef AUA_ENGINE_USAGE_ENGINE_HPP
#define AUA_ENGINE_USAGE_ENGINE_HPP

/**
 * @file usage_engine.hpp
 * @brief Runs the per-file analysis over a corpus and merges the results.
 *
 * Each file goes through: read, fingerprint, checkpoint lookup, analysis,
 * checkpoint write. Files run on a thread pool; per-file aggregates are
 * combined with a tree reduction, so completion order never matters.
 *
 * Usage:
 * @code
 *     engine::UsageEngine engine(api, &store, options);
 *     engine.set_progress_callback([](const engine::FileProgress& p) { ... });
 *     auto result = engine.run(files);
 * @endcode
 */

#include "aua/api/api_description.hpp"
#include "aua/engine/file_analyzer.hpp"
#include "aua/engine/run_summary.hpp"
#include "aua/result.hpp"
#include "aua/storage/checkpoint_store.hpp"
#include "aua/types.hpp"
#include "aua/usage/usage_aggregate.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace aua::engine {

    enum class FileStatus {
        Analyzed,
        Resumed,
        Irrelevant,
        ReadFailed,
        ParseFailed,
        Cancelled
    };

    const char* to_string(FileStatus status) noexcept;

    struct FileProgress {
        std::size_t completed = 0;
        std::size_t total = 0;
        std::string path;
        FileStatus status = FileStatus::Analyzed;
    };

    /**
     * Invoked once per finished file, from worker threads but never
     * concurrently.
     */
    using ProgressCallback = std::function<void(const FileProgress&)>;

    struct EngineOptions {
        unsigned int num_threads = 0;  ///< 0 = hardware concurrency
        AnalysisLimits limits;
        bool relevance_filter = true;
        std::vector<std::string> packages;
    };

    struct EngineResult {
        usage::PartialAggregate aggregate;
        RunSummary summary;
    };

    class UsageEngine {
    public:
        /**
         * @param store Checkpoint store, already opened. May be null, in which
         *        case nothing is resumed or recorded.
         */
        UsageEngine(const api::ApiDescription& api, storage::CheckpointStore* store, EngineOptions options);

        /**
         * Processes every file. Per-file failures are recorded in the summary
         * and never fail the run.
         */
        [[nodiscard]] Result<EngineResult, Error> run(const std::vector<SourceFile>& files);

        /**
         * Stops scheduling new files. Files already finished keep their
         * checkpoints, so a later run resumes from there.
         */
        void cancel() noexcept { cancelled_.store(true); }
        [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_.load(); }

        /**
         * Also honours an external flag, such as one set by a signal handler.
         */
        void set_cancel_flag(const std::atomic<bool>* flag) noexcept { external_cancel_ = flag; }

        void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

    private:
        struct FileResult {
            FileStatus status = FileStatus::Cancelled;
            usage::PartialAggregate aggregate;
            std::optional<FileFailure> failure;
            bool checkpoint_failed = false;
        };

        [[nodiscard]] FileResult process(const SourceFile& file, const FileAnalyzer& analyzer) const;
        [[nodiscard]] bool stop_requested() const noexcept;

        const api::ApiDescription& api_;
        storage::CheckpointStore* store_;
        EngineOptions options_;
        ProgressCallback progress_;
        std::atomic<bool> cancelled_{false};
        const std::atomic<bool>* external_cancel_ = nullptr;
    };

}  // namespace aua::engine

#endif //AUA_ENGINE_USAGE_ENGINE_HPP
