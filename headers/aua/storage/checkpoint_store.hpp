//
// Created by gregorian-rayne on 10/17/26.
//

#ifndef AUA_STORAGE_CHECKPOINT_STORE_HPP
#define AUA_STORAGE_CHECKPOINT_STORE_HPP

/**
 * @file checkpoint_store.hpp
 * @brief Durable per-file progress records for resumable runs.
 *
 * Layout of the checkpoint directory:
 * @code
 *     <directory>/records/<sha256 of corpus-relative path>.json
 * @endcode
 *
 * Each record is written to a temporary file, fsynced and renamed over the
 * final name, so a crash leaves either the old record or the new one. Writes
 * for the same corpus file are serialized through a striped lock; different
 * files never contend on a store-wide lock.
 *
 * Usage:
 * @code
 *     storage::CheckpointStore store({.directory = tmp_dir});
 *     if (auto r = store.open(); r.is_err()) {
 *         return r;  // ConfigError
 *     }
 *     if (!store.is_processed(file, fingerprint)) {
 *         ...
 *         store.record_processed(file, fingerprint, FileOutcome::Analyzed, aggregate);
 *     }
 * @endcode
 */

#include "aua/result.hpp"
#include "aua/types.hpp"
#include "aua/usage/usage_aggregate.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace aua::storage {

    struct CheckpointRecord {
        std::string path;         ///< Corpus-relative path
        std::string fingerprint;  ///< SHA-256 of the file content
        bool processed = true;
        FileOutcome outcome = FileOutcome::Analyzed;
        usage::PartialAggregate aggregate;
        std::optional<std::string> error_message;
    };

    [[nodiscard]] nlohmann::json record_to_json(const CheckpointRecord& record);
    [[nodiscard]] Result<CheckpointRecord, Error> record_from_json(const nlohmann::json& document);

    /**
     * Writes `content` durably to `path`. Replaceable for tests.
     */
    using RecordWriter = std::function<Result<void, Error>(const std::filesystem::path&, std::string_view)>;

    struct CheckpointOptions {
        std::filesystem::path directory;
        std::size_t write_retries = 3;
        std::chrono::milliseconds retry_delay{50};
        std::size_t lock_stripes = 64;
        RecordWriter writer;  ///< Defaults to file_utils::write_file_atomic
    };

    class CheckpointStore {
    public:
        explicit CheckpointStore(CheckpointOptions options);

        CheckpointStore(const CheckpointStore&) = delete;
        CheckpointStore& operator=(const CheckpointStore&) = delete;

        /**
         * Creates the directory, removes temporary files left by interrupted
         * writes and indexes the existing records. Unreadable records are
         * logged and ignored, so their files are processed again.
         *
         * @return ConfigError when the directory cannot be created.
         */
        Result<void, Error> open();

        /**
         * Persists the record of one file, replacing any previous one.
         * Failed writes are retried; after the last attempt a
         * CheckpointError is returned and nothing else is affected.
         */
        Result<void, Error> record_processed(const std::string& file,
                                             const std::string& fingerprint,
                                             FileOutcome outcome,
                                             const usage::PartialAggregate& aggregate,
                                             std::optional<std::string> error_message = std::nullopt);

        Result<void, Error> save(const CheckpointRecord& record);

        /**
         * True only when a processed record exists for `file` with exactly
         * this fingerprint.
         */
        [[nodiscard]] bool is_processed(const std::string& file, const std::string& fingerprint) const;

        /**
         * Reads the record of one file from disk.
         *
         * @return NotFound when no record exists, ParseError when it is corrupt.
         */
        [[nodiscard]] Result<CheckpointRecord, Error> load(const std::string& file) const;

        /**
         * Every durable, readable record, ordered by path.
         */
        [[nodiscard]] std::vector<CheckpointRecord> load_all() const;

        /**
         * Removes every record.
         */
        Result<void, Error> clear();

        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] const std::filesystem::path& directory() const noexcept { return options_.directory; }

    private:
        [[nodiscard]] std::filesystem::path records_directory() const;
        [[nodiscard]] Result<std::filesystem::path, Error> record_path(const std::string& file) const;
        [[nodiscard]] std::mutex& stripe_for(const std::string& file) const;

        CheckpointOptions options_;
        mutable std::vector<std::mutex> stripes_;
        mutable std::shared_mutex index_mutex_;
        std::unordered_map<std::string, std::string> index_;  ///< path -> fingerprint
    };

}  // namespace aua::storage

#endif //AUA_STORAGE_CHECKPOINT_STORE_HPP
