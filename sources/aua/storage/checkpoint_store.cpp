//
// Created by gregorian-rayne on 10/17/26.
//

#include "aua/storage/checkpoint_store.hpp"
#include "aua/export/usage_json.hpp"
#include "aua/utils/file_utils.hpp"
#include "aua/utils/hash_utils.hpp"
#include "aua/utils/json_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace aua::storage {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    namespace {

        constexpr const char* kRecordsDirectory = "records";
        constexpr const char* kRecordExtension = ".json";

    }  // namespace

    json record_to_json(const CheckpointRecord& record) {
        json output;
        output["path"] = record.path;
        output["fingerprint"] = record.fingerprint;
        output["processed"] = record.processed;
        output["outcome"] = to_string(record.outcome);
        output["aggregate"] = export_json::aggregate_to_json(record.aggregate);
        if (record.error_message) {
            output["error"] = *record.error_message;
        }
        return output;
    }

    Result<CheckpointRecord, Error> record_from_json(const json& document) {
        if (!document.is_object()) {
            return Result<CheckpointRecord, Error>::failure(
                Error::parse_error("checkpoint record must be a JSON object")
            );
        }

        CheckpointRecord record;
        record.path = json_utils::get_or<std::string>(document, "path", "");
        record.fingerprint = json_utils::get_or<std::string>(document, "fingerprint", "");
        if (record.path.empty() || record.fingerprint.empty()) {
            return Result<CheckpointRecord, Error>::failure(
                Error::parse_error("checkpoint record lacks path or fingerprint")
            );
        }

        record.processed = json_utils::get_or<bool>(document, "processed", false);

        const auto outcome_text = json_utils::get_or<std::string>(document, "outcome", "");
        const auto outcome = file_outcome_from_string(outcome_text);
        if (!outcome) {
            return Result<CheckpointRecord, Error>::failure(
                Error::parse_error("unknown checkpoint outcome", outcome_text)
            );
        }
        record.outcome = *outcome;

        if (const auto it = document.find("aggregate"); it != document.end()) {
            record.aggregate = export_json::aggregate_from_json(*it);
        }
        if (const auto it = document.find("error"); it != document.end() && it->is_string()) {
            record.error_message = it->get<std::string>();
        }
        return Result<CheckpointRecord, Error>::success(std::move(record));
    }

    CheckpointStore::CheckpointStore(CheckpointOptions options)
        : options_(std::move(options))
        , stripes_(std::max<std::size_t>(1, options_.lock_stripes)) {
        if (!options_.writer) {
            options_.writer = [](const fs::path& path, const std::string_view content) {
                return file_utils::write_file_atomic(path, content);
            };
        }
    }

    fs::path CheckpointStore::records_directory() const {
        return options_.directory / kRecordsDirectory;
    }

    Result<fs::path, Error> CheckpointStore::record_path(const std::string& file) const {
        return hash_utils::compute_sha256(file).map([this](const std::string& digest) {
            return records_directory() / (digest + kRecordExtension);
        });
    }

    std::mutex& CheckpointStore::stripe_for(const std::string& file) const {
        return stripes_[hash_utils::fnv1a_hash(file) % stripes_.size()];
    }

    Result<void, Error> CheckpointStore::open() {
        const fs::path records = records_directory();
        std::error_code ec;
        fs::create_directories(records, ec);
        if (ec || !fs::is_directory(records, ec)) {
            return Result<void, Error>::failure(
                Error::config_error("Cannot create checkpoint directory", records.string())
            );
        }

        std::unordered_map<std::string, std::string> index;
        std::size_t removed = 0;

        for (auto it = fs::directory_iterator(records, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            const fs::path& path = it->path();

            if (file_utils::is_temp_file(path)) {
                std::error_code remove_ec;
                if (fs::remove(path, remove_ec)) {
                    ++removed;
                } else if (remove_ec) {
                    spdlog::warn("Could not remove orphaned checkpoint file {}: {}", path.string(), remove_ec.message());
                }
                continue;
            }
            if (path.extension() != kRecordExtension) {
                continue;
            }

            auto record = json_utils::read_file(path).and_then([](const json& document) {
                return record_from_json(document);
            });
            if (record.is_err()) {
                spdlog::warn("Ignoring unreadable checkpoint {}: {}", path.string(), record.error().to_string());
                continue;
            }
            if (record.value().processed) {
                index[record.value().path] = record.value().fingerprint;
            }
        }
        if (ec) {
            return Result<void, Error>::failure(
                Error::config_error("Cannot list checkpoint directory: " + ec.message(), records.string())
            );
        }

        if (removed > 0) {
            spdlog::debug("Removed {} orphaned temporary checkpoint file(s)", removed);
        }
        spdlog::debug("Checkpoint store {} holds {} record(s)", options_.directory.string(), index.size());

        std::unique_lock lock(index_mutex_);
        index_ = std::move(index);
        return Result<void, Error>::success();
    }

    Result<void, Error> CheckpointStore::record_processed(const std::string& file,
                                                          const std::string& fingerprint,
                                                          const FileOutcome outcome,
                                                          const usage::PartialAggregate& aggregate,
                                                          std::optional<std::string> error_message) {
        CheckpointRecord record;
        record.path = file;
        record.fingerprint = fingerprint;
        record.processed = true;
        record.outcome = outcome;
        record.aggregate = aggregate;
        record.error_message = std::move(error_message);
        return save(record);
    }

    Result<void, Error> CheckpointStore::save(const CheckpointRecord& record) {
        auto path = record_path(record.path);
        if (path.is_err()) {
            return Result<void, Error>::failure(
                Error::checkpoint_error(path.error().message(), record.path)
            );
        }

        std::string content;
        try {
            content = record_to_json(record).dump(2);
        } catch (const json::exception& e) {
            return Result<void, Error>::failure(
                Error::checkpoint_error(std::string("Cannot serialize checkpoint: ") + e.what(), record.path)
            );
        }

        std::lock_guard stripe(stripe_for(record.path));

        const std::size_t attempts = options_.write_retries + 1;
        std::string last_error;
        for (std::size_t attempt = 1; attempt <= attempts; ++attempt) {
            auto written = options_.writer(path.value(), content);
            if (written.is_ok()) {
                std::unique_lock lock(index_mutex_);
                if (record.processed) {
                    index_[record.path] = record.fingerprint;
                } else {
                    index_.erase(record.path);
                }
                return Result<void, Error>::success();
            }

            last_error = written.error().to_string();
            if (attempt < attempts) {
                spdlog::debug("Checkpoint write for {} failed (attempt {}/{}): {}",
                              record.path, attempt, attempts, last_error);
                std::this_thread::sleep_for(options_.retry_delay);
            }
        }

        return Result<void, Error>::failure(
            Error::checkpoint_error("Checkpoint write failed after " + std::to_string(attempts) +
                                    " attempt(s): " + last_error, record.path)
        );
    }

    bool CheckpointStore::is_processed(const std::string& file, const std::string& fingerprint) const {
        std::shared_lock lock(index_mutex_);
        const auto it = index_.find(file);
        return it != index_.end() && it->second == fingerprint;
    }

    Result<CheckpointRecord, Error> CheckpointStore::load(const std::string& file) const {
        auto path = record_path(file);
        if (path.is_err()) {
            return Result<CheckpointRecord, Error>::failure(path.error());
        }

        std::lock_guard stripe(stripe_for(file));
        std::error_code ec;
        if (!fs::exists(path.value(), ec)) {
            return Result<CheckpointRecord, Error>::failure(
                Error::not_found("No checkpoint record", file)
            );
        }
        auto record = json_utils::read_file(path.value()).and_then([](const json& document) {
            return record_from_json(document);
        });
        if (record.is_ok() && record.value().path != file) {
            return Result<CheckpointRecord, Error>::failure(
                Error::parse_error("Checkpoint record belongs to another file", record.value().path)
            );
        }
        return record;
    }

    std::vector<CheckpointRecord> CheckpointStore::load_all() const {
        std::vector<std::string> files;
        {
            std::shared_lock lock(index_mutex_);
            files.reserve(index_.size());
            for (const auto& [file, fingerprint] : index_) {
                files.push_back(file);
            }
        }
        std::sort(files.begin(), files.end());

        std::vector<CheckpointRecord> records;
        records.reserve(files.size());
        for (const auto& file : files) {
            auto record = load(file);
            if (record.is_err()) {
                spdlog::warn("Skipping checkpoint of {}: {}", file, record.error().to_string());
                continue;
            }
            records.push_back(std::move(record).value());
        }
        return records;
    }

    Result<void, Error> CheckpointStore::clear() {
        std::unique_lock lock(index_mutex_);
        std::error_code ec;
        fs::remove_all(records_directory(), ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Cannot clear checkpoints: " + ec.message(), records_directory().string())
            );
        }
        fs::create_directories(records_directory(), ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Cannot recreate checkpoint directory: " + ec.message(), records_directory().string())
            );
        }
        index_.clear();
        return Result<void, Error>::success();
    }

    std::size_t CheckpointStore::size() const {
        std::shared_lock lock(index_mutex_);
        return index_.size();
    }

}  // namespace aua::storage
