//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef AUA_CORE_CONFIG_HPP
#define AUA_CORE_CONFIG_HPP

#include "aua/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace aua::core {

    struct AnalysisConfig {
        std::vector<std::string> packages;  ///< Prefixes used by the relevance pre-filter
        bool relevance_filter = true;
        std::vector<std::string> extensions = {".py"};
        std::int64_t min_usages = 1;
    };

    struct CorpusConfig {
        std::string exclude_file;
        std::vector<std::string> exclude = {"**/site-packages/**"};
    };

    struct PerformanceConfig {
        std::int64_t num_threads = 0;
        std::int64_t max_file_bytes = 4 * 1024 * 1024;
        std::int64_t max_nesting_depth = 200;
        std::int64_t file_timeout_ms = 0;
    };

    struct CheckpointConfig {
        std::string directory = ".aua/checkpoints";
        std::int64_t write_retries = 3;
        std::int64_t retry_delay_ms = 50;
    };

    struct LoggingConfig {
        std::string level = "info";
        std::string file;
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    };

    class Config {
    public:
        Config() = default;

        AnalysisConfig analysis;
        CorpusConfig corpus;
        PerformanceConfig performance;
        CheckpointConfig checkpoint;
        LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @return The validated Config, or a ConfigError naming the file.
         */
        static Result<Config, Error> load_from_file(const std::filesystem::path& path);

        /**
         * Load configuration from TOML text. Every key is optional.
         */
        static Result<Config, Error> load_from_string(const std::string& content);

        static Config default_config();

        [[nodiscard]] Result<void, Error> save_to_file(const std::filesystem::path& path) const;

        /**
         * Serialize the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Rejects negative counts, non-positive limits, an empty extension
         * list and unknown log levels.
         */
        [[nodiscard]] Result<void, Error> validate() const;
    };

    /**
     * Whether `level` is one of trace, debug, info, warn, error, off.
     */
    bool is_known_log_level(const std::string& level);

}  // namespace aua::core

#endif //AUA_CORE_CONFIG_HPP
