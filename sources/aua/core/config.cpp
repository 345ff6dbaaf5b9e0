//
// Created by gregorian-rayne on 10/18/26.
//

#include "aua/core/config.hpp"

#include "aua/utils/file_utils.hpp"
#include "aua/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <array>
#include <sstream>

namespace aua::core {

    namespace {

        std::vector<std::string> read_string_array(const toml::node_view<toml::node> node) {
            std::vector<std::string> result;
            if (const auto* array = node.as_array()) {
                for (auto& element : *array) {
                    result.emplace_back(element.value_or(std::string{}));
                }
            }
            return result;
        }

        std::string quoted(const std::string& value) {
            std::string result = "\"";
            for (const char c : value) {
                if (c == '"' || c == '\\') {
                    result += '\\';
                }
                result += c;
            }
            result += '"';
            return result;
        }

        std::string quoted_array(const std::vector<std::string>& values) {
            std::vector<std::string> parts;
            parts.reserve(values.size());
            for (const auto& value : values) {
                parts.push_back(quoted(value));
            }
            return "[" + string_utils::join(parts, ", ") + "]";
        }

    }  // namespace

    bool is_known_log_level(const std::string& level) {
        static constexpr std::array<const char*, 6> kLevels = {"trace", "debug", "info", "warn", "error", "off"};
        const auto lowered = string_utils::to_lower(level);
        return std::any_of(kLevels.begin(), kLevels.end(), [&lowered](const char* known) {
            return lowered == known;
        });
    }

    Result<Config, Error> Config::load_from_file(const std::filesystem::path& path) {
        const auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config, Error>::failure(
                Error::config_error("Configuration file not readable", path.string())
            );
        }

        return load_from_string(content.value()).map_error([&path](const Error& error) {
            return error.with_context(path.string());
        });
    }

    Result<Config, Error> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;

            if (tbl["analysis"]) {
                auto analysis = tbl["analysis"];
                if (analysis["packages"])
                    config.analysis.packages = read_string_array(analysis["packages"]);
                if (analysis["relevance_filter"])
                    config.analysis.relevance_filter = analysis["relevance_filter"].value_or(true);
                if (analysis["extensions"])
                    config.analysis.extensions = read_string_array(analysis["extensions"]);
                if (analysis["min_usages"])
                    config.analysis.min_usages = analysis["min_usages"].value_or(std::int64_t{1});
            }

            if (tbl["corpus"]) {
                auto corpus = tbl["corpus"];
                if (corpus["exclude_file"])
                    config.corpus.exclude_file = corpus["exclude_file"].value_or(std::string{});
                if (corpus["exclude"])
                    config.corpus.exclude = read_string_array(corpus["exclude"]);
            }

            if (tbl["performance"]) {
                auto perf = tbl["performance"];
                if (perf["num_threads"])
                    config.performance.num_threads = perf["num_threads"].value_or(std::int64_t{0});
                if (perf["max_file_bytes"])
                    config.performance.max_file_bytes = perf["max_file_bytes"].value_or(std::int64_t{4 * 1024 * 1024});
                if (perf["max_nesting_depth"])
                    config.performance.max_nesting_depth = perf["max_nesting_depth"].value_or(std::int64_t{200});
                if (perf["file_timeout_ms"])
                    config.performance.file_timeout_ms = perf["file_timeout_ms"].value_or(std::int64_t{0});
            }

            if (tbl["checkpoint"]) {
                auto checkpoint = tbl["checkpoint"];
                if (checkpoint["directory"])
                    config.checkpoint.directory = checkpoint["directory"].value_or(std::string{".aua/checkpoints"});
                if (checkpoint["write_retries"])
                    config.checkpoint.write_retries = checkpoint["write_retries"].value_or(std::int64_t{3});
                if (checkpoint["retry_delay_ms"])
                    config.checkpoint.retry_delay_ms = checkpoint["retry_delay_ms"].value_or(std::int64_t{50});
            }

            if (tbl["logging"]) {
                auto log = tbl["logging"];
                if (log["level"])
                    config.logging.level = log["level"].value_or(std::string{"info"});
                if (log["file"])
                    config.logging.file = log["file"].value_or(std::string{});
                if (log["pattern"])
                    config.logging.pattern = log["pattern"].value_or(config.logging.pattern);
            }

            if (auto validation = config.validate(); validation.is_err()) {
                return Result<Config, Error>::failure(validation.error());
            }

            return Result<Config, Error>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<Config, Error>::failure(
                Error::config_error("Failed to parse TOML configuration: " + std::string(err.description()))
            );
        }
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void, Error> Config::save_to_file(const std::filesystem::path& path) const {
        auto written = file_utils::write_file(path, to_string());
        if (written.is_err()) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write configuration", path.string())
            );
        }
        return Result<void, Error>::success();
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[analysis]\n";
        ss << "packages = " << quoted_array(analysis.packages) << "\n";
        ss << "relevance_filter = " << (analysis.relevance_filter ? "true" : "false") << "\n";
        ss << "extensions = " << quoted_array(analysis.extensions) << "\n";
        ss << "min_usages = " << analysis.min_usages << "\n\n";

        ss << "[corpus]\n";
        ss << "exclude_file = " << quoted(corpus.exclude_file) << "\n";
        ss << "exclude = " << quoted_array(corpus.exclude) << "\n\n";

        ss << "[performance]\n";
        ss << "num_threads = " << performance.num_threads << "\n";
        ss << "max_file_bytes = " << performance.max_file_bytes << "\n";
        ss << "max_nesting_depth = " << performance.max_nesting_depth << "\n";
        ss << "file_timeout_ms = " << performance.file_timeout_ms << "\n\n";

        ss << "[checkpoint]\n";
        ss << "directory = " << quoted(checkpoint.directory) << "\n";
        ss << "write_retries = " << checkpoint.write_retries << "\n";
        ss << "retry_delay_ms = " << checkpoint.retry_delay_ms << "\n\n";

        ss << "[logging]\n";
        ss << "level = " << quoted(logging.level) << "\n";
        ss << "file = " << quoted(logging.file) << "\n";
        ss << "pattern = " << quoted(logging.pattern) << "\n";

        return ss.str();
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (analysis.extensions.empty()) {
            errors.emplace_back("extensions must not be empty");
        }
        if (analysis.min_usages < 0) {
            errors.emplace_back("min_usages must be non-negative");
        }
        if (performance.num_threads < 0) {
            errors.emplace_back("num_threads must be non-negative");
        }
        if (performance.max_file_bytes <= 0) {
            errors.emplace_back("max_file_bytes must be positive");
        }
        if (performance.max_nesting_depth <= 0) {
            errors.emplace_back("max_nesting_depth must be positive");
        }
        if (performance.file_timeout_ms < 0) {
            errors.emplace_back("file_timeout_ms must be non-negative");
        }
        if (checkpoint.directory.empty()) {
            errors.emplace_back("checkpoint directory must not be empty");
        }
        if (checkpoint.write_retries < 0) {
            errors.emplace_back("write_retries must be non-negative");
        }
        if (checkpoint.retry_delay_ms < 0) {
            errors.emplace_back("retry_delay_ms must be non-negative");
        }
        if (!is_known_log_level(logging.level)) {
            errors.emplace_back("unknown log level '" + logging.level + "'");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        return Result<void, Error>::success();
    }

}  // namespace aua::core
