//
// Created by gregorian-rayne on 10/18/26.
//

#include "aua/core/logging.hpp"
#include "aua/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace aua::core {

    std::optional<spdlog::level::level_enum> parse_log_level(const std::string_view level) {
        const auto lowered = string_utils::to_lower(level);
        if (lowered == "trace") return spdlog::level::trace;
        if (lowered == "debug") return spdlog::level::debug;
        if (lowered == "info") return spdlog::level::info;
        if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
        if (lowered == "error") return spdlog::level::err;
        if (lowered == "off") return spdlog::level::off;
        return std::nullopt;
    }

    Result<void, Error> configure_logging(const LoggingConfig& config,
                                          const std::optional<spdlog::level::level_enum> override_level) {
        auto level = parse_log_level(config.level);
        if (!level) {
            return Result<void, Error>::failure(
                Error::config_error("unknown log level", config.level)
            );
        }
        if (override_level) {
            level = override_level;
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (!config.file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
            } catch (const spdlog::spdlog_ex& e) {
                return Result<void, Error>::failure(
                    Error::config_error(std::string("Cannot open log file: ") + e.what(), config.file)
                );
            }
        }

        auto logger = std::make_shared<spdlog::logger>("aua", sinks.begin(), sinks.end());
        logger->set_level(*level);
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(std::move(logger));

        return Result<void, Error>::success();
    }

}  // namespace aua::core
