//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef AUA_CORE_LOGGING_HPP
#define AUA_CORE_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Process-wide logger setup.
 *
 * The library logs through the spdlog default logger. The CLI replaces it
 * once at startup with a stderr sink and, when configured, a file sink.
 */

#include "aua/core/config.hpp"
#include "aua/result.hpp"

#include <spdlog/common.h>

#include <optional>
#include <string_view>

namespace aua::core {

    std::optional<spdlog::level::level_enum> parse_log_level(std::string_view level);

    /**
     * Installs the default "aua" logger.
     *
     * @param override_level Wins over `config.level` (--verbose / --quiet).
     * @return ConfigError for an unknown level or an unwritable log file.
     */
    Result<void, Error> configure_logging(const LoggingConfig& config,
                                          std::optional<spdlog::level::level_enum> override_level = std::nullopt);

}  // namespace aua::core

#endif //AUA_CORE_LOGGING_HPP
