//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef AUA_ERROR_HPP
#define AUA_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error types shared by every stage of the usage pipeline.
 *
 * Errors are plain values carried by Result<T, Error>. The code tells the
 * engine how far a failure reaches:
 * - ConfigError: fatal, the run stops before any file is touched
 * - FileReadError / ParseError: the file is recorded and skipped
 * - CheckpointError: the file is kept for this run and redone on the next
 * - everything else is reported to the caller as-is
 *
 * Usage:
 * @code
 *     auto text = file_utils::read_file(path);
 *     if (text.is_err()) {
 *         spdlog::warn("{}", text.error().to_string());
 *         // [FileReadError] Failed to open file (context: pkg/mod.py)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace aua {

    /**
     * Error category.
     */
    enum class ErrorCode {
        None,             ///< No error
        InvalidArgument,  ///< Invalid argument or parameter
        NotFound,         ///< Resource not found
        ConfigError,      ///< Bad configuration or run paths (fatal)
        IoError,          ///< Generic I/O failure
        FileReadError,    ///< A corpus file could not be read
        ParseError,       ///< Source or document could not be parsed
        CheckpointError,  ///< A checkpoint record could not be persisted
        InternalError     ///< Internal/unexpected error
    };

    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::FileReadError:   return "FileReadError";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::CheckpointError: return "CheckpointError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Immutable error with a code, a message and an optional context string
     * (usually the offending path or a "line:column" position). An empty
     * context string means no context.
     */
    class Error {
    public:
        Error(const ErrorCode code, std::string message, std::string context = {})
            : code_(code)
            , message_(std::move(message)) {
            if (!context.empty()) {
                context_ = std::move(context);
            }
        }

        static Error invalid_argument(std::string message, std::string context = {}) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }
        static Error not_found(std::string message, std::string context = {}) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }
        static Error config_error(std::string message, std::string context = {}) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }
        static Error io_error(std::string message, std::string context = {}) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }
        static Error file_read_error(std::string message, std::string context = {}) {
            return {ErrorCode::FileReadError, std::move(message), std::move(context)};
        }
        static Error parse_error(std::string message, std::string context = {}) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }
        static Error checkpoint_error(std::string message, std::string context = {}) {
            return {ErrorCode::CheckpointError, std::move(message), std::move(context)};
        }
        static Error internal_error(std::string message, std::string context = {}) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }
        [[nodiscard]] const std::string& message() const noexcept { return message_; }
        [[nodiscard]] const std::optional<std::string>& context() const noexcept { return context_; }
        [[nodiscard]] bool has_context() const noexcept { return context_.has_value(); }

        /**
         * Copy with `more` appended to the context ("a; b").
         */
        [[nodiscard]] Error with_context(const std::string& more) const {
            return {code_, message_, context_ ? *context_ + "; " + more : more};
        }

        /**
         * "[Code] message" or "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string text = std::string("[") + error_code_to_string(code_) + "] " + message_;
            if (context_) {
                text += " (context: " + *context_ + ")";
            }
            return text;
        }

        bool operator==(const Error&) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace aua

#endif //AUA_ERROR_HPP
