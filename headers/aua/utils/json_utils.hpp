//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef AUA_JSON_UTILS_HPP
#define AUA_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief nlohmann/json helpers shared by the API loader, checkpoints and
 * usages documents.
 */

#include "aua/result.hpp"
#include "aua/error.hpp"
#include "aua/utils/file_utils.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <filesystem>

namespace aua::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * Parses JSON text. `origin` becomes the error context.
     */
    inline Result<json, Error> parse(std::string_view content, const std::string& origin = {}) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error(std::string("JSON parse error: ") + e.what(), origin)
            );
        }
    }

    inline Result<json, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::is_regular_file(path, ec)) {
            return Result<json, Error>::failure(
                Error::not_found("JSON file not found", path.string())
            );
        }
        return file_utils::read_file(path).and_then([&path](const std::string& content) {
            return parse(content, path.string());
        });
    }

    /**
     * Serializes `data` and replaces `path` atomically, creating missing
     * parent directories.
     */
    inline Result<void, Error> write_file(const fs::path& path, const json& data, const int indent = 2) {
        std::string text;
        try {
            text = data.dump(indent);
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }

        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory " + parent.string(), ec.message())
                );
            }
        }
        return file_utils::write_file_atomic(path, text);
    }

    /**
     * Value of `key`, or `fallback` when the key is missing, null or of
     * another type.
     */
    template<typename T>
    T get_or(const json& obj, const std::string& key, const T& fallback) {
        if (!obj.is_object()) {
            return fallback;
        }
        const auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return fallback;
        }
        try {
            return it->template get<T>();
        } catch (const json::type_error&) {
            return fallback;
        }
    }

    /**
     * String member that must be present; anything else is a ParseError
     * carrying `what` and `context`.
     */
    inline Result<std::string, Error> require_string(const json& obj, const std::string& key,
                                                     const std::string& what, const std::string& context = {}) {
        if (obj.is_object()) {
            if (const auto it = obj.find(key); it != obj.end() && it->is_string()) {
                return Result<std::string, Error>::success(it->get<std::string>());
            }
        }
        return Result<std::string, Error>::failure(Error::parse_error(what, context));
    }

}  // namespace aua::json_utils

#endif //AUA_JSON_UTILS_HPP
