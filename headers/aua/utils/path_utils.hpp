//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef AUA_PATH_UTILS_HPP
#define AUA_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Corpus path helpers.
 *
 * Corpus paths are always handled in generic form ('/' separators) so that
 * checkpoints and reports are stable across platforms.
 */

#include "aua/utils/string_utils.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace aua::path_utils {

    namespace fs = std::filesystem;

    /**
     * `path` relative to `base` in generic form, or `path` itself when no
     * relative form exists.
     */
    inline std::string relative_generic(const fs::path& path, const fs::path& base) {
        std::error_code ec;
        const auto rel = fs::relative(path, base, ec);
        return (ec || rel.empty()) ? path.generic_string() : rel.generic_string();
    }

    /**
     * Leading directories of a generic relative path, shortest first.
     *
     * @code
     *     leading_directories("a/b/c.py")  // {"a", "a/b"}
     * @endcode
     */
    inline std::vector<std::string> leading_directories(const std::string_view relative) {
        std::vector<std::string> result;
        for (std::size_t pos = relative.find('/'); pos != std::string_view::npos;
             pos = relative.find('/', pos + 1)) {
            if (pos > 0) {
                result.emplace_back(relative.substr(0, pos));
            }
        }
        return result;
    }

    /**
     * Lowercased extension including the dot; empty when there is none.
     */
    inline std::string get_extension(const fs::path& path) {
        return string_utils::to_lower(path.extension().string());
    }

}  // namespace aua::path_utils

#endif //AUA_PATH_UTILS_HPP
