//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef AUA_STRING_UTILS_HPP
#define AUA_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers for dotted names, exclusion lists and reports.
 */

#include <string>
#include <string_view>
#include <algorithm>
#include <cctype>

namespace aua::string_utils {

    /**
     * Strips ASCII whitespace from both ends.
     */
    inline std::string_view trim(std::string_view s) noexcept {
        const auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };
        while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) {
            s.remove_prefix(1);
        }
        while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) {
            s.remove_suffix(1);
        }
        return s;
    }

    /**
     * Concatenates the elements of a string container with `delimiter`.
     */
    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::string out;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                out.append(delimiter);
            }
            out.append(part);
            first = false;
        }
        return out;
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.substr(0, prefix.size()) == prefix;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string lowered;
        lowered.reserve(s.size());
        for (const unsigned char c : s) {
            lowered.push_back(static_cast<char>(std::tolower(c)));
        }
        return lowered;
    }

    /**
     * Joins two dotted-name fragments, tolerating empty sides.
     *
     * @code
     *     join_dotted("pkg", "sub.fn")  // "pkg.sub.fn"
     *     join_dotted("", "fn")         // "fn"
     * @endcode
     */
    inline std::string join_dotted(const std::string_view head, const std::string_view tail) {
        if (head.empty()) {
            return std::string(tail);
        }
        if (tail.empty()) {
            return std::string(head);
        }
        std::string result;
        result.reserve(head.size() + tail.size() + 1);
        result.append(head);
        result.push_back('.');
        result.append(tail);
        return result;
    }

    /**
     * True when `name` equals `prefix` or starts with `prefix` followed by a dot.
     */
    inline bool is_dotted_prefix(const std::string_view prefix, const std::string_view name) noexcept {
        if (!starts_with(name, prefix)) {
            return false;
        }
        return name.size() == prefix.size() || prefix.empty() || name[prefix.size()] == '.';
    }

    /**
     * Last component of a dotted name ("sklearn.svm.SVC" -> "SVC").
     */
    inline std::string_view last_component(const std::string_view dotted) noexcept {
        const auto pos = dotted.rfind('.');
        return pos == std::string_view::npos ? dotted : dotted.substr(pos + 1);
    }

}  // namespace aua::string_utils

#endif //AUA_STRING_UTILS_HPP
