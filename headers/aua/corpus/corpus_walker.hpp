//
// Created by gregorian-rayne on 10/17/26.
//

#ifndef AUA_CORPUS_CORPUS_WALKER_HPP
#define AUA_CORPUS_CORPUS_WALKER_HPP

/**
 * @file corpus_walker.hpp
 * @brief Enumeration of the client source files of a corpus.
 *
 * Exclusion entries are globs where `*` and `?` stay within one path
 * component and `**` spans any number of them. An entry excludes a file when
 * it matches the corpus-relative path, the absolute path, or any leading
 * directory of the relative path, so `vendor/` or `build/*` drop a subtree.
 */

#include "aua/result.hpp"
#include "aua/types.hpp"

#include <filesystem>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace aua::corpus {

    /**
     * Translates an exclusion glob into an anchored ECMAScript regex.
     */
    [[nodiscard]] std::string glob_to_regex(std::string_view glob);

    class ExclusionSet {
    public:
        ExclusionSet() = default;

        /**
         * Reads newline-separated entries. Blank lines and lines starting
         * with `#` are skipped, surrounding whitespace is trimmed.
         *
         * @return ConfigError when the file cannot be read.
         */
        static Result<ExclusionSet, Error> from_file(const std::filesystem::path& path);

        void add(std::string_view pattern);

        [[nodiscard]] bool matches(std::string_view relative_path, std::string_view absolute_path = {}) const;

        /**
         * True when the directory itself, or one of its parents, is excluded.
         */
        [[nodiscard]] bool excludes_directory(std::string_view relative_dir, std::string_view absolute_dir = {}) const;

        [[nodiscard]] bool empty() const noexcept { return patterns_.empty(); }
        [[nodiscard]] std::size_t size() const noexcept { return patterns_.size(); }

    private:
        struct Pattern {
            std::string glob;
            std::regex regex;
        };

        [[nodiscard]] bool matches_any(std::string_view path) const;

        std::vector<Pattern> patterns_;
    };

    struct WalkOptions {
        std::filesystem::path root;
        ExclusionSet exclusions;
        std::vector<std::string> extensions{".py"};
    };

    /**
     * Lists the candidate files under `options.root`, sorted by relative path.
     * The returned SourceFile entries carry no text; it is read during analysis.
     * Directories that cannot be listed are logged and skipped.
     *
     * @return ConfigError when the root is missing or not a directory.
     */
    Result<std::vector<SourceFile>, Error> walk_corpus(const WalkOptions& options);

}  // namespace aua::corpus

#endif //AUA_CORPUS_CORPUS_WALKER_HPP
