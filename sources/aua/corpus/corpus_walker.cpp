//
// Created by gregorian-rayne on 10/17/26.
//

#include "aua/corpus/corpus_walker.hpp"
#include "aua/utils/file_utils.hpp"
#include "aua/utils/path_utils.hpp"
#include "aua/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace aua::corpus {

    namespace fs = std::filesystem;

    std::string glob_to_regex(const std::string_view glob) {
        std::string rx;
        rx.reserve(glob.size() * 2);

        rx += "^";
        for (std::size_t i = 0; i < glob.size(); ++i) {
            const char c = glob[i];
            switch (c) {
            case '*':
                if (i + 1 < glob.size() && glob[i + 1] == '*') {
                    ++i;
                    if (i + 1 < glob.size() && glob[i + 1] == '/') {
                        ++i;
                        rx += "(?:.*/)?";
                    } else {
                        rx += ".*";
                    }
                } else {
                    rx += "[^/]*";
                }
                break;
            case '?': rx += "[^/]"; break;
            case '/': rx += "/"; break;
            default:
                if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
                    rx += c;
                } else {
                    rx += "\\";
                    rx += c;
                }
            }
        }
        rx += "$";
        return rx;
    }

    Result<ExclusionSet, Error> ExclusionSet::from_file(const fs::path& path) {
        auto lines = file_utils::read_lines(path);
        if (lines.is_err()) {
            return Result<ExclusionSet, Error>::failure(
                Error::config_error("Cannot read exclusion file", path.string())
            );
        }

        ExclusionSet set;
        for (const auto& line : lines.value()) {
            const auto entry = string_utils::trim(line);
            if (entry.empty() || entry.front() == '#') {
                continue;
            }
            set.add(entry);
        }
        return Result<ExclusionSet, Error>::success(std::move(set));
    }

    void ExclusionSet::add(std::string_view pattern) {
        std::string glob(string_utils::trim(pattern));
        std::replace(glob.begin(), glob.end(), '\\', '/');
        while (glob.size() > 1 && glob.back() == '/') {
            glob.pop_back();
        }
        if (string_utils::starts_with(glob, "./")) {
            glob.erase(0, 2);
        }
        if (glob.empty()) {
            return;
        }
        std::regex regex(glob_to_regex(glob), std::regex::ECMAScript);
        patterns_.push_back({std::move(glob), std::move(regex)});
    }

    bool ExclusionSet::matches_any(const std::string_view path) const {
        return std::any_of(patterns_.begin(), patterns_.end(), [path](const Pattern& pattern) {
            return std::regex_match(path.begin(), path.end(), pattern.regex);
        });
    }

    bool ExclusionSet::matches(const std::string_view relative_path, const std::string_view absolute_path) const {
        if (patterns_.empty()) {
            return false;
        }
        if (matches_any(relative_path)) {
            return true;
        }
        if (!absolute_path.empty() && matches_any(absolute_path)) {
            return true;
        }
        const auto leading = path_utils::leading_directories(relative_path);
        return std::any_of(leading.begin(), leading.end(), [this](const std::string& dir) {
            return matches_any(dir);
        });
    }

    bool ExclusionSet::excludes_directory(const std::string_view relative_dir, const std::string_view absolute_dir) const {
        return matches(relative_dir, absolute_dir);
    }

    Result<std::vector<SourceFile>, Error> walk_corpus(const WalkOptions& options) {
        std::error_code ec;
        if (!fs::exists(options.root, ec)) {
            return Result<std::vector<SourceFile>, Error>::failure(
                Error::config_error("Corpus root does not exist", options.root.string())
            );
        }
        if (!fs::is_directory(options.root, ec)) {
            return Result<std::vector<SourceFile>, Error>::failure(
                Error::config_error("Corpus root is not a directory", options.root.string())
            );
        }

        std::vector<std::string> extensions;
        extensions.reserve(options.extensions.size());
        for (const auto& extension : options.extensions) {
            auto lowered = string_utils::to_lower(extension);
            if (!lowered.empty() && lowered.front() != '.') {
                lowered.insert(lowered.begin(), '.');
            }
            extensions.push_back(std::move(lowered));
        }

        const fs::path root = fs::absolute(options.root, ec).lexically_normal();
        std::vector<SourceFile> files;
        std::vector<fs::path> pending{root};

        while (!pending.empty()) {
            const fs::path directory = std::move(pending.back());
            pending.pop_back();

            std::error_code list_ec;
            fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, list_ec);
            if (list_ec) {
                spdlog::warn("Skipping unreadable directory {}: {}", directory.string(), list_ec.message());
                continue;
            }

            for (; it != fs::directory_iterator(); it.increment(list_ec)) {
                if (list_ec) {
                    break;
                }
                const fs::path& path = it->path();
                const std::string relative = path_utils::relative_generic(path, root);
                const std::string absolute = path.generic_string();

                std::error_code status_ec;
                if (it->is_directory(status_ec) && !it->is_symlink(status_ec)) {
                    if (!options.exclusions.excludes_directory(relative, absolute)) {
                        pending.push_back(path);
                    }
                    continue;
                }
                if (!it->is_regular_file(status_ec)) {
                    if (status_ec) {
                        spdlog::warn("Skipping unreadable entry {}: {}", absolute, status_ec.message());
                    }
                    continue;
                }

                const auto extension = path_utils::get_extension(path);
                if (std::find(extensions.begin(), extensions.end(), extension) == extensions.end()) {
                    continue;
                }
                if (options.exclusions.matches(relative, absolute)) {
                    continue;
                }

                files.push_back({relative, path, {}});
            }
            if (list_ec) {
                spdlog::warn("Listing of {} stopped early: {}", directory.string(), list_ec.message());
            }
        }

        std::sort(files.begin(), files.end(), [](const SourceFile& lhs, const SourceFile& rhs) {
            return lhs.relative_path < rhs.relative_path;
        });

        spdlog::debug("Corpus walk of {} found {} file(s)", root.string(), files.size());
        return Result<std::vector<SourceFile>, Error>::success(std::move(files));
    }

}  // namespace aua::corpus
