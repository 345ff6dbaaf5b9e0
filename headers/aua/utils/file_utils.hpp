//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef AUA_FILE_UTILS_HPP
#define AUA_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief Reading corpus files and writing checkpoint and output files.
 */

#include "aua/result.hpp"
#include "aua/error.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

namespace aua::file_utils {

    namespace fs = std::filesystem;

    /**
     * Suffix of temporary files written by write_file_atomic().
     */
    inline constexpr std::string_view kTempSuffix = ".tmp";

    /**
     * Whole file as bytes, or a FileReadError naming the path.
     */
    Result<std::string, Error> read_file(const fs::path& path);

    /**
     * Lines without their terminators; "\r\n" endings are accepted.
     */
    Result<std::vector<std::string>, Error> read_lines(const fs::path& path);

    /**
     * write_file_atomic() after creating missing parent directories.
     */
    Result<void, Error> write_file(const fs::path& path, std::string_view content);

    /**
     * Writes a file so that readers see either the old or the new content.
     *
     * The content goes to `<path>.<unique>.tmp` in the same directory, is
     * flushed with fsync, and is renamed over `path`. The directory is then
     * synced so the rename itself is durable. On failure the temporary file
     * is removed.
     *
     * @param path Final destination.
     * @param content Bytes to write.
     * @return Success or an IoError.
     */
    Result<void, Error> write_file_atomic(const fs::path& path, std::string_view content);

    /**
     * Checks whether a file name is a leftover of write_file_atomic().
     */
    inline bool is_temp_file(const fs::path& path) {
        const auto name = path.filename().string();
        return name.size() > kTempSuffix.size() &&
               name.compare(name.size() - kTempSuffix.size(), kTempSuffix.size(), kTempSuffix) == 0;
    }

}  // namespace aua::file_utils

#endif //AUA_FILE_UTILS_HPP
