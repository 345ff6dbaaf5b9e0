//
// Created by gregorian-rayne on 10/12/26.
//

#include "aua/utils/file_utils.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>
#include <functional>

#include <fcntl.h>
#include <unistd.h>

namespace aua::file_utils {

    namespace {

        std::string errno_message(const std::string& what) {
            return what + ": " + std::strerror(errno);
        }

        std::string unique_temp_name(const fs::path& path) {
            static std::atomic<unsigned long> counter{0};
            const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
            std::ostringstream oss;
            oss << path.filename().string() << '.' << ::getpid() << '-' << tid << '-'
                << counter.fetch_add(1, std::memory_order_relaxed) << kTempSuffix;
            return oss.str();
        }

        Result<void, Error> write_all(const int fd, std::string_view content, const fs::path& temp) {
            while (!content.empty()) {
                const ssize_t written = ::write(fd, content.data(), content.size());
                if (written < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return Result<void, Error>::failure(
                        Error::io_error(errno_message("Failed to write file"), temp.string())
                    );
                }
                content.remove_prefix(static_cast<std::size_t>(written));
            }
            return Result<void, Error>::success();
        }

        void sync_directory(const fs::path& dir) {
            const int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
            if (fd >= 0) {
                ::fsync(fd);
                ::close(fd);
            }
        }

    }  // namespace

    Result<std::string, Error> read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Result<std::string, Error>::failure(
                Error::file_read_error("Failed to open file", path.string())
            );
        }

        std::string content;
        std::error_code ec;
        if (const auto size = fs::file_size(path, ec); !ec) {
            content.reserve(static_cast<std::size_t>(size));
        }
        content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());

        if (in.bad()) {
            return Result<std::string, Error>::failure(
                Error::file_read_error("Failed to read file", path.string())
            );
        }
        return Result<std::string, Error>::success(std::move(content));
    }

    Result<std::vector<std::string>, Error> read_lines(const fs::path& path) {
        return read_file(path).map([](const std::string& text) {
            std::vector<std::string> lines;
            std::size_t begin = 0;
            while (begin < text.size()) {
                auto end = text.find('\n', begin);
                if (end == std::string::npos) {
                    end = text.size();
                }
                std::string_view line(text.data() + begin, end - begin);
                if (!line.empty() && line.back() == '\r') {
                    line.remove_suffix(1);
                }
                lines.emplace_back(line);
                begin = end + 1;
            }
            return lines;
        });
    }

    Result<void, Error> write_file(const fs::path& path, const std::string_view content) {
        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory: " + ec.message(), parent.string())
                );
            }
        }
        return write_file_atomic(path, content);
    }

    Result<void, Error> write_file_atomic(const fs::path& path, const std::string_view content) {
        const auto dir = path.parent_path();
        const auto temp = dir / unique_temp_name(path);

        const int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            return Result<void, Error>::failure(
                Error::io_error(errno_message("Failed to create temporary file"), temp.string())
            );
        }

        auto written = write_all(fd, content, temp);
        if (written.is_ok() && ::fsync(fd) != 0) {
            written = Result<void, Error>::failure(
                Error::io_error(errno_message("Failed to flush file"), temp.string())
            );
        }
        if (::close(fd) != 0 && written.is_ok()) {
            written = Result<void, Error>::failure(
                Error::io_error(errno_message("Failed to close file"), temp.string())
            );
        }

        if (written.is_err()) {
            std::error_code ec;
            fs::remove(temp, ec);
            return written;
        }

        if (::rename(temp.c_str(), path.c_str()) != 0) {
            auto error = Error::io_error(errno_message("Failed to rename file"), path.string());
            std::error_code ec;
            fs::remove(temp, ec);
            return Result<void, Error>::failure(std::move(error));
        }

        sync_directory(dir);
        return Result<void, Error>::success();
    }

}  // namespace aua::file_utils
