//
// Created by gregorian-rayne on 10/18/26.
//

#include "aua/cli/progress.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <iomanip>

#include <unistd.h>
#include <sys/ioctl.h>

namespace aua::cli
{
    namespace {
        constexpr std::chrono::milliseconds kRedrawInterval{100};
        constexpr std::size_t kBarWidth = 30;
    }

    bool is_tty() {
        return isatty(fileno(stderr)) != 0;
    }

    std::size_t terminal_width() {
        struct winsize w{};
        if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
            return w.ws_col;
        }
        return 80;
    }

    ProgressBar::ProgressBar(const std::size_t total, std::string label)
        : total_(total)
        , label_(std::move(label))
        , started_(std::chrono::steady_clock::now())
        , tty_(is_tty())
    {
        if (tty_) {
            std::lock_guard lock(mutex_);
            draw_locked();
        }
    }

    ProgressBar::~ProgressBar() {
        finish();
    }

    void ProgressBar::advance(const engine::FileProgress& progress) {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        completed_ = std::min(progress.completed, total_);
        if (progress.status == engine::FileStatus::ReadFailed ||
            progress.status == engine::FileStatus::ParseFailed) {
            ++problems_;
        }
        current_file_ = progress.path;

        const auto now = std::chrono::steady_clock::now();
        if (tty_ && now - last_draw_ >= kRedrawInterval) {
            last_draw_ = now;
            draw_locked();
        }
    }

    void ProgressBar::finish() {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        completed_ = total_;
        current_file_.clear();
        if (tty_) {
            draw_locked();
            std::cerr << "\n" << std::flush;
        } else {
            std::cerr << status_line() << "\n";
        }
    }

    void ProgressBar::fail(const std::string_view reason) {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        current_file_.clear();
        std::string line = status_line();
        if (!reason.empty()) {
            line += " - " + std::string(reason);
        }
        if (tty_) {
            std::cerr << "\r\033[K";
        }
        std::cerr << line << "\n" << std::flush;
    }

    std::string ProgressBar::status_line() const {
        const double fraction = total_ == 0 ? 1.0 : static_cast<double>(completed_) / static_cast<double>(total_);
        const auto filled = static_cast<std::size_t>(fraction * static_cast<double>(kBarWidth));
        const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();

        std::ostringstream ss;
        if (!label_.empty()) {
            ss << label_ << " ";
        }
        ss << "[" << std::string(filled, '#') << std::string(kBarWidth - filled, '.') << "] "
           << std::fixed << std::setprecision(0) << fraction * 100.0 << "% "
           << completed_ << "/" << total_ << " files";
        if (seconds > 0.0 && completed_ > 0) {
            ss << ", " << std::setprecision(1) << static_cast<double>(completed_) / seconds << "/s";
        }
        if (problems_ > 0) {
            ss << ", " << problems_ << " failed";
        }
        return ss.str();
    }

    void ProgressBar::draw_locked() {
        std::string line = status_line();
        if (!current_file_.empty()) {
            line += "  " + current_file_;
        }
        // Long paths are cut from the left so the file name stays visible.
        if (const auto width = terminal_width(); width > 4 && line.size() >= width) {
            const std::string head = status_line();
            const std::size_t room = width > head.size() + 6 ? width - head.size() - 6 : 0;
            line = room == 0 ? head.substr(0, width - 1)
                             : head + "  ..." + current_file_.substr(current_file_.size() - std::min(room, current_file_.size()));
        }
        std::cerr << "\r\033[K" << line << std::flush;
    }

}  // namespace aua::cli
