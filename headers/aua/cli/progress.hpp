//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef AUA_PROGRESS_HPP
#define AUA_PROGRESS_HPP

/**
 * @file progress.hpp
 * @brief Per-file progress display for `aua usages`.
 *
 * Renders to stderr so that --json output on stdout stays clean. When stderr
 * is not a terminal only the final line is printed.
 */

#include "aua/engine/usage_engine.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <string_view>

namespace aua::cli
{
    /**
     * Single-line bar fed from the engine's progress callback.
     *
     * Shows completed/total files, throughput, the number of files that
     * failed to read or parse, and the file that just finished.
     */
    class ProgressBar {
    public:
        ProgressBar(std::size_t total, std::string label);
        ~ProgressBar();

        ProgressBar(const ProgressBar&) = delete;
        ProgressBar& operator=(const ProgressBar&) = delete;

        void advance(const engine::FileProgress& progress);

        void finish();

        /**
         * Leaves the bar at its current position with `reason` appended.
         */
        void fail(std::string_view reason);

    private:
        [[nodiscard]] std::string status_line() const;
        void draw_locked();

        std::size_t total_;
        std::size_t completed_ = 0;
        std::size_t problems_ = 0;
        std::string label_;
        std::string current_file_;
        std::chrono::steady_clock::time_point started_;
        std::chrono::steady_clock::time_point last_draw_;
        std::mutex mutex_;
        bool closed_ = false;
        bool tty_;
    };

    [[nodiscard]] bool is_tty();

    /**
     * Columns of the terminal behind stderr, 80 when unknown.
     */
    [[nodiscard]] std::size_t terminal_width();

}  // namespace aua::cli

#endif //AUA_PROGRESS_HPP
