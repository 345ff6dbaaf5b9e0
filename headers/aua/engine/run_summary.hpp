//
// Created by gregorian-rayne on 10/17/26.
//

#ifndef AUA_ENGINE_RUN_SUMMARY_HPP
#define AUA_ENGINE_RUN_SUMMARY_HPP

#include "aua/error.hpp"
#include "aua/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace aua::engine {

    /**
     * A file that could not be analyzed, with the reason.
     */
    struct FileFailure {
        std::string path;
        ErrorCode code = ErrorCode::None;
        std::string message;
    };

    /**
     * Outcome counters of one engine run. Every corpus file is counted in
     * exactly one of analyzed, resumed, irrelevant, read_failures and
     * parse_failures (unless the run was cancelled first).
     */
    struct RunSummary {
        std::size_t total_files = 0;
        std::size_t analyzed = 0;
        std::size_t resumed = 0;
        std::size_t irrelevant = 0;
        std::size_t read_failures = 0;
        std::size_t parse_failures = 0;
        std::size_t checkpoint_failures = 0;

        std::uint64_t resolved_calls = 0;
        std::uint64_t unresolved_calls = 0;

        Duration elapsed = Duration::zero();
        bool cancelled = false;

        std::vector<FileFailure> failures;

        [[nodiscard]] std::size_t processed() const noexcept {
            return analyzed + resumed + irrelevant + read_failures + parse_failures;
        }
    };

}  // namespace aua::engine

#endif //AUA_ENGINE_RUN_SUMMARY_HPP
