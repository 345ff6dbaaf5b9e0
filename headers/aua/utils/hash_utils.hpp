//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef AUA_HASH_UTILS_HPP
#define AUA_HASH_UTILS_HPP

#include "aua/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace aua::hash_utils {

    /**
     * Lowercase hex SHA-256 of `data` (64 characters). Used to fingerprint
     * corpus files and to name checkpoint records.
     */
    Result<std::string, Error> compute_sha256(std::string_view data);

    /**
     * 64-bit FNV-1a. Picks the checkpoint lock stripe of a file.
     */
    std::uint64_t fnv1a_hash(std::string_view data) noexcept;

} // namespace aua::hash_utils

#endif //AUA_HASH_UTILS_HPP
