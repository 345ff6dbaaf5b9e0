//
// Created by gregorian-rayne on 10/12/26.
//

#include "aua/utils/hash_utils.hpp"

#include <openssl/evp.h>

namespace aua::hash_utils {

    namespace {

        std::string to_hex(const unsigned char* bytes, const std::size_t size) {
            static constexpr char kDigits[] = "0123456789abcdef";
            std::string hex(size * 2, '0');
            for (std::size_t i = 0; i < size; ++i) {
                hex[2 * i] = kDigits[bytes[i] >> 4];
                hex[2 * i + 1] = kDigits[bytes[i] & 0x0f];
            }
            return hex;
        }

    }  // namespace

    Result<std::string, Error> compute_sha256(const std::string_view data) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int size = 0;
        if (EVP_Digest(data.data(), data.size(), digest, &size, EVP_sha256(), nullptr) != 1) {
            return Result<std::string, Error>::failure(
                Error::internal_error("SHA-256 digest failed")
            );
        }
        return Result<std::string, Error>::success(to_hex(digest, size));
    }

    std::uint64_t fnv1a_hash(const std::string_view data) noexcept {
        std::uint64_t hash = 0xcbf29ce484222325ULL;
        for (const unsigned char c : data) {
            hash = (hash ^ c) * 0x100000001b3ULL;
        }
        return hash;
    }

}  // namespace aua::hash_utils
