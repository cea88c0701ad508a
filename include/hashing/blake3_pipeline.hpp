/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 digests for content-addressed candidate identity
 */

#pragma once

#include <vector>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace MineSpec {

/**
 * @brief BLAKE3 hashing
 *
 * Candidate ids are the hex form of a 128-bit digest over the fields that make
 * an extraction unique. Same observation, same id, on every run.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Hash a sequence of fields with a length prefix per field
     *
     * ("ab","c") and ("a","bc") produce different digests.
     */
    static Hash hash_fields(const std::vector<std::string>& fields);

    static std::string to_hex(const Hash& hash);

    /**
     * @throws std::invalid_argument on wrong length or non-hex characters
     */
    static Hash from_hex(const std::string& hex);
};

} // namespace MineSpec
