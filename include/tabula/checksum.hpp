/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the Tabula library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tabula {

/**
 * @brief Checksum utility using the xxHash64 algorithm
 *
 * Used for hashing canonical encodings during duplicate detection.
 */
class Checksum {
public:
    using hash_t = uint64_t;
    static constexpr hash_t DEFAULT_SEED = 0;

    /**
     * @brief Compute hash for a memory block (one-shot)
     * @param data Pointer to data
     * @param length Size of data in bytes
     * @param seed Optional seed value (default: 0)
     * @return 64-bit hash value
     */
    static hash_t compute(const void* data, size_t length, hash_t seed = DEFAULT_SEED) {
        return XXH64(data, length, seed);
    }

    static hash_t compute(std::string_view text, hash_t seed = DEFAULT_SEED) {
        return XXH64(text.data(), text.size(), seed);
    }
};

/**
 * @brief Hash functor for canonical encodings in unordered containers.
 *
 * Transparent, so lookups accept std::string_view without a temporary string.
 */
struct CanonicalHash {
    using is_transparent = void;

    size_t operator()(std::string_view text) const noexcept {
        return static_cast<size_t>(Checksum::compute(text));
    }
    size_t operator()(const std::string& text) const noexcept {
        return static_cast<size_t>(Checksum::compute(text));
    }
};

} // namespace tabula
