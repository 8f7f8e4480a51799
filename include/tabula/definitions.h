/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the Tabula library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the Tabula library */
#include <cstddef>
#include <cstdint>
#include <string>

namespace tabula {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

#ifdef TABULA_RANGE_CHECKING
    constexpr bool RANGE_CHECKING = true;
#else
    constexpr bool RANGE_CHECKING = false;
#endif

    // Largest integer magnitude a double holds exactly (2^53)
    constexpr int64_t MAX_SAFE_INTEGER = 9007199254740992;

    // Maximum nesting depth accepted by the canonical reader
    constexpr size_t MAX_PARSE_DEPTH = 512;

    /**
     * @brief Runtime category of a Value, used for per-column type consistency.
     *
     * For OPAQUE values the kind alone is not sufficient, the dynamic type of the
     * opaque object takes part in the comparison as well (see KindTag).
     */
    enum class ValueKind : uint8_t {
        UNDEFINED = 0,
        NULL_VALUE,
        BOOLEAN,
        NUMBER,
        BIGINT,
        STRING,
        SYMBOL,
        ARRAY,
        RECORD,
        OPAQUE
    };

    inline std::string kindToString(ValueKind kind) {
        switch (kind) {
            case ValueKind::UNDEFINED:  return "undefined";
            case ValueKind::NULL_VALUE: return "null";
            case ValueKind::BOOLEAN:    return "boolean";
            case ValueKind::NUMBER:     return "number";
            case ValueKind::BIGINT:     return "bigint";
            case ValueKind::STRING:     return "string";
            case ValueKind::SYMBOL:     return "symbol";
            case ValueKind::ARRAY:      return "Array";
            case ValueKind::RECORD:     return "Object";
            case ValueKind::OPAQUE:     return "opaque";
            default:                    return "unknown";
        }
    }

    /**
     * @brief Strategy used by Table to enforce per-column type consistency.
     *
     * BACKWARD_SCAN compares a new value against the nearest prior non-null value
     * in the same column. Removing or reordering rows can therefore let a column
     * drift between kinds.
     *
     * DECLARED_KIND fixes the kind of a column with its first non-null value and
     * checks every later value against it, independent of row position.
     */
    enum class KindCheckMode : uint8_t {
        BACKWARD_SCAN = 0,
        DECLARED_KIND = 1
    };

    inline std::string kindCheckModeToString(KindCheckMode mode) {
        switch (mode) {
            case KindCheckMode::BACKWARD_SCAN: return "backward_scan";
            case KindCheckMode::DECLARED_KIND: return "declared_kind";
            default:                           return "unknown";
        }
    }

    template<typename T>
    constexpr bool always_false = false;

} // namespace tabula
