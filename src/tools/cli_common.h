/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the Tabula library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file cli_common.h
 * @brief Shared utilities for Tabula CLI tools
 *
 * Provides standardised helpers used across all CLI tools:
 *   - formatBytes()         byte count to "1.23 MB" / "456 KB" / "789 bytes"
 *   - readFile()            whole-file text input
 *   - columnKindStr()       kind of the first non-null value of a column
 *   - printTableSummary()   tabular column dump to any ostream
 */

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <tabula/tabula.h>

namespace tabula_cli {

// ── formatBytes ────────────────────────────────────────────────────

/// Format a byte count as human-readable string.
inline std::string formatBytes(uintmax_t bytes) {
    std::ostringstream oss;
    if (bytes >= 1024 * 1024) {
        oss << std::fixed << std::setprecision(2)
            << (static_cast<double>(bytes) / (1024.0 * 1024.0)) << " MB";
    } else if (bytes >= 1024) {
        oss << std::fixed << std::setprecision(2)
            << (static_cast<double>(bytes) / 1024.0) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

// ── File I/O ───────────────────────────────────────────────────────

/// Read a whole file as text. Throws std::runtime_error if it cannot be opened.
inline std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// ── Table summaries ────────────────────────────────────────────────

/// Kind name of the first non-null value in a column, "null" if there is none.
inline std::string columnKindStr(const tabula::Table& table, const std::string& column) {
    for (const auto& value : table.getColumnValues(column)) {
        if (!value.isNull()) return value.kindName();
    }
    return "null";
}

/// Print vertical column table: kind histogram + full column listing.
inline void printTableSummary(const std::string& label,
                              const tabula::Table& table,
                              bool checks,
                              std::ostream& os = std::cout) {
    const auto& columns = table.getColumns();
    const size_t n = columns.size();
    if (n == 0) {
        os << label << ": (undeclared)\n";
        return;
    }

    std::map<std::string, size_t> kind_counts;
    std::vector<std::string> kinds;
    size_t max_name_len = 4;   // minimum width for "Name" header
    size_t max_kind_len = 4;   // minimum width for "Kind" header
    for (const auto& column : columns) {
        kinds.push_back(columnKindStr(table, column));
        kind_counts[kinds.back()]++;
        if (column.size() > max_name_len) max_name_len = column.size();
        if (kinds.back().size() > max_kind_len) max_kind_len = kinds.back().size();
    }

    os << label << " (" << n << " columns, " << table.getRowCount() << " rows)  [ ";
    bool first = true;
    for (const auto& [kname, cnt] : kind_counts) {
        if (!first) os << ", ";
        os << cnt << "\xc3\x97" << kname;   // UTF-8 ×
        first = false;
    }
    os << " ]\n";

    size_t idx_width = 1;
    for (size_t v = n - 1; v >= 10; v /= 10) ++idx_width;
    if (idx_width < 3) idx_width = 3;

    os << "  " << std::right << std::setw(static_cast<int>(idx_width)) << "Idx"
       << "  " << std::left  << std::setw(static_cast<int>(max_name_len)) << "Name"
       << "  " << std::left  << std::setw(static_cast<int>(max_kind_len)) << "Kind";
    if (checks) os << "  NotNull  Unique";
    os << "\n";

    os << "  " << std::string(idx_width, '-')
       << "  " << std::string(max_name_len, '-')
       << "  " << std::string(max_kind_len, '-');
    if (checks) os << "  -------  ------";
    os << "\n";

    for (size_t i = 0; i < n; ++i) {
        os << "  " << std::right << std::setw(static_cast<int>(idx_width)) << i
           << "  " << std::left  << std::setw(static_cast<int>(max_name_len)) << columns[i]
           << "  " << std::left  << std::setw(static_cast<int>(max_kind_len)) << kinds[i];
        if (checks) {
            os << "  " << std::left << std::setw(7) << (table.isNotNullColumn(columns[i]) ? "yes" : "no")
               << "  " << (table.isNotDuplColumn(columns[i]) ? "yes" : "no");
        }
        os << "\n";
    }
}

} // namespace tabula_cli
