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
 * @file table.hpp
 * @brief Tabula Library - Table implementation
 */

#include "table.h"
#include "canonical_reader.h"
#include "checksum.hpp"
#include "deep_copy.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <unordered_set>

namespace tabula {

    namespace detail {

        /// Leading integer of text following parseInt(text, 10): optional
        /// whitespace, optional sign, at least one decimal digit.
        inline std::optional<double> parseLeadingInteger(std::string_view text) {
            size_t pos = 0;
            while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
            bool negative = false;
            if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
                negative = text[pos] == '-';
                ++pos;
            }
            if (pos >= text.size() || !std::isdigit(static_cast<unsigned char>(text[pos]))) {
                return std::nullopt;
            }
            double value = 0.0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                value = value * 10.0 + static_cast<double>(text[pos] - '0');
                ++pos;
            }
            return negative ? -value : value;
        }

        /// UTF-16 code units of UTF-8 text. Malformed sequences become U+FFFD.
        inline std::u16string toUtf16(std::string_view text) {
            std::u16string out;
            out.reserve(text.size());
            size_t pos = 0;
            while (pos < text.size()) {
                const unsigned char lead = static_cast<unsigned char>(text[pos]);
                uint32_t cp = 0xFFFD;
                size_t length = 1;
                size_t extra = 0;
                uint32_t min = 0;
                if (lead < 0x80)                { cp = lead; }
                else if ((lead & 0xE0) == 0xC0) { extra = 1; min = 0x80;    cp = lead & 0x1F; }
                else if ((lead & 0xF0) == 0xE0) { extra = 2; min = 0x800;   cp = lead & 0x0F; }
                else if ((lead & 0xF8) == 0xF0) { extra = 3; min = 0x10000; cp = lead & 0x07; }
                if (extra > 0) {
                    size_t i = 1;
                    for (; i <= extra && pos + i < text.size(); ++i) {
                        const unsigned char next = static_cast<unsigned char>(text[pos + i]);
                        if ((next & 0xC0) != 0x80) break;
                        cp = (cp << 6) | (next & 0x3F);
                    }
                    if (i == extra + 1 && cp >= min && cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF)) {
                        length = i;
                    } else {
                        cp = 0xFFFD;
                        length = i > 1 ? i : 1;
                    }
                } else if (lead >= 0x80) {
                    cp = 0xFFFD;
                }
                if (cp >= 0x10000) {
                    cp -= 0x10000;
                    out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
                    out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
                } else {
                    out.push_back(static_cast<char16_t>(cp));
                }
                pos += length;
            }
            return out;
        }

        template<typename T>
        int threeWay(const T& a, const T& b) {
            return (a < b) ? -1 : (b < a ? 1 : 0);
        }

        // NaN orders after every other number
        inline int compareNumbers(double a, double b) {
            const bool aNaN = std::isnan(a);
            const bool bNaN = std::isnan(b);
            if (aNaN || bNaN) return static_cast<int>(aNaN) - static_cast<int>(bNaN);
            return threeWay(a, b);
        }

        // Strings order by UTF-16 code units, which differs from UTF-8 byte
        // order once characters above U+FFFF meet U+E000..U+FFFF.
        inline int compareText(std::string_view a, std::string_view b) {
            return threeWay(toUtf16(a), toUtf16(b));
        }

        // Ordering of two non-null primitives of the same kind
        inline int comparePrimitives(const Value& a, const Value& b) {
            switch (a.kind()) {
                case ValueKind::NUMBER:  return compareNumbers(a.asNumber(), b.asNumber());
                case ValueKind::STRING:  return compareText(a.asString(), b.asString());
                case ValueKind::BOOLEAN: return static_cast<int>(a.asBoolean()) - static_cast<int>(b.asBoolean());
                case ValueKind::BIGINT:  return a.asBigInt().compare(b.asBigInt());
                case ValueKind::SYMBOL:
                    return compareText(a.asSymbol().description.value_or(""), b.asSymbol().description.value_or(""));
                default:
                    return 0;
            }
        }

    } // namespace detail

    // ========================================================================
    // TableObject
    // ========================================================================

    inline Value TableObject::toValue() const {
        Array columnValues;
        columnValues.reserve(columns.size());
        for (const auto& column : columns) {
            columnValues.emplace_back(column);
        }
        Array rowValues;
        rowValues.reserve(rows.size());
        for (const auto& row : rows) {
            rowValues.emplace_back(row);
        }
        Record result;
        result.set("columns", Value(std::move(columnValues)));
        result.set("rows", Value(std::move(rowValues)));
        result.set("columnCount", Value(columnCount));
        result.set("rowCount", Value(rowCount));
        result.set("isDeclared", Value(isDeclared));
        return Value(std::move(result));
    }

    // ========================================================================
    // Construction
    // ========================================================================

    inline Table::Table() : kind_check_mode_(Options::instance().kindCheckMode()) {}

    inline Table::Table(const Record& row) : Table() {
        addRow(row);
    }

    inline Table::Table(const std::vector<Record>& rows) : Table() {
        addRows(rows);
    }

    inline Table::Table(const std::vector<std::string>& columns) : Table() {
        addColumns(columns);
    }

    // Trusted path for clones and subsets, the data is already consistent
    inline Table::Table(std::vector<std::string> columns, std::vector<Row> rows, KindCheckMode mode,
                        std::vector<std::optional<KindTag>> kinds)
        : column_names_(std::move(columns))
        , column_kinds_(std::move(kinds))
        , rows_(std::move(rows))
        , kind_check_mode_(mode)
    {
        updateIndex();
    }

    inline Table Table::fromValue(const Value& value) {
        Table table;
        if (value.isRecord()) {
            table.addRow(value.asRecord());
            return table;
        }
        if (!value.isArray()) {
            throw InvalidArgumentError("Please insert array contains objects with their own key-value pairs, "
                                       "array contains strings or only object of key-value pairs.");
        }

        const Array& items = value.asArray();
        if (items.empty()) {
            return table;
        }
        if (items.front().isStringConvertible()) {
            std::vector<std::string> names;
            names.reserve(items.size());
            for (const auto& item : items) {
                if (!item.isStringConvertible()) {
                    throw InvalidArgumentError("Only strings can be inserted into columns.");
                }
                if (item.isNull()) {
                    throw InvalidArgumentError("Column cannot be null.");
                }
                if (item.isSymbol()) {
                    if (!item.asSymbol().description) {
                        throw InvalidArgumentError("Column cannot be null.");
                    }
                    names.push_back(*item.asSymbol().description);
                } else {
                    names.push_back(item.toString());
                }
            }
            table.addColumns(names);
            return table;
        }

        std::vector<Record> rows;
        rows.reserve(items.size());
        for (const auto& item : items) {
            if (!item.isRecord()) {
                throw InvalidArgumentError("Please insert object with their own key-value pairs.");
            }
            rows.push_back(item.asRecord());
        }
        table.addRows(rows);
        return table;
    }

    inline Table Table::fromSerialized(std::string_view text) {
        return fromValue(parseCanonical(text));
    }

    // ========================================================================
    // Internal helpers
    // ========================================================================

    inline void Table::updateIndex() {
        column_index_.clear();
        for (size_t i = 0; i < column_names_.size(); ++i) {
            column_index_[column_names_[i]] = i;
        }
    }

    inline size_t Table::columnIndex(const std::string& column) const {
        auto it = column_index_.find(column);
        if (it == column_index_.end()) {
            throw ColumnNotFoundError(column);
        }
        return it->second;
    }

    inline void Table::checkColumnName(const std::string& column) const {
        if (column.empty()) {
            throw InvalidArgumentError("Column cannot be empty.");
        }
    }

    inline void Table::checkRowIndex(size_t index) const {
        if (index >= rows_.size()) {
            throw RowIndexOutOfRangeError(index, rows_.size());
        }
    }

    inline Value Table::makeValue(const Value& value) const {
        DeepCopier copier;
        return copier.copy(value);
    }

    inline void Table::checkKind(size_t column, size_t rowIndex, const Value& value) const {
        if (value.isNull()) {
            return;
        }
        const KindTag actual = value.kindTag();

        if (kind_check_mode_ == KindCheckMode::DECLARED_KIND) {
            const auto& declared = column_kinds_[column];
            if (declared && *declared != actual) {
                throw TypeConsistencyError(column_names_[column], declared->name, actual.name);
            }
            return;
        }

        // nearest prior non-null value decides
        for (size_t r = rowIndex; r-- > 0; ) {
            const Value& prior = cell(r, column);
            if (prior.isNull()) {
                continue;
            }
            const KindTag expected = prior.kindTag();
            if (expected != actual) {
                throw TypeConsistencyError(column_names_[column], expected.name, actual.name);
            }
            return;
        }
    }

    // Validates a complete replacement column. Each value is checked against the
    // replacement values before it, so every non-null value must share one kind.
    inline void Table::checkColumnKinds(size_t column, const std::vector<Value>& values) const {
        std::optional<KindTag> expected;
        for (const auto& value : values) {
            if (value.isNull()) {
                continue;
            }
            KindTag actual = value.kindTag();
            if (!expected) {
                expected = std::move(actual);
            } else if (*expected != actual) {
                throw TypeConsistencyError(column_names_[column], expected->name, actual.name);
            }
        }
    }

    inline void Table::noteKinds(const Row& row) {
        if (kind_check_mode_ != KindCheckMode::DECLARED_KIND) {
            return;
        }
        for (size_t c = 0; c < row.size(); ++c) {
            if (!column_kinds_[c] && !row[c].isNull()) {
                column_kinds_[c] = row[c].kindTag();
            }
        }
    }

    inline void Table::deriveKinds() {
        column_kinds_.assign(column_names_.size(), std::nullopt);
        for (const auto& row : rows_) {
            noteKinds(row);
        }
    }

    inline void Table::appendColumns(const std::vector<std::string>& names) {
        for (const auto& name : names) {
            column_names_.push_back(name);
            column_kinds_.emplace_back(std::nullopt);
        }
        for (auto& row : rows_) {
            row.resize(column_names_.size(), Value(nullptr));
        }
        updateIndex();
    }

    inline void Table::insertRecord(size_t index, const Record& record) {
        if (record.empty()) {
            return;
        }

        if (!isDeclared()) {
            // the record declares the columns; the new columns hold no prior values
            std::vector<std::string> names = record.keys();
            for (const auto& name : names) {
                checkColumnName(name);
            }
            Row row;
            row.reserve(names.size());
            for (const auto& [key, value] : record) {
                row.push_back(value.isUndefined() ? Value(nullptr) : makeValue(value));
            }
            appendColumns(names);
            rows_.insert(rows_.begin() + static_cast<std::ptrdiff_t>(index), std::move(row));
            noteKinds(rows_[index]);
            return;
        }

        Row row(column_names_.size(), Value(nullptr));
        for (const auto& [key, value] : record) {
            auto it = column_index_.find(key);
            if (it == column_index_.end() || value.isUndefined()) {
                continue;
            }
            Value stored = makeValue(value);
            checkKind(it->second, index, stored);
            row[it->second] = std::move(stored);
        }
        rows_.insert(rows_.begin() + static_cast<std::ptrdiff_t>(index), std::move(row));
        noteKinds(rows_[index]);
    }

    // Rebuild columns from source positions; order may be a permutation or a subset
    inline void Table::applyColumnOrder(const std::vector<size_t>& order) {
        std::vector<std::string> names;
        std::vector<std::optional<KindTag>> kinds;
        names.reserve(order.size());
        kinds.reserve(order.size());
        for (size_t i : order) {
            names.push_back(column_names_[i]);
            kinds.push_back(column_kinds_[i]);
        }
        for (auto& row : rows_) {
            Row reordered;
            reordered.reserve(order.size());
            for (size_t i : order) {
                reordered.push_back(std::move(row[i]));
            }
            row = std::move(reordered);
        }
        column_names_ = std::move(names);
        column_kinds_ = std::move(kinds);
        updateIndex();
    }

    inline void Table::replaceColumn(size_t column, std::vector<Value> values) {
        std::optional<KindTag> kind;
        for (size_t r = 0; r < rows_.size(); ++r) {
            if (!kind && !values[r].isNull()) {
                kind = values[r].kindTag();
            }
            rows_[r][column] = std::move(values[r]);
        }
        if (kind_check_mode_ == KindCheckMode::DECLARED_KIND) {
            column_kinds_[column] = std::move(kind);
        }
    }

    inline Record Table::toRecord(const Row& row) const {
        DeepCopier copier;
        Record record;
        for (size_t c = 0; c < column_names_.size(); ++c) {
            record.set(column_names_[c], copier.copy(row[c]));
        }
        return record;
    }

    inline Table Table::subset(const std::vector<size_t>& indexes) const {
        std::vector<Row> rows;
        rows.reserve(indexes.size());
        for (size_t r : indexes) {
            DeepCopier copier;
            Row copy;
            copy.reserve(column_names_.size());
            for (const auto& value : rows_[r]) {
                copy.push_back(copier.copy(value));
            }
            rows.push_back(std::move(copy));
        }
        return Table(column_names_, std::move(rows), kind_check_mode_, column_kinds_);
    }

    inline void Table::retainRows(const std::vector<size_t>& indexes) {
        std::vector<Row> kept;
        kept.reserve(indexes.size());
        for (size_t r : indexes) {
            kept.push_back(std::move(rows_[r]));
        }
        rows_ = std::move(kept);
    }

    inline std::optional<size_t> Table::firstIndexOf(const std::string& column, const ValuePredicate& matches) const {
        const size_t c = columnIndex(column);
        for (size_t r = 0; r < rows_.size(); ++r) {
            if (matches(cell(r, c))) {
                return r;
            }
        }
        return std::nullopt;
    }

    // ========================================================================
    // Introspection
    // ========================================================================

    inline Table& Table::setKindCheckMode(KindCheckMode mode) {
        kind_check_mode_ = mode;
        deriveKinds();
        return *this;
    }

    // ========================================================================
    // Columns
    // ========================================================================

    inline Table& Table::addColumn(const std::string& column) {
        return addColumns({column});
    }

    inline Table& Table::addColumns(const std::vector<std::string>& columns) {
        std::unordered_set<std::string> pending;
        for (const auto& column : columns) {
            checkColumnName(column);
            if (hasColumn(column) || !pending.insert(column).second) {
                throw DuplicateColumnError(column);
            }
        }
        appendColumns(columns);
        return *this;
    }

    inline Table& Table::removeColumn(const std::string& column) {
        return removeColumns({column});
    }

    inline Table& Table::removeColumns(const std::vector<std::string>& columns) {
        std::vector<bool> removed(column_names_.size(), false);
        for (const auto& column : columns) {
            removed[columnIndex(column)] = true;
        }
        std::vector<size_t> keep;
        for (size_t c = 0; c < column_names_.size(); ++c) {
            if (!removed[c]) keep.push_back(c);
        }
        applyColumnOrder(keep);
        return *this;
    }

    inline Table& Table::setValidColumns(const std::vector<std::string>& columns) {
        std::unordered_set<std::string> valid(columns.begin(), columns.end());
        std::vector<size_t> keep;
        for (size_t c = 0; c < column_names_.size(); ++c) {
            if (valid.count(column_names_[c])) keep.push_back(c);
        }
        applyColumnOrder(keep);
        return *this;
    }

    inline std::vector<Value> Table::getColumnValues(const std::string& column) const {
        const size_t c = columnIndex(column);
        std::vector<Value> values;
        values.reserve(rows_.size());
        for (size_t r = 0; r < rows_.size(); ++r) {
            values.push_back(makeValue(cell(r, c)));
        }
        return values;
    }

    inline Table& Table::setColumnSameValue(const std::string& column, const Value& value) {
        if (value.isUndefined()) {
            throw UndefinedValueError();
        }
        checkColumnName(column);

        std::vector<Value> values;
        values.reserve(rows_.size());
        for (size_t r = 0; r < rows_.size(); ++r) {
            values.push_back(makeValue(value));  // every row owns its own copy
        }

        if (!hasColumn(column)) {
            appendColumns({column});
        }
        const size_t c = columnIndex(column);
        checkColumnKinds(c, values);
        replaceColumn(c, std::move(values));
        return *this;
    }

    inline Table& Table::setColumnSameFormat(const std::string& column, const ValueFormatter& formatter) {
        checkFunction(static_cast<bool>(formatter));
        const size_t c = columnIndex(column);

        std::vector<Value> values;
        values.reserve(rows_.size());
        for (size_t r = 0; r < rows_.size(); ++r) {
            Value formatted = formatter(makeValue(cell(r, c)));
            if (formatted.isUndefined()) {
                throw UndefinedValueError();
            }
            values.push_back(makeValue(formatted));
        }
        checkColumnKinds(c, values);
        replaceColumn(c, std::move(values));
        return *this;
    }

    // ========================================================================
    // Rows
    // ========================================================================

    inline Table& Table::addRow() {
        return addRow(rows_.size());
    }

    inline Table& Table::addRow(size_t index) {
        if (!isDeclared()) {
            throw ColumnsUndeclaredError();
        }
        if (index > rows_.size()) {
            throw RowIndexOutOfRangeError(index, rows_.size());
        }
        rows_.insert(rows_.begin() + static_cast<std::ptrdiff_t>(index), Row(column_names_.size(), Value(nullptr)));
        return *this;
    }

    inline Table& Table::addRow(const Record& row) {
        insertRecord(rows_.size(), row);
        return *this;
    }

    inline Table& Table::addRow(size_t index, const Record& row) {
        if (index > rows_.size()) {
            throw RowIndexOutOfRangeError(index, rows_.size());
        }
        insertRecord(index, row);
        return *this;
    }

    inline Table& Table::addRows(const std::vector<Record>& rows) {
        const size_t rowCount = rows_.size();
        const size_t columnCount = column_names_.size();
        const auto kinds = column_kinds_;
        try {
            for (const auto& row : rows) {
                insertRecord(rows_.size(), row);
            }
        } catch (...) {
            // roll back the partially applied batch, then report
            rows_.resize(rowCount);
            column_names_.resize(columnCount);
            column_kinds_ = kinds;
            for (auto& row : rows_) {
                row.resize(columnCount);
            }
            updateIndex();
            throw;
        }
        return *this;
    }

    inline Record Table::getRow(size_t index) const {
        checkRowIndex(index);
        return toRecord(rows_[index]);
    }

    inline std::vector<Record> Table::getRows(size_t start, std::optional<size_t> end) const {
        std::vector<Record> result;
        if (rows_.empty()) {
            return result;
        }
        checkRowIndex(start);
        const size_t last = end ? *end : rows_.size() - 1;
        checkRowIndex(last);
        for (size_t r = start; r <= last; ++r) {
            result.push_back(toRecord(rows_[r]));
        }
        return result;
    }

    inline Table Table::getRowAsTable(size_t index) const {
        checkRowIndex(index);
        return subset({index});
    }

    inline Table Table::getRowsAsTable(size_t start, std::optional<size_t> end) const {
        std::vector<size_t> indexes;
        if (!rows_.empty()) {
            checkRowIndex(start);
            const size_t last = end ? *end : rows_.size() - 1;
            checkRowIndex(last);
            for (size_t r = start; r <= last; ++r) {
                indexes.push_back(r);
            }
        }
        return subset(indexes);
    }

    inline Record Table::removeRow(size_t index) {
        checkRowIndex(index);
        Row& row = rows_[index];
        Record removed;
        for (size_t c = 0; c < column_names_.size(); ++c) {
            removed.set(column_names_[c], std::move(row[c]));
        }
        rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(index));
        return removed;
    }

    // ========================================================================
    // Cells
    // ========================================================================

    inline Value Table::getValue(size_t index, const std::string& column) const {
        const size_t c = columnIndex(column);
        checkRowIndex(index);
        return makeValue(cell(index, c));
    }

    inline Table& Table::setValue(size_t index, const std::string& column, const Value& value) {
        if (value.isUndefined()) {
            throw UndefinedValueError();
        }
        const size_t c = columnIndex(column);
        checkRowIndex(index);
        Value stored = makeValue(value);
        checkKind(c, index, stored);
        if (kind_check_mode_ == KindCheckMode::DECLARED_KIND && !column_kinds_[c] && !stored.isNull()) {
            column_kinds_[c] = stored.kindTag();
        }
        rows_[index][c] = std::move(stored);
        return *this;
    }

    // ========================================================================
    // Column checks
    // ========================================================================

    inline std::optional<size_t> Table::firstNullRowIndex(const std::string& column) const {
        return firstIndexOf(column, [](const Value& value) { return value.isNull(); });
    }

    inline bool Table::isNotNullColumn(const std::string& column) const {
        return !firstNullRowIndex(column).has_value();
    }

    inline std::optional<Record> Table::findFirstRowNullColumn(const std::string& column) const {
        auto index = firstNullRowIndex(column);
        if (!index) return std::nullopt;
        return getRow(*index);
    }

    inline std::optional<size_t> Table::firstDuplicateRowIndex(const std::string& column) const {
        const size_t c = columnIndex(column);
        std::unordered_set<std::string, CanonicalHash, std::equal_to<>> seen;
        seen.reserve(rows_.size());
        for (size_t r = 0; r < rows_.size(); ++r) {
            const Value& value = cell(r, c);
            if (value.isNull()) {
                continue;
            }
            if (!seen.insert(toCanonical(value)).second) {
                return r;
            }
        }
        return std::nullopt;
    }

    inline bool Table::isNotDuplColumn(const std::string& column) const {
        return !firstDuplicateRowIndex(column).has_value();
    }

    inline std::optional<Record> Table::findFirstRowDuplColumn(const std::string& column) const {
        auto index = firstDuplicateRowIndex(column);
        if (!index) return std::nullopt;
        return getRow(*index);
    }

    inline std::optional<size_t> Table::firstInvalidRowIndex(const std::string& column, const ValuePredicate& validator) const {
        checkFunction(static_cast<bool>(validator));
        return firstIndexOf(column, [this, &validator](const Value& value) {
            return !validator(makeValue(value));
        });
    }

    inline bool Table::isValidValue(const std::string& column, const ValuePredicate& validator) const {
        return !firstInvalidRowIndex(column, validator).has_value();
    }

    inline std::optional<Record> Table::findFirstRowInvalidValue(const std::string& column, const ValuePredicate& validator) const {
        auto index = firstInvalidRowIndex(column, validator);
        if (!index) return std::nullopt;
        return getRow(*index);
    }

    // ========================================================================
    // Search
    // ========================================================================

    inline std::vector<size_t> Table::searchRowIndexes(const Record& condition, bool negate) const {
        std::vector<std::pair<size_t, std::string>> expected;
        expected.reserve(condition.size());
        for (const auto& [column, value] : condition) {
            expected.emplace_back(columnIndex(column), toCanonical(value));
        }

        std::vector<size_t> result;
        for (size_t r = 0; r < rows_.size(); ++r) {
            bool matched = true;
            for (const auto& [c, text] : expected) {
                if (toCanonical(cell(r, c)) != text) {
                    matched = false;
                    break;
                }
            }
            if (matched != negate) {
                result.push_back(r);
            }
        }
        return result;
    }

    inline std::vector<Record> Table::searchRows(const Record& condition, bool negate) const {
        std::vector<Record> result;
        for (size_t r : searchRowIndexes(condition, negate)) {
            result.push_back(toRecord(rows_[r]));
        }
        return result;
    }

    inline Table Table::searchRowsAsTable(const Record& condition, bool negate) const {
        return subset(searchRowIndexes(condition, negate));
    }

    inline Table& Table::searchAndModify(const Record& condition, bool negate) {
        retainRows(searchRowIndexes(condition, negate));
        return *this;
    }

    // ========================================================================
    // Filter
    // ========================================================================

    inline std::vector<size_t> Table::filterRowIndexes(const RowFilter& filter) const {
        checkFunction(static_cast<bool>(filter));
        std::vector<size_t> result;
        for (size_t r = 0; r < rows_.size(); ++r) {
            if (filter(toRecord(rows_[r]))) {
                result.push_back(r);
            }
        }
        return result;
    }

    inline std::vector<Record> Table::filterRows(const RowFilter& filter) const {
        std::vector<Record> result;
        for (size_t r : filterRowIndexes(filter)) {
            result.push_back(toRecord(rows_[r]));
        }
        return result;
    }

    inline Table Table::filterRowsAsTable(const RowFilter& filter) const {
        return subset(filterRowIndexes(filter));
    }

    inline Table& Table::filterAndModify(const RowFilter& filter) {
        retainRows(filterRowIndexes(filter));
        return *this;
    }

    // ========================================================================
    // Ordering
    // ========================================================================

    inline Table& Table::setColumnSorting(const std::vector<std::string>& columns) {
        std::vector<size_t> order;
        std::vector<bool> listed(column_names_.size(), false);
        for (const auto& column : columns) {
            const size_t c = columnIndex(column);
            if (listed[c]) {
                throw DuplicateColumnError(column);
            }
            listed[c] = true;
            order.push_back(c);
        }
        for (size_t c = 0; c < column_names_.size(); ++c) {
            if (!listed[c]) order.push_back(c);
        }
        applyColumnOrder(order);
        return *this;
    }

    inline Table& Table::sortColumnAscending() {
        std::vector<size_t> order(column_names_.size());
        std::iota(order.begin(), order.end(), size_t{0});
        std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
            return detail::compareText(column_names_[a], column_names_[b]) < 0;
        });
        applyColumnOrder(order);
        return *this;
    }

    inline Table& Table::sortColumnDescending() {
        std::vector<size_t> order(column_names_.size());
        std::iota(order.begin(), order.end(), size_t{0});
        std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
            return detail::compareText(column_names_[b], column_names_[a]) < 0;
        });
        applyColumnOrder(order);
        return *this;
    }

    inline Table& Table::sortColumnReverse() {
        std::vector<size_t> order(column_names_.size());
        std::iota(order.rbegin(), order.rend(), size_t{0});
        applyColumnOrder(order);
        return *this;
    }

    inline void Table::sortRows(const std::string& column, bool numeric, bool descending) {
        const size_t c = columnIndex(column);

        struct SortKey {
            size_t          row;
            const Value*    value;      // nullptr for null cells
            std::u16string  text;       // canonical text, when compared textually
            double          number;     // leading integer in numeric mode
        };

        // Structured values and columns mixing primitive kinds compare by
        // canonical text, which keeps the ordering total.
        bool textual = false;
        std::optional<ValueKind> kind;
        for (size_t r = 0; r < rows_.size() && !textual; ++r) {
            const Value& value = cell(r, c);
            if (value.isNull()) continue;
            if (value.isStructured() || (kind && *kind != value.kind())) textual = true;
            kind = value.kind();
        }

        std::vector<SortKey> keys;
        keys.reserve(rows_.size());
        size_t nonNull = 0;
        bool unparsable = false;
        for (size_t r = 0; r < rows_.size(); ++r) {
            const Value& value = cell(r, c);
            SortKey key{r, nullptr, {}, 0.0};
            if (!value.isNull()) {
                ++nonNull;
                key.value = &value;
                if (textual) {
                    key.text = detail::toUtf16(toCanonical(value));
                }
                if (numeric) {
                    auto parsed = detail::parseLeadingInteger(value.isStructured() ? toCanonical(value) : value.toString());
                    if (parsed) key.number = *parsed;
                    else        unparsable = true;
                }
            }
            keys.push_back(std::move(key));
        }
        if (numeric && unparsable && nonNull >= 2) {
            throw SortTypeError();
        }

        auto compare = [numeric, textual](const SortKey& a, const SortKey& b) {
            if (numeric) return detail::threeWay(a.number, b.number);
            if (textual) return detail::threeWay(a.text, b.text);
            return detail::comparePrimitives(*a.value, *b.value);
        };
        std::stable_sort(keys.begin(), keys.end(), [&](const SortKey& a, const SortKey& b) {
            const bool aNull = a.value == nullptr;
            const bool bNull = b.value == nullptr;
            if (aNull || bNull) {
                if (aNull == bNull) return false;
                return descending ? aNull : bNull;
            }
            const int order = compare(a, b);
            return descending ? order > 0 : order < 0;
        });

        std::vector<Row> sorted;
        sorted.reserve(rows_.size());
        for (const auto& key : keys) {
            sorted.push_back(std::move(rows_[key.row]));
        }
        rows_ = std::move(sorted);
    }

    inline Table& Table::sortRowAscending(const std::string& column, bool numeric) {
        sortRows(column, numeric, false);
        return *this;
    }

    inline Table& Table::sortRowDescending(const std::string& column, bool numeric) {
        sortRows(column, numeric, true);
        return *this;
    }

    inline Table& Table::sortRowReverse() {
        std::reverse(rows_.begin(), rows_.end());
        return *this;
    }

    // ========================================================================
    // Whole table
    // ========================================================================

    inline Table Table::clone() const {
        std::vector<size_t> all(rows_.size());
        std::iota(all.begin(), all.end(), size_t{0});
        return subset(all);
    }

    inline Table& Table::clear() {
        column_names_.clear();
        column_index_.clear();
        column_kinds_.clear();
        rows_.clear();
        return *this;
    }

    inline TableObject Table::getObject() const {
        TableObject object;
        object.columns      = column_names_;
        object.rows         = getRows();
        object.columnCount  = column_names_.size();
        object.rowCount     = rows_.size();
        object.isDeclared   = isDeclared();
        return object;
    }

    inline std::string Table::getSerialized() const {
        std::string out;
        out += '[';
        for (size_t r = 0; r < rows_.size(); ++r) {
            if (r > 0) out += ',';
            Record record;
            for (size_t c = 0; c < column_names_.size(); ++c) {
                record.set(column_names_[c], rows_[r][c]);
            }
            out += toCanonical(record);
        }
        out += ']';
        return out;
    }

} // namespace tabula
