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
 * @file table.h
 * @brief Tabula Library - in-memory typed table
 *
 * A Table is an ordered list of unique column names plus an ordered list of
 * rows. Every row holds exactly one Value per column. Values entering the table
 * are deep copied, values leaving it are deep copied again, so no caller ever
 * holds a reference into table owned state.
 *
 * Per-column type consistency is enforced on every write according to the
 * table's KindCheckMode (see definitions.h). All mutators validate their whole
 * input before touching any state; a thrown error leaves the table unchanged.
 *
 * Example:
 * @code
 * tabula::Table users({
 *     tabula::Record{{"id", 1}, {"name", "Alice"}},
 *     tabula::Record{{"id", 2}, {"name", "Bob"}}
 * });
 * users.sortRowDescending("id");
 * auto first = users.getRow(0);   // {"id":2,"name":"Bob"}
 * @endcode
 */

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "definitions.h"
#include "errors.h"
#include "options.h"
#include "value.h"

namespace tabula {

    /// Snapshot of a Table, see Table::getObject().
    struct TableObject {
        std::vector<std::string>    columns;
        std::vector<Record>         rows;
        size_t                      columnCount = 0;
        size_t                      rowCount    = 0;
        bool                        isDeclared  = false;

        /// Record form: {"columns":[...],"rows":[...],"columnCount":n,"rowCount":n,"isDeclared":b}
        Value toValue() const;
    };

    class Table {
    public:
        using ValuePredicate = std::function<bool(const Value&)>;
        using ValueFormatter = std::function<Value(const Value&)>;
        using RowFilter      = std::function<bool(const Record&)>;

    private:
        using Row = std::vector<Value>;     // one entry per column, in column order

        std::vector<std::string>                column_names_;
        std::unordered_map<std::string, size_t> column_index_;
        std::vector<std::optional<KindTag>>     column_kinds_;      // populated in DECLARED_KIND mode only
        std::vector<Row>                        rows_;
        KindCheckMode                           kind_check_mode_;

        Table(std::vector<std::string> columns, std::vector<Row> rows, KindCheckMode mode,
              std::vector<std::optional<KindTag>> kinds);

        void        updateIndex();
        size_t      columnIndex(const std::string& column) const;
        void        checkColumnName(const std::string& column) const;
        void        checkRowIndex(size_t index) const;
        void        checkFunction(bool callable) const  { if (!callable) throw InvalidFunctionError(); }

        Value       makeValue(const Value& value) const;
        void        checkKind(size_t column, size_t rowIndex, const Value& value) const;
        void        checkColumnKinds(size_t column, const std::vector<Value>& values) const;
        void        noteKinds(const Row& row);
        void        deriveKinds();

        void        appendColumns(const std::vector<std::string>& names);
        void        insertRecord(size_t index, const Record& record);
        void        applyColumnOrder(const std::vector<size_t>& order);
        void        replaceColumn(size_t column, std::vector<Value> values);

        const Value& cell(size_t row, size_t column) const {
            if constexpr (RANGE_CHECKING) { return rows_.at(row).at(column); } else { return rows_[row][column]; }
        }

        Record      toRecord(const Row& row) const;
        Table       subset(const std::vector<size_t>& indexes) const;
        void        retainRows(const std::vector<size_t>& indexes);

        std::optional<size_t> firstIndexOf(const std::string& column, const ValuePredicate& matches) const;
        void        sortRows(const std::string& column, bool numeric, bool descending);

    public:
        Table();
        explicit Table(const Record& row);
        explicit Table(const std::vector<Record>& rows);
        explicit Table(const std::vector<std::string>& columns);
        Table(std::initializer_list<std::string> columns) : Table(std::vector<std::string>(columns)) {}

        /// Array of column names, array of records or a single record.
        static Table fromValue(const Value& value);
        static Table fromSerialized(std::string_view text);

        // Introspection
        const std::vector<std::string>& getColumns() const     { return column_names_; }
        size_t          getColumnCount() const                  { return column_names_.size(); }
        size_t          getRowCount() const                     { return rows_.size(); }
        bool            hasColumn(const std::string& column) const { return column_index_.find(column) != column_index_.end(); }
        bool            isDeclared() const                      { return !column_names_.empty(); }
        KindCheckMode   kindCheckMode() const                   { return kind_check_mode_; }
        Table&          setKindCheckMode(KindCheckMode mode);

        // Columns
        Table&          addColumn(const std::string& column);
        Table&          addColumns(const std::vector<std::string>& columns);
        Table&          removeColumn(const std::string& column);
        Table&          removeColumns(const std::vector<std::string>& columns);
        Table&          setValidColumns(const std::vector<std::string>& columns);
        std::vector<Value> getColumnValues(const std::string& column) const;
        Table&          setColumnSameValue(const std::string& column, const Value& value);
        Table&          setColumnSameFormat(const std::string& column, const ValueFormatter& formatter);

        // Rows
        Table&          addRow();
        Table&          addRow(size_t index);
        Table&          addRow(const Record& row);
        Table&          addRow(size_t index, const Record& row);
        Table&          addRows(const std::vector<Record>& rows);
        Record          getRow(size_t index) const;
        std::vector<Record> getRows(size_t start = 0, std::optional<size_t> end = std::nullopt) const;
        Table           getRowAsTable(size_t index) const;
        Table           getRowsAsTable(size_t start = 0, std::optional<size_t> end = std::nullopt) const;
        Record          removeRow(size_t index = 0);

        // Cells
        Value           getValue(size_t index, const std::string& column) const;
        Table&          setValue(size_t index, const std::string& column, const Value& value);

        // Column checks
        bool                    isNotNullColumn(const std::string& column) const;
        std::optional<Record>   findFirstRowNullColumn(const std::string& column) const;
        std::optional<size_t>   firstNullRowIndex(const std::string& column) const;
        bool                    isNotDuplColumn(const std::string& column) const;
        std::optional<Record>   findFirstRowDuplColumn(const std::string& column) const;
        std::optional<size_t>   firstDuplicateRowIndex(const std::string& column) const;
        bool                    isValidValue(const std::string& column, const ValuePredicate& validator) const;
        std::optional<Record>   findFirstRowInvalidValue(const std::string& column, const ValuePredicate& validator) const;
        std::optional<size_t>   firstInvalidRowIndex(const std::string& column, const ValuePredicate& validator) const;

        // Search by condition record (canonical equality on every listed column)
        std::vector<size_t> searchRowIndexes(const Record& condition, bool negate = false) const;
        std::vector<Record> searchRows(const Record& condition, bool negate = false) const;
        Table               searchRowsAsTable(const Record& condition, bool negate = false) const;
        Table&              searchAndModify(const Record& condition, bool negate = false);

        // Filter by row predicate
        std::vector<size_t> filterRowIndexes(const RowFilter& filter) const;
        std::vector<Record> filterRows(const RowFilter& filter) const;
        Table               filterRowsAsTable(const RowFilter& filter) const;
        Table&              filterAndModify(const RowFilter& filter);

        // Ordering
        Table&          setColumnSorting(const std::vector<std::string>& columns);
        Table&          sortColumnAscending();
        Table&          sortColumnDescending();
        Table&          sortColumnReverse();
        Table&          sortRowAscending(const std::string& column, bool numeric = false);
        Table&          sortRowDescending(const std::string& column, bool numeric = false);
        Table&          sortRowReverse();

        // Whole table
        Table           clone() const;
        Table&          clear();
        TableObject     getObject() const;
        std::string     getSerialized() const;
    };

} // namespace tabula
