/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the Tabula library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file table_test.cpp
 * @brief Tests for Table construction, rows, columns and cells.
 *
 * Tests cover:
 * - Construction from records, row lists, column names and canonical text
 * - Row insertion, retrieval and removal including index validation
 * - Column declaration, backfill, removal and whole column updates
 * - Cell access with copy isolation
 * - clone / clear / getObject / getSerialized
 * - Atomicity of failing mutators
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <tabula/tabula.h>

namespace {

using namespace tabula;

using Names = std::vector<std::string>;

Table makeUsers() {
    return Table(std::vector<Record>{
        Record{{"id", 1}, {"name", "Alice"}, {"age", 30}},
        Record{{"id", 2}, {"name", "Bob"}, {"age", 25}},
        Record{{"id", 3}, {"name", "Carol"}, {"age", nullptr}},
    });
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

TEST(TableConstruction, EmptyTableIsUndeclared) {
    Table t;
    EXPECT_FALSE(t.isDeclared());
    EXPECT_EQ(t.getColumnCount(), 0u);
    EXPECT_EQ(t.getRowCount(), 0u);
    EXPECT_EQ(t.getSerialized(), "[]");
}

TEST(TableConstruction, FromRowList) {
    Table t = makeUsers();
    EXPECT_TRUE(t.isDeclared());
    EXPECT_EQ(t.getColumns(), (Names{"id", "name", "age"}));
    EXPECT_EQ(t.getRowCount(), 3u);
    EXPECT_EQ(t.getRow(1), (Record{{"id", 2}, {"name", "Bob"}, {"age", 25}}));
}

TEST(TableConstruction, FromSingleRecord) {
    Table t(Record{{"id", 1}, {"name", "Alice"}});
    EXPECT_EQ(t.getColumns(), (Names{"id", "name"}));
    EXPECT_EQ(t.getRowCount(), 1u);
}

TEST(TableConstruction, FromColumnNames) {
    Table t({"a", "b"});
    EXPECT_TRUE(t.isDeclared());
    EXPECT_EQ(t.getColumns(), (Names{"a", "b"}));
    EXPECT_EQ(t.getRowCount(), 0u);

    Table fromVector(Names{"x"});
    EXPECT_EQ(fromVector.getColumns(), (Names{"x"}));
}

TEST(TableConstruction, DuplicateColumnNamesRejected) {
    EXPECT_THROW(Table({"a", "a"}), DuplicateColumnError);
}

TEST(TableConstruction, LaterRowsDoNotAddColumns) {
    Table t(std::vector<Record>{
        Record{{"id", 1}},
        Record{{"id", 2}, {"email", "b@example.com"}},
    });
    EXPECT_EQ(t.getColumns(), (Names{"id"}));
    EXPECT_EQ(t.getRow(1), (Record{{"id", 2}}));
}

TEST(TableConstruction, FromValue) {
    Table columns = Table::fromValue(Value::array({"a", "b"}));
    EXPECT_EQ(columns.getColumns(), (Names{"a", "b"}));
    EXPECT_EQ(columns.getRowCount(), 0u);

    Table rows = Table::fromValue(Value::array({Value(Record{{"id", 1}}), Value(Record{{"id", 2}})}));
    EXPECT_EQ(rows.getRowCount(), 2u);

    Table single = Table::fromValue(Value(Record{{"k", "v"}}));
    EXPECT_EQ(single.getRowCount(), 1u);

    EXPECT_FALSE(Table::fromValue(Value::array({})).isDeclared());
}

TEST(TableConstruction, FromValueRejectsOtherShapes) {
    EXPECT_THROW(Table::fromValue(Value(5)), InvalidArgumentError);
    EXPECT_THROW(Table::fromValue(Value("a")), InvalidArgumentError);
    EXPECT_THROW(Table::fromValue(Value::array({nullptr})), InvalidArgumentError);
    EXPECT_THROW(Table::fromValue(Value::array({"a", Value::array({})})), InvalidArgumentError);
    EXPECT_THROW(Table::fromValue(Value::array({Value(Record{{"id", 1}}), 2})), InvalidArgumentError);
}

TEST(TableConstruction, FromSerialized) {
    Table t = Table::fromSerialized("[{\"id\":1,\"name\":\"Alice\"},{\"id\":2,\"name\":\"Bob\"}]");
    EXPECT_EQ(t.getColumns(), (Names{"id", "name"}));
    EXPECT_EQ(t.getValue(1, "name"), Value("Bob"));
    EXPECT_THROW(Table::fromSerialized("[{\"id\":1}"), ParseError);
}

// ═══════════════════════════════════════════════════════════════════════════
// Rows
// ═══════════════════════════════════════════════════════════════════════════

TEST(TableRows, AddRowRequiresColumns) {
    Table t;
    EXPECT_THROW(t.addRow(), ColumnsUndeclaredError);
    EXPECT_THROW(t.addRow(0), ColumnsUndeclaredError);
}

TEST(TableRows, AddEmptyRowFillsNull) {
    Table t({"a", "b"});
    t.addRow();
    EXPECT_EQ(t.getRow(0), (Record{{"a", nullptr}, {"b", nullptr}}));
}

TEST(TableRows, AddRowAtIndex) {
    Table t = makeUsers();
    t.addRow(1);
    EXPECT_EQ(t.getRowCount(), 4u);
    EXPECT_TRUE(t.getValue(1, "id").isNull());
    EXPECT_EQ(t.getValue(2, "name"), Value("Bob"));

    t.addRow(4);  // index == row count appends
    EXPECT_EQ(t.getRowCount(), 5u);
    EXPECT_THROW(t.addRow(6), RowIndexOutOfRangeError);
    EXPECT_EQ(t.getRowCount(), 5u);
}

TEST(TableRows, AddRecordIgnoresUnknownAndFillsMissing) {
    Table t = makeUsers();
    t.addRow(Record{{"id", 4}, {"email", "d@example.com"}});
    EXPECT_EQ(t.getColumns(), (Names{"id", "name", "age"}));
    EXPECT_EQ(t.getRow(3), (Record{{"id", 4}, {"name", nullptr}, {"age", nullptr}}));
}

TEST(TableRows, AddRecordAtIndex) {
    Table t = makeUsers();
    t.addRow(0, Record{{"id", 0}, {"name", "Zoe"}});
    EXPECT_EQ(t.getValue(0, "name"), Value("Zoe"));
    EXPECT_EQ(t.getValue(1, "name"), Value("Alice"));
    EXPECT_THROW(t.addRow(9, Record{{"id", 9}}), RowIndexOutOfRangeError);
}

TEST(TableRows, EmptyRecordIsNoOp) {
    Table t = makeUsers();
    t.addRow(Record{});
    EXPECT_EQ(t.getRowCount(), 3u);

    Table empty;
    empty.addRow(Record{});
    EXPECT_FALSE(empty.isDeclared());
    EXPECT_EQ(empty.getRowCount(), 0u);
}

TEST(TableRows, UndefinedFieldsAreSkipped) {
    Table t(Record{{"a", 1}, {"b", Value()}});
    EXPECT_EQ(t.getColumns(), (Names{"a", "b"}));
    EXPECT_TRUE(t.getValue(0, "b").isNull());
}

TEST(TableRows, EmptyColumnNameRejected) {
    Table t;
    EXPECT_THROW(t.addRow(Record{{"", 1}}), InvalidArgumentError);
    EXPECT_FALSE(t.isDeclared());
}

TEST(TableRows, GetRowOutOfRange) {
    Table t = makeUsers();
    EXPECT_THROW(t.getRow(3), RowIndexOutOfRangeError);
    EXPECT_THROW(Table({"a"}).getRow(0), RowIndexOutOfRangeError);
}

TEST(TableRows, GetRowsRange) {
    Table t = makeUsers();
    EXPECT_EQ(t.getRows().size(), 3u);
    EXPECT_EQ(t.getRows(1).size(), 2u);

    auto firstTwo = t.getRows(0, 1);
    ASSERT_EQ(firstTwo.size(), 2u);
    EXPECT_EQ(firstTwo[1].at("name"), Value("Bob"));

    EXPECT_THROW(t.getRows(0, 5), RowIndexOutOfRangeError);
    EXPECT_THROW(t.getRows(4), RowIndexOutOfRangeError);
    EXPECT_TRUE(Table({"a"}).getRows(3).empty());
}

TEST(TableRows, RowsAsTable) {
    Table t = makeUsers();
    Table tail = t.getRowsAsTable(1, 2);
    EXPECT_EQ(tail.getColumns(), t.getColumns());
    EXPECT_EQ(tail.getRowCount(), 2u);
    EXPECT_EQ(tail.getValue(0, "name"), Value("Bob"));

    Table one = t.getRowAsTable(2);
    EXPECT_EQ(one.getRowCount(), 1u);
    EXPECT_EQ(one.getRow(0), t.getRow(2));

    Table emptyButDeclared = Table({"a", "b"}).getRowsAsTable();
    EXPECT_EQ(emptyButDeclared.getColumns(), (Names{"a", "b"}));
    EXPECT_EQ(emptyButDeclared.getRowCount(), 0u);
}

TEST(TableRows, RemoveRow) {
    Table t = makeUsers();
    Record removed = t.removeRow(1);
    EXPECT_EQ(removed, (Record{{"id", 2}, {"name", "Bob"}, {"age", 25}}));
    EXPECT_EQ(t.getRowCount(), 2u);

    Record first = t.removeRow();
    EXPECT_EQ(first.at("name"), Value("Alice"));
    EXPECT_EQ(t.getRowCount(), 1u);

    EXPECT_THROW(t.removeRow(5), RowIndexOutOfRangeError);
}

TEST(TableRows, AddRowsIsAtomic) {
    Table t({"id"});
    t.addRow(Record{{"id", 1}});
    std::vector<Record> batch{Record{{"id", 2}}, Record{{"id", "three"}}};
    EXPECT_THROW(t.addRows(batch), TypeConsistencyError);
    EXPECT_EQ(t.getRowCount(), 1u);
    EXPECT_EQ(t.getSerialized(), "[{\"id\":1}]");
}

TEST(TableRows, AddRowsRollsBackDeclaration) {
    Table t;
    std::vector<Record> batch{Record{{"a", 1}}, Record{{"a", "x"}}};
    EXPECT_THROW(t.addRows(batch), TypeConsistencyError);
    EXPECT_FALSE(t.isDeclared());
    EXPECT_EQ(t.getRowCount(), 0u);
}

TEST(TableRows, RedeclareAfterRemovingAllColumns) {
    Table t = makeUsers();
    t.removeColumns({"id", "name", "age"});
    EXPECT_FALSE(t.isDeclared());
    EXPECT_EQ(t.getRowCount(), 3u);

    t.addRow(Record{{"x", 1}});
    EXPECT_EQ(t.getColumns(), (Names{"x"}));
    EXPECT_EQ(t.getRowCount(), 4u);
    EXPECT_TRUE(t.getValue(0, "x").isNull());
    EXPECT_EQ(t.getValue(3, "x"), Value(1));
}

// ═══════════════════════════════════════════════════════════════════════════
// Columns
// ═══════════════════════════════════════════════════════════════════════════

TEST(TableColumns, AddColumnBackfillsNull) {
    Table t = makeUsers();
    t.addColumn("email");
    EXPECT_EQ(t.getColumnCount(), 4u);
    for (size_t r = 0; r < t.getRowCount(); ++r) {
        EXPECT_TRUE(t.getValue(r, "email").isNull());
    }
}

TEST(TableColumns, AddColumnValidation) {
    Table t = makeUsers();
    EXPECT_THROW(t.addColumn("id"), DuplicateColumnError);
    EXPECT_THROW(t.addColumn(""), InvalidArgumentError);
    EXPECT_THROW(t.addColumns({"x", "y", "x"}), DuplicateColumnError);
    EXPECT_EQ(t.getColumns(), (Names{"id", "name", "age"}));
}

TEST(TableColumns, RemoveColumns) {
    Table t = makeUsers();
    t.removeColumn("age");
    EXPECT_EQ(t.getColumns(), (Names{"id", "name"}));
    EXPECT_EQ(t.getRow(0), (Record{{"id", 1}, {"name", "Alice"}}));

    EXPECT_THROW(t.removeColumn("age"), ColumnNotFoundError);
    EXPECT_THROW(t.removeColumns({"id", "missing"}), ColumnNotFoundError);
    EXPECT_EQ(t.getColumns(), (Names{"id", "name"}));
}

TEST(TableColumns, SetValidColumns) {
    Table t = makeUsers();
    t.setValidColumns({"age", "name", "unknown"});
    EXPECT_EQ(t.getColumns(), (Names{"name", "age"}));
    EXPECT_EQ(t.getRow(1), (Record{{"name", "Bob"}, {"age", 25}}));
}

TEST(TableColumns, GetColumnValues) {
    Table t = makeUsers();
    auto names = t.getColumnValues("name");
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[2], Value("Carol"));
    EXPECT_THROW(t.getColumnValues("missing"), ColumnNotFoundError);
}

TEST(TableColumns, SetColumnSameValue) {
    Table t = makeUsers();
    t.setColumnSameValue("age", 40);
    for (const auto& v : t.getColumnValues("age")) {
        EXPECT_EQ(v, Value(40));
    }

    t.setColumnSameValue("status", "active");
    EXPECT_EQ(t.getColumns(), (Names{"id", "name", "age", "status"}));
    EXPECT_EQ(t.getValue(2, "status"), Value("active"));

    EXPECT_THROW(t.setColumnSameValue("age", Value()), UndefinedValueError);
    EXPECT_THROW(t.setColumnSameValue("", 1), InvalidArgumentError);
}

TEST(TableColumns, SetColumnSameValueCopiesPerRow) {
    Table t = makeUsers();
    t.setColumnSameValue("tags", Value::array({"x"}));
    EXPECT_NE(t.getValue(0, "tags").identity(), t.getValue(1, "tags").identity());
    EXPECT_EQ(t.getValue(1, "tags"), Value::array({"x"}));
}

TEST(TableColumns, SetColumnSameFormat) {
    Table t = makeUsers();
    t.setColumnSameFormat("age", [](const Value& v) {
        return v.isNull() ? Value(0) : Value(v.asNumber() + 1);
    });
    EXPECT_EQ(t.getValue(0, "age"), Value(31));
    EXPECT_EQ(t.getValue(1, "age"), Value(26));
    EXPECT_EQ(t.getValue(2, "age"), Value(0));
}

TEST(TableColumns, SetColumnSameFormatValidation) {
    Table t = makeUsers();
    EXPECT_THROW(t.setColumnSameFormat("missing", Table::ValueFormatter{}), InvalidFunctionError);
    EXPECT_THROW(t.setColumnSameFormat("missing", [](const Value& v) { return v; }), ColumnNotFoundError);
    EXPECT_THROW(t.setColumnSameFormat("age", [](const Value&) { return Value(); }), UndefinedValueError);

    // mixed results leave the column untouched
    EXPECT_THROW(t.setColumnSameFormat("age", [](const Value& v) {
        return v.isNull() ? Value("none") : v;
    }), TypeConsistencyError);
    EXPECT_EQ(t.getValue(0, "age"), Value(30));
    EXPECT_TRUE(t.getValue(2, "age").isNull());
}

// ═══════════════════════════════════════════════════════════════════════════
// Cells
// ═══════════════════════════════════════════════════════════════════════════

TEST(TableCells, GetValue) {
    Table t = makeUsers();
    EXPECT_EQ(t.getValue(0, "name"), Value("Alice"));
    EXPECT_THROW(t.getValue(0, "missing"), ColumnNotFoundError);
    EXPECT_THROW(t.getValue(9, "missing"), ColumnNotFoundError);
    EXPECT_THROW(t.getValue(9, "name"), RowIndexOutOfRangeError);
}

TEST(TableCells, SetValue) {
    Table t = makeUsers();
    t.setValue(1, "name", "Robert");
    EXPECT_EQ(t.getValue(1, "name"), Value("Robert"));
    t.setValue(1, "name", nullptr);
    EXPECT_TRUE(t.getValue(1, "name").isNull());

    EXPECT_THROW(t.setValue(0, "name", Value()), UndefinedValueError);
    EXPECT_THROW(t.setValue(0, "missing", 1), ColumnNotFoundError);
    EXPECT_THROW(t.setValue(7, "name", "x"), RowIndexOutOfRangeError);
    EXPECT_THROW(t.setValue(2, "name", 5), TypeConsistencyError);
    EXPECT_EQ(t.getValue(2, "name"), Value("Carol"));
}

TEST(TableCells, ReturnedValuesAreCopies) {
    Table t(Record{{"tags", Value::array({"a"})}});
    Value tags = t.getValue(0, "tags");
    tags.asArray().push_back("b");
    EXPECT_EQ(t.getValue(0, "tags"), Value::array({"a"}));

    Record row = t.getRow(0);
    row["tags"].asArray().clear();
    EXPECT_EQ(t.getValue(0, "tags"), Value::array({"a"}));
}

TEST(TableCells, InsertedValuesAreCopies) {
    Value tags = Value::array({"a"});
    Table t(Record{{"tags", tags}});
    tags.asArray().push_back("b");
    EXPECT_EQ(t.getValue(0, "tags"), Value::array({"a"}));

    Value more = Value::array({1});
    t.setValue(0, "tags", more);
    more.asArray().push_back(2);
    EXPECT_EQ(t.getValue(0, "tags"), Value::array({1}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Whole table
// ═══════════════════════════════════════════════════════════════════════════

TEST(TableWhole, CloneIsIndependent) {
    Table t = makeUsers();
    Table c = t.clone();
    EXPECT_EQ(c.getColumns(), t.getColumns());
    EXPECT_EQ(c.getRows(), t.getRows());

    c.setValue(0, "name", "Zed");
    c.addColumn("extra");
    EXPECT_EQ(t.getValue(0, "name"), Value("Alice"));
    EXPECT_FALSE(t.hasColumn("extra"));
}

TEST(TableWhole, CopyConstructedTablesDoNotShareState) {
    Table t = makeUsers();
    Table copy = t;
    copy.removeRow(0);
    copy.setValue(0, "name", "Changed");
    EXPECT_EQ(t.getRowCount(), 3u);
    EXPECT_EQ(t.getValue(1, "name"), Value("Bob"));
}

TEST(TableWhole, Clear) {
    Table t = makeUsers();
    t.clear();
    EXPECT_FALSE(t.isDeclared());
    EXPECT_EQ(t.getRowCount(), 0u);
    EXPECT_THROW(t.addRow(), ColumnsUndeclaredError);
}

TEST(TableWhole, GetObject) {
    Table t = makeUsers();
    TableObject obj = t.getObject();
    EXPECT_EQ(obj.columns, (Names{"id", "name", "age"}));
    EXPECT_EQ(obj.rows.size(), 3u);
    EXPECT_EQ(obj.columnCount, 3u);
    EXPECT_EQ(obj.rowCount, 3u);
    EXPECT_TRUE(obj.isDeclared);

    Table small(Record{{"a", 1}});
    EXPECT_EQ(small.getObject().toValue().toCanonical(),
              "{\"columns\":[\"a\"],\"rows\":[{\"a\":1}],\"columnCount\":1,\"rowCount\":1,\"isDeclared\":true}");
    EXPECT_EQ(Table().getObject().toValue().toCanonical(),
              "{\"columns\":[],\"rows\":[],\"columnCount\":0,\"rowCount\":0,\"isDeclared\":false}");
}

TEST(TableWhole, GetSerialized) {
    Table t(std::vector<Record>{
        Record{{"id", 1}, {"name", "Alice"}},
        Record{{"id", 2}, {"name", nullptr}},
    });
    EXPECT_EQ(t.getSerialized(), "[{\"id\":1,\"name\":\"Alice\"},{\"id\":2,\"name\":null}]");
    EXPECT_EQ(Table({"a"}).getSerialized(), "[]");
}

TEST(TableWhole, SerializedTextRebuildsTable) {
    Table t = makeUsers();
    Table back = Table::fromSerialized(t.getSerialized());
    EXPECT_EQ(back.getColumns(), t.getColumns());
    EXPECT_EQ(back.getRows(), t.getRows());
}

TEST(TableWhole, MethodsChain) {
    Table t({"id", "name"});
    t.addRow(Record{{"id", 2}, {"name", "b"}})
     .addRow(Record{{"id", 1}, {"name", "a"}})
     .sortRowAscending("id")
     .addColumn("flag")
     .setColumnSameValue("flag", true);
    EXPECT_EQ(t.getSerialized(), "[{\"id\":1,\"name\":\"a\",\"flag\":true},{\"id\":2,\"name\":\"b\",\"flag\":true}]");
}

} // namespace
