/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the Tabula library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file value_test.cpp
 * @brief Tests for Value, Record, BigInt and the canonical encoding.
 */

#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <sstream>
#include <string>

#include <tabula/tabula.h>

namespace {

using namespace tabula;

class Timestamp : public OpaqueValue {
    int64_t ms_;
public:
    explicit Timestamp(int64_t ms) : ms_(ms) {}
    std::string typeName() const override  { return "Timestamp"; }
    std::string canonical() const override { return "\"ts:" + std::to_string(ms_) + "\""; }
};

class Decimal : public OpaqueValue {
public:
    std::string typeName() const override  { return "Decimal"; }
    std::string canonical() const override { return "\"0.10\""; }
};

// ── Kinds ────────────────────────────────────────────────────────────────────

TEST(Value, DefaultIsUndefined) {
    Value v;
    EXPECT_TRUE(v.isUndefined());
    EXPECT_EQ(v.kind(), ValueKind::UNDEFINED);
    EXPECT_EQ(v.kindName(), "undefined");
}

TEST(Value, KindsOfPrimitives) {
    EXPECT_EQ(Value(nullptr).kind(), ValueKind::NULL_VALUE);
    EXPECT_EQ(Value(true).kind(), ValueKind::BOOLEAN);
    EXPECT_EQ(Value(42).kind(), ValueKind::NUMBER);
    EXPECT_EQ(Value(int64_t{7}).kind(), ValueKind::NUMBER);
    EXPECT_EQ(Value(2.5f).kind(), ValueKind::NUMBER);
    EXPECT_EQ(Value(BigInt(5)).kind(), ValueKind::BIGINT);
    EXPECT_EQ(Value("text").kind(), ValueKind::STRING);
    EXPECT_EQ(Value(std::string("text")).kind(), ValueKind::STRING);
    EXPECT_EQ(Value(Symbol{"s"}).kind(), ValueKind::SYMBOL);
}

TEST(Value, KindsOfStructuredValues) {
    EXPECT_EQ(Value::array({1, 2}).kindName(), "Array");
    EXPECT_EQ(Value(Record{{"a", 1}}).kindName(), "Object");
    Value ts(std::make_shared<Timestamp>(1));
    EXPECT_TRUE(ts.isOpaque());
    EXPECT_TRUE(ts.isStructured());
    EXPECT_EQ(ts.kindName(), "Timestamp");
}

TEST(Value, WideIntegersBeyondSafeRangeBecomeBigInt) {
    EXPECT_TRUE(Value(int64_t{9007199254740992}).isNumber());
    EXPECT_TRUE(Value(int64_t{-9007199254740992}).isNumber());
    EXPECT_TRUE(Value(size_t{12}).isNumber());

    Value above(int64_t{9007199254740993});
    ASSERT_TRUE(above.isBigInt());
    EXPECT_EQ(above.asBigInt().str(), "9007199254740993");

    EXPECT_EQ(Value(std::numeric_limits<uint64_t>::max()).asBigInt().str(), "18446744073709551615");
    EXPECT_EQ(Value(std::numeric_limits<int64_t>::min()).asBigInt().str(), "-9223372036854775808");
    EXPECT_EQ(toCanonical(Value(int64_t{-9007199254740993})), "-9007199254740993");
}

TEST(Value, NullPointersBecomeNull) {
    EXPECT_TRUE(Value(std::shared_ptr<Array>()).isNull());
    EXPECT_TRUE(Value(std::shared_ptr<Record>()).isNull());
    EXPECT_TRUE(Value(OpaquePtr()).isNull());
}

TEST(Value, SameKindComparesOpaqueTypes) {
    Value a(std::make_shared<Timestamp>(1));
    Value b(std::make_shared<Timestamp>(2));
    Value c(std::make_shared<Decimal>());
    EXPECT_TRUE(a.sameKind(b));
    EXPECT_FALSE(a.sameKind(c));
    EXPECT_FALSE(Value(1).sameKind(Value(BigInt(1))));
    EXPECT_FALSE(Value::array({}).sameKind(Value(Record{})));
    EXPECT_TRUE(Value("a").sameKind(Value("b")));
}

TEST(Value, StringConvertible) {
    EXPECT_TRUE(Value(nullptr).isStringConvertible());
    EXPECT_TRUE(Value(1).isStringConvertible());
    EXPECT_TRUE(Value(Symbol{}).isStringConvertible());
    EXPECT_FALSE(Value().isStringConvertible());
    EXPECT_FALSE(Value::array({}).isStringConvertible());
    EXPECT_FALSE(Value(std::make_shared<Decimal>()).isStringConvertible());
}

TEST(Value, CopiesShareStructuredNodes) {
    Value a = Value::array({1});
    Value b = a;
    b.asArray().push_back(2);
    EXPECT_EQ(a.identity(), b.identity());
    EXPECT_EQ(a.asArray().size(), 2u);
    EXPECT_EQ(Value(1).identity(), nullptr);
}

// ── BigInt ───────────────────────────────────────────────────────────────────

TEST(BigInt, NormalizesText) {
    EXPECT_EQ(BigInt("007").str(), "7");
    EXPECT_EQ(BigInt("-000").str(), "0");
    EXPECT_EQ(BigInt("+15").str(), "15");
    EXPECT_EQ(BigInt("-12345678901234567890").str(), "-12345678901234567890");
}

TEST(BigInt, RejectsInvalidText) {
    EXPECT_THROW(BigInt(""), InvalidArgumentError);
    EXPECT_THROW(BigInt("-"), InvalidArgumentError);
    EXPECT_THROW(BigInt("12a"), InvalidArgumentError);
    EXPECT_THROW(BigInt("1.5"), InvalidArgumentError);
}

TEST(BigInt, ComparesNumerically) {
    EXPECT_LT(BigInt("-5").compare(BigInt("3")), 0);
    EXPECT_LT(BigInt("-10").compare(BigInt("-9")), 0);
    EXPECT_GT(BigInt("100").compare(BigInt("99")), 0);
    EXPECT_EQ(BigInt("42").compare(BigInt(42)), 0);
    EXPECT_TRUE(BigInt("99999999999999999999") < BigInt("100000000000000000000"));
}

// ── Number formatting ────────────────────────────────────────────────────────

TEST(FormatNumber, IntegersAndFractions) {
    EXPECT_EQ(formatNumber(0), "0");
    EXPECT_EQ(formatNumber(-0.0), "0");
    EXPECT_EQ(formatNumber(1), "1");
    EXPECT_EQ(formatNumber(100), "100");
    EXPECT_EQ(formatNumber(-42), "-42");
    EXPECT_EQ(formatNumber(1.5), "1.5");
    EXPECT_EQ(formatNumber(0.1 + 0.2), "0.30000000000000004");
}

TEST(FormatNumber, ExponentThresholds) {
    EXPECT_EQ(formatNumber(123456789012345680000.0), "123456789012345680000");
    EXPECT_EQ(formatNumber(1e21), "1e+21");
    EXPECT_EQ(formatNumber(1.5e300), "1.5e+300");
    EXPECT_EQ(formatNumber(0.000001), "0.000001");
    EXPECT_EQ(formatNumber(1e-7), "1e-7");
    EXPECT_EQ(formatNumber(-2.5e-8), "-2.5e-8");
}

TEST(FormatNumber, NonFinite) {
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::quiet_NaN()), "NaN");
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::infinity()), "Infinity");
    EXPECT_EQ(formatNumber(-std::numeric_limits<double>::infinity()), "-Infinity");
}

// ── Canonical encoding ───────────────────────────────────────────────────────

TEST(Canonical, Primitives) {
    EXPECT_EQ(toCanonical(Value(nullptr)), "null");
    EXPECT_EQ(toCanonical(Value(true)), "true");
    EXPECT_EQ(toCanonical(Value(false)), "false");
    EXPECT_EQ(toCanonical(Value(3)), "3");
    EXPECT_EQ(toCanonical(Value(BigInt("12345678901234567890"))), "12345678901234567890");
    EXPECT_EQ(toCanonical(Value("abc")), "\"abc\"");
    EXPECT_EQ(toCanonical(Value(std::numeric_limits<double>::quiet_NaN())), "null");
    EXPECT_EQ(toCanonical(Value()), "");
    EXPECT_EQ(toCanonical(Value(Symbol{"x"})), "");
}

TEST(Canonical, StringEscapes) {
    EXPECT_EQ(quoteString("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(quoteString("line\nnext\ttab"), "\"line\\nnext\\ttab\"");
    EXPECT_EQ(quoteString(std::string("\x01", 1)), "\"\\u0001\"");
    EXPECT_EQ(quoteString("caf\xC3\xA9"), "\"caf\xC3\xA9\"");
    EXPECT_EQ(quoteString("bad\xFF"), "\"bad\xEF\xBF\xBD\"");
}

TEST(Canonical, RecordsKeepInsertionOrderAndSkipAbsent) {
    Record rec{{"b", 1}, {"a", "x"}, {"c", nullptr}, {"d", Value()}, {"e", Symbol{"s"}}};
    EXPECT_EQ(toCanonical(rec), "{\"b\":1,\"a\":\"x\",\"c\":null}");
}

TEST(Canonical, ArraysRenderAbsentAsNull) {
    Value arr = Value::array({1, Value(), Symbol{}, "z"});
    EXPECT_EQ(toCanonical(arr), "[1,null,null,\"z\"]");
}

TEST(Canonical, NestedStructures) {
    Value v = Value::record({{"tags", Value::array({"a", "b"})}, {"meta", Value::record({{"n", 1.25}})}});
    EXPECT_EQ(v.toCanonical(), "{\"tags\":[\"a\",\"b\"],\"meta\":{\"n\":1.25}}");
}

TEST(Canonical, OpaqueUsesItsFragment) {
    Value v = Value::array({Value(std::make_shared<Timestamp>(12))});
    EXPECT_EQ(toCanonical(v), "[\"ts:12\"]");
}

TEST(Canonical, SharedNodesAreNotCycles) {
    auto shared = std::make_shared<Array>(Array{Value(1)});
    Record rec;
    rec.set("x", Value(shared));
    rec.set("y", Value(shared));
    EXPECT_EQ(toCanonical(rec), "{\"x\":[1],\"y\":[1]}");
}

TEST(Canonical, CycleThrows) {
    auto node = std::make_shared<Array>();
    Value v(node);
    node->push_back(v);
    EXPECT_THROW(toCanonical(v), CircularStructureError);
    node->clear();  // break the reference cycle
}

TEST(Canonical, RowList) {
    std::vector<Record> rows{Record{{"id", 1}}, Record{{"id", 2}}};
    EXPECT_EQ(toCanonical(rows), "[{\"id\":1},{\"id\":2}]");
    EXPECT_EQ(toCanonical(std::vector<Record>{}), "[]");
}

// ── String coercion ──────────────────────────────────────────────────────────

TEST(Value, ToStringFollowsStringCoercion) {
    EXPECT_EQ(Value().toString(), "undefined");
    EXPECT_EQ(Value(nullptr).toString(), "null");
    EXPECT_EQ(Value(false).toString(), "false");
    EXPECT_EQ(Value(1.5).toString(), "1.5");
    EXPECT_EQ(Value(BigInt("-9")).toString(), "-9");
    EXPECT_EQ(Value("plain").toString(), "plain");
    EXPECT_EQ(Value(Symbol{"d"}).toString(), "Symbol(d)");
    EXPECT_EQ(Value::array({1, "a", nullptr, Value::array({2, 3})}).toString(), "1,a,,2,3");
    EXPECT_EQ(Value(Record{{"a", 1}}).toString(), "[object Object]");
}

// ── Equality ─────────────────────────────────────────────────────────────────

TEST(Value, StructuralEquality) {
    EXPECT_EQ(Value::array({1, "a"}), Value::array({1, "a"}));
    EXPECT_NE(Value::array({1, "a"}), Value::array({"a", 1}));
    EXPECT_EQ(Value(Record{{"a", 1}, {"b", 2}}), Value(Record{{"a", 1}, {"b", 2}}));
    EXPECT_NE(Value(Record{{"a", 1}, {"b", 2}}), Value(Record{{"b", 2}, {"a", 1}}));
    EXPECT_NE(Value(1), Value("1"));
    EXPECT_EQ(Value(), Value());
    EXPECT_NE(Value(), Value(nullptr));
    EXPECT_EQ(Value(Symbol{"a"}), Value(Symbol{"a"}));
    EXPECT_NE(Value(Symbol{"a"}), Value());
}

// ── Record ───────────────────────────────────────────────────────────────────

TEST(Record, SetReplacesInPlace) {
    Record rec{{"a", 1}, {"b", 2}};
    rec.set("a", 10);
    rec.set("c", 3);
    EXPECT_EQ(rec.keys(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(rec.at("a"), Value(10));
}

TEST(Record, LaterDuplicatesInInitializerOverwrite) {
    Record rec{{"a", 1}, {"a", 2}};
    EXPECT_EQ(rec.size(), 1u);
    EXPECT_EQ(rec.at("a"), Value(2));
}

TEST(Record, LookupAndErase) {
    Record rec{{"a", 1}};
    EXPECT_TRUE(rec.contains("a"));
    EXPECT_EQ(rec.find("b"), nullptr);
    EXPECT_THROW(rec.at("b"), std::out_of_range);
    EXPECT_TRUE(rec["b"].isUndefined());
    EXPECT_TRUE(rec.erase("a"));
    EXPECT_FALSE(rec.erase("a"));
    EXPECT_EQ(rec.keys(), (std::vector<std::string>{"b"}));
}

TEST(Record, StreamsCanonicalText) {
    std::ostringstream oss;
    oss << Record{{"k", "v"}} << " " << Value() << " " << Value::array({1});
    EXPECT_EQ(oss.str(), "{\"k\":\"v\"} undefined [1]");
}

} // namespace
