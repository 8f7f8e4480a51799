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
 * @file value.h
 * @brief Tabula Library - dynamic Value type, Record and canonical encoding
 *
 * Value is the tagged variant stored in every table cell:
 *
 *   undefined | null | boolean | number | bigint | string | symbol
 *             | Array | Record | opaque
 *
 * Primitives are held by value. Arrays and records are held by shared reference,
 * so one array may be reachable from several places (or from itself). Copying a
 * Value copies the reference, use deepCopy() (deep_copy.h) for an independent
 * graph. Opaque values are immutable domain objects (timestamps, decimals, ...)
 * that the library only compares by kind and canonical text.
 *
 * A node may also be held by back reference (a weak_ptr). DeepCopier uses back
 * references for every edge that closes a cycle, so copied graphs are owned as a
 * tree and are released with their root. A back reference reports the kind of
 * its node; reading the contents after the owning graph is gone throws
 * std::bad_weak_ptr.
 *
 * The canonical encoding is a deterministic JSON text of a value and is used for
 * structural equality in search, duplicate detection and sorting, and as the
 * serialized form handed to the transport layer.
 */

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "definitions.h"
#include "errors.h"

namespace tabula {

    class Value;
    class Record;

    using Array = std::vector<Value>;

    /**
     * @brief Arbitrary precision integer, stored as normalized decimal digits.
     *
     * Only the operations the table engine needs are provided: construction from
     * text, comparison and rendering.
     */
    class BigInt {
        std::string digits_ = "0";  // optional leading '-', no leading zeros

    public:
        BigInt() = default;
        explicit BigInt(int64_t value) : digits_(std::to_string(value)) {}
        explicit BigInt(std::string_view text);

        const std::string&  str() const                 { return digits_; }
        bool                isNegative() const          { return digits_.front() == '-'; }
        int                 compare(const BigInt& other) const;

        bool operator==(const BigInt& other) const      { return digits_ == other.digits_; }
        bool operator<(const BigInt& other) const       { return compare(other) < 0; }
    };

    /// Symbolic value, only its optional description is observable.
    struct Symbol {
        std::optional<std::string> description;
    };

    /**
     * @brief Base class for domain specific immutable values (e.g. timestamps).
     *
     * Instances are shared, never copied, by the library. Two opaque values have
     * the same kind when their dynamic C++ types are identical.
     */
    class OpaqueValue {
    public:
        virtual ~OpaqueValue() = default;

        /// Human readable type name used in diagnostics and kind names.
        virtual std::string typeName() const = 0;

        /// Canonical text fragment; must itself be valid canonical text.
        virtual std::string canonical() const = 0;
    };

    using OpaquePtr = std::shared_ptr<const OpaqueValue>;

    /**
     * @brief Identity of a value's kind: ValueKind plus, for opaque values, the
     * dynamic type. The name is informational and not part of the comparison.
     */
    struct KindTag {
        ValueKind       kind = ValueKind::UNDEFINED;
        std::type_index opaque_type{typeid(void)};
        std::string     name = "undefined";

        bool operator==(const KindTag& other) const {
            return kind == other.kind && opaque_type == other.opaque_type;
        }
    };

    class Value {
    public:
        using Storage = std::variant<
            std::monostate,             // undefined
            std::nullptr_t,             // null
            bool,
            double,
            BigInt,
            std::string,
            Symbol,
            std::shared_ptr<Array>,
            std::shared_ptr<Record>,
            OpaquePtr,
            std::weak_ptr<Array>,       // back reference to an array
            std::weak_ptr<Record>       // back reference to a record
        >;

    private:
        static constexpr size_t ARRAY_BACK_REF  = 10;
        static constexpr size_t RECORD_BACK_REF = 11;

        Storage storage_;

        template<typename T>
        T& node() const {
            if (const auto* owned = std::get_if<std::shared_ptr<T>>(&storage_)) {
                return **owned;
            }
            // the lock is released on return, the node lives on in its owning graph
            return *std::shared_ptr<T>(std::get<std::weak_ptr<T>>(storage_));
        }

    public:
        Value() = default;                              // undefined
        Value(std::nullptr_t)                           : storage_(nullptr) {}
        Value(bool v)                                   : storage_(v) {}
        // 64-bit integers beyond the exactly representable range become BigInt
        template<typename T>
        requires (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
        Value(T v) {
            if constexpr (std::is_integral_v<T> && sizeof(T) > 4) {
                bool tooLarge = v > static_cast<T>(MAX_SAFE_INTEGER);
                if constexpr (std::is_signed_v<T>) {
                    tooLarge = tooLarge || v < -static_cast<T>(MAX_SAFE_INTEGER);
                }
                if (tooLarge) {
                    storage_ = BigInt(std::to_string(v));
                    return;
                }
            }
            storage_ = static_cast<double>(v);
        }
        Value(const char* v)                            : storage_(std::string(v)) {}
        Value(std::string v)                            : storage_(std::move(v)) {}
        Value(std::string_view v)                       : storage_(std::string(v)) {}
        Value(BigInt v)                                 : storage_(std::move(v)) {}
        Value(Symbol v)                                 : storage_(std::move(v)) {}
        Value(Array v);
        Value(Record v);
        Value(std::shared_ptr<Array> v);
        Value(std::shared_ptr<Record> v);
        Value(OpaquePtr v);
        template<typename T>
        requires std::is_base_of_v<OpaqueValue, T>
        Value(std::shared_ptr<T> v)                     : Value(OpaquePtr(std::move(v))) {}

        static Value array(std::initializer_list<Value> items);
        static Value record(std::initializer_list<std::pair<std::string, Value>> entries);

        /// Non-owning reference to the array or record held by node.
        static Value backReference(const Value& node);

        // Kind information
        ValueKind           kind() const;
        bool                isBackReference() const     { return storage_.index() >= ARRAY_BACK_REF; }
        KindTag             kindTag() const;
        std::string         kindName() const            { return kindTag().name; }
        bool                sameKind(const Value& other) const { return kindTag() == other.kindTag(); }

        bool                isUndefined() const         { return kind() == ValueKind::UNDEFINED; }
        bool                isNull() const              { return kind() == ValueKind::NULL_VALUE; }
        bool                isBoolean() const           { return kind() == ValueKind::BOOLEAN; }
        bool                isNumber() const            { return kind() == ValueKind::NUMBER; }
        bool                isBigInt() const            { return kind() == ValueKind::BIGINT; }
        bool                isString() const            { return kind() == ValueKind::STRING; }
        bool                isSymbol() const            { return kind() == ValueKind::SYMBOL; }
        bool                isArray() const             { return kind() == ValueKind::ARRAY; }
        bool                isRecord() const            { return kind() == ValueKind::RECORD; }
        bool                isOpaque() const            { return kind() == ValueKind::OPAQUE; }
        bool                isStructured() const        { return isArray() || isRecord() || isOpaque(); }
        // null or a primitive that converts to a string
        bool                isStringConvertible() const { return !isUndefined() && !isStructured(); }

        // Typed access, throws std::bad_variant_access on kind mismatch
        bool                asBoolean() const           { return std::get<bool>(storage_); }
        double              asNumber() const            { return std::get<double>(storage_); }
        const BigInt&       asBigInt() const            { return std::get<BigInt>(storage_); }
        const std::string&  asString() const            { return std::get<std::string>(storage_); }
        const Symbol&       asSymbol() const            { return std::get<Symbol>(storage_); }
        const Array&        asArray() const             { return node<Array>(); }
        Array&              asArray()                   { return node<Array>(); }
        const Record&       asRecord() const            { return node<Record>(); }
        Record&             asRecord()                  { return node<Record>(); }
        const OpaquePtr&    asOpaque() const            { return std::get<OpaquePtr>(storage_); }

        template<typename T>
        std::shared_ptr<const T> asOpaqueOf() const     { return isOpaque() ? std::dynamic_pointer_cast<const T>(asOpaque()) : nullptr; }

        /// Address of the shared node for arrays, records and opaque values, nullptr otherwise.
        const void*         identity() const;
        const Storage&      storage() const             { return storage_; }

        /// Canonical (JSON) text, see toCanonical().
        std::string         toCanonical() const;
        /// String coercion: strings as-is, numbers in shortest round-trip form, null as "null".
        std::string         toString() const;

        /// Structural equality through the canonical encoding.
        bool operator==(const Value& other) const;
    };

    /**
     * @brief Insertion ordered string keyed map of Values.
     *
     * Implemented as a flat sequence; records in this library are small (one entry
     * per column) and order is observable, so a linear lookup is the right trade.
     */
    class Record {
    public:
        using Entry          = std::pair<std::string, Value>;
        using Container      = std::vector<Entry>;
        using iterator       = Container::iterator;
        using const_iterator = Container::const_iterator;

    private:
        Container entries_;

    public:
        Record() = default;
        Record(std::initializer_list<Entry> entries);

        bool                contains(const std::string& key) const  { return find(key) != nullptr; }
        const Value*        find(const std::string& key) const;
        Value*              find(const std::string& key);
        const Value&        at(const std::string& key) const;
        Value&              operator[](const std::string& key);
        Record&             set(const std::string& key, Value value);
        bool                erase(const std::string& key);
        std::vector<std::string> keys() const;

        size_t              size() const                            { return entries_.size(); }
        bool                empty() const                           { return entries_.empty(); }
        void                clear()                                 { entries_.clear(); }

        iterator            begin()                                 { return entries_.begin(); }
        iterator            end()                                   { return entries_.end(); }
        const_iterator      begin() const                           { return entries_.begin(); }
        const_iterator      end() const                             { return entries_.end(); }

        /// Structural equality through the canonical encoding (key order matters).
        bool operator==(const Record& other) const;
    };

    // ========================================================================
    // Canonical encoding
    // ========================================================================

    /// Append the canonical text of value to out. Throws CircularStructureError on cycles.
    void writeCanonical(const Value& value, std::string& out);
    std::string toCanonical(const Value& value);
    std::string toCanonical(const Record& record);
    std::string toCanonical(const std::vector<Record>& rows);

    /// Number formatting identical to ECMAScript Number::toString (radix 10).
    std::string formatNumber(double value);

    /// JSON string literal for text, including the surrounding quotes.
    std::string quoteString(std::string_view text);

    std::ostream& operator<<(std::ostream& os, const Value& value);
    std::ostream& operator<<(std::ostream& os, const Record& record);

} // namespace tabula
