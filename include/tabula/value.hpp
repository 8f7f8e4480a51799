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
 * @file value.hpp
 * @brief Tabula Library - Value, Record and canonical encoding implementations
 */

#include "value.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <ostream>

namespace tabula {

    // ========================================================================
    // BigInt Implementation
    // ========================================================================

    inline BigInt::BigInt(std::string_view text) {
        size_t pos = 0;
        bool negative = false;
        if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
            negative = text[0] == '-';
            pos = 1;
        }
        if (pos >= text.size()) {
            throw InvalidArgumentError("Invalid big integer literal: '" + std::string(text) + "'");
        }
        for (size_t i = pos; i < text.size(); ++i) {
            if (text[i] < '0' || text[i] > '9') {
                throw InvalidArgumentError("Invalid big integer literal: '" + std::string(text) + "'");
            }
        }
        while (pos + 1 < text.size() && text[pos] == '0') {
            ++pos;  // strip leading zeros, keep the last digit
        }
        digits_ = std::string(text.substr(pos));
        if (negative && digits_ != "0") {
            digits_.insert(digits_.begin(), '-');
        }
    }

    inline int BigInt::compare(const BigInt& other) const {
        const bool lneg = isNegative();
        const bool rneg = other.isNegative();
        if (lneg != rneg) {
            return lneg ? -1 : 1;
        }
        std::string_view l(digits_);
        std::string_view r(other.digits_);
        if (lneg) {
            l.remove_prefix(1);
            r.remove_prefix(1);
        }
        int magnitude = 0;
        if (l.size() != r.size()) {
            magnitude = l.size() < r.size() ? -1 : 1;
        } else {
            int c = l.compare(r);
            magnitude = (c < 0) ? -1 : (c > 0 ? 1 : 0);
        }
        return lneg ? -magnitude : magnitude;
    }

    // ========================================================================
    // Value Implementation
    // ========================================================================

    inline Value::Value(Array v) : storage_(std::make_shared<Array>(std::move(v))) {}

    inline Value::Value(Record v) : storage_(std::make_shared<Record>(std::move(v))) {}

    inline Value::Value(std::shared_ptr<Array> v) {
        if (v) storage_ = std::move(v);
        else   storage_ = nullptr;
    }

    inline Value::Value(std::shared_ptr<Record> v) {
        if (v) storage_ = std::move(v);
        else   storage_ = nullptr;
    }

    inline Value::Value(OpaquePtr v) {
        if (v) storage_ = std::move(v);
        else   storage_ = nullptr;
    }

    inline Value Value::array(std::initializer_list<Value> items) {
        return Value(Array(items));
    }

    inline Value Value::record(std::initializer_list<std::pair<std::string, Value>> entries) {
        Record rec;
        for (const auto& [key, value] : entries) {
            rec.set(key, value);
        }
        return Value(std::move(rec));
    }

    inline Value Value::backReference(const Value& node) {
        Value result;
        if (const auto* array = std::get_if<std::shared_ptr<Array>>(&node.storage_)) {
            result.storage_ = std::weak_ptr<Array>(*array);
        } else if (const auto* record = std::get_if<std::shared_ptr<Record>>(&node.storage_)) {
            result.storage_ = std::weak_ptr<Record>(*record);
        } else {
            result = node;  // already a back reference, or nothing to refer to
        }
        return result;
    }

    inline ValueKind Value::kind() const {
        switch (storage_.index()) {
            case ARRAY_BACK_REF:  return ValueKind::ARRAY;
            case RECORD_BACK_REF: return ValueKind::RECORD;
            default:              return static_cast<ValueKind>(storage_.index());
        }
    }

    inline KindTag Value::kindTag() const {
        KindTag tag;
        tag.kind = kind();
        if (tag.kind == ValueKind::OPAQUE) {
            const OpaqueValue& opaque = *asOpaque();
            tag.opaque_type = std::type_index(typeid(opaque));
            tag.name = opaque.typeName();
        } else {
            tag.name = kindToString(tag.kind);
        }
        return tag;
    }

    inline const void* Value::identity() const {
        return std::visit([](const auto& v) -> const void* {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::shared_ptr<Array>> ||
                          std::is_same_v<T, std::shared_ptr<Record>> ||
                          std::is_same_v<T, OpaquePtr>) {
                return v.get();
            } else if constexpr (std::is_same_v<T, std::weak_ptr<Array>> ||
                                 std::is_same_v<T, std::weak_ptr<Record>>) {
                return v.lock().get();
            } else {
                return nullptr;
            }
        }, storage_);
    }

    inline std::string Value::toCanonical() const {
        return tabula::toCanonical(*this);
    }

    namespace detail {

        inline void joinString(const Value& value, std::string& out, std::vector<const void*>& stack) {
            switch (value.kind()) {
                case ValueKind::UNDEFINED:  out += "undefined"; return;
                case ValueKind::NULL_VALUE: out += "null"; return;
                case ValueKind::BOOLEAN:    out += value.asBoolean() ? "true" : "false"; return;
                case ValueKind::NUMBER:     out += formatNumber(value.asNumber()); return;
                case ValueKind::BIGINT:     out += value.asBigInt().str(); return;
                case ValueKind::STRING:     out += value.asString(); return;
                case ValueKind::SYMBOL:
                    out += "Symbol(" + value.asSymbol().description.value_or("") + ")";
                    return;
                case ValueKind::RECORD:     out += "[object Object]"; return;
                case ValueKind::OPAQUE:     out += value.asOpaque()->canonical(); return;
                case ValueKind::ARRAY:
                    break;
            }
            // Arrays join their elements with ',', a cyclic reference renders empty
            const void* id = value.identity();
            if (std::find(stack.begin(), stack.end(), id) != stack.end()) {
                return;
            }
            stack.push_back(id);
            bool first = true;
            for (const auto& item : value.asArray()) {
                if (!first) out += ',';
                first = false;
                if (!item.isNull() && !item.isUndefined()) {
                    joinString(item, out, stack);
                }
            }
            stack.pop_back();
        }

        // Numbers go through formatNumber, BigInt digits and opaque fragments are
        // written raw, strings and keys through quoteString.
        inline void writeCanonical(const Value& value, std::string& out, std::vector<const void*>& stack) {
            switch (value.kind()) {
                case ValueKind::UNDEFINED:
                case ValueKind::SYMBOL:
                    return;  // callers decide how to represent absent values
                case ValueKind::NULL_VALUE:
                    out += "null";
                    return;
                case ValueKind::BOOLEAN:
                    out += value.asBoolean() ? "true" : "false";
                    return;
                case ValueKind::NUMBER: {
                    double d = value.asNumber();
                    out += std::isfinite(d) ? formatNumber(d) : "null";
                    return;
                }
                case ValueKind::BIGINT:
                    out += value.asBigInt().str();
                    return;
                case ValueKind::STRING:
                    out += quoteString(value.asString());
                    return;
                case ValueKind::OPAQUE:
                    out += value.asOpaque()->canonical();
                    return;
                case ValueKind::ARRAY:
                case ValueKind::RECORD:
                    break;
            }

            const void* id = value.identity();
            if (std::find(stack.begin(), stack.end(), id) != stack.end()) {
                throw CircularStructureError();
            }
            stack.push_back(id);
            if (value.isArray()) {
                out += '[';
                bool first = true;
                for (const auto& item : value.asArray()) {
                    if (!first) out += ',';
                    first = false;
                    if (item.isUndefined() || item.isSymbol()) {
                        out += "null";
                    } else {
                        writeCanonical(item, out, stack);
                    }
                }
                out += ']';
            } else {
                out += '{';
                bool first = true;
                for (const auto& [key, item] : value.asRecord()) {
                    if (item.isUndefined() || item.isSymbol()) {
                        continue;
                    }
                    if (!first) out += ',';
                    first = false;
                    out += quoteString(key);
                    out += ':';
                    writeCanonical(item, out, stack);
                }
                out += '}';
            }
            stack.pop_back();
        }

    } // namespace detail

    inline std::string Value::toString() const {
        std::string out;
        std::vector<const void*> stack;
        detail::joinString(*this, out, stack);
        return out;
    }

    inline bool Value::operator==(const Value& other) const {
        if (isUndefined() || other.isUndefined()) {
            return isUndefined() && other.isUndefined();
        }
        if (isSymbol() || other.isSymbol()) {
            return isSymbol() && other.isSymbol() && asSymbol().description == other.asSymbol().description;
        }
        return tabula::toCanonical(*this) == tabula::toCanonical(other);
    }

    // ========================================================================
    // Record Implementation
    // ========================================================================

    inline Record::Record(std::initializer_list<Entry> entries) {
        for (const auto& [key, value] : entries) {
            set(key, value);
        }
    }

    inline const Value* Record::find(const std::string& key) const {
        for (const auto& entry : entries_) {
            if (entry.first == key) return &entry.second;
        }
        return nullptr;
    }

    inline Value* Record::find(const std::string& key) {
        for (auto& entry : entries_) {
            if (entry.first == key) return &entry.second;
        }
        return nullptr;
    }

    inline const Value& Record::at(const std::string& key) const {
        const Value* value = find(key);
        if (!value) {
            throw std::out_of_range("Record has no key: " + key);
        }
        return *value;
    }

    inline Value& Record::operator[](const std::string& key) {
        if (Value* value = find(key)) {
            return *value;
        }
        entries_.emplace_back(key, Value());
        return entries_.back().second;
    }

    inline Record& Record::set(const std::string& key, Value value) {
        (*this)[key] = std::move(value);
        return *this;
    }

    inline bool Record::erase(const std::string& key) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&key](const Entry& e) { return e.first == key; });
        if (it == entries_.end()) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    inline std::vector<std::string> Record::keys() const {
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            result.push_back(entry.first);
        }
        return result;
    }

    inline bool Record::operator==(const Record& other) const {
        return tabula::toCanonical(*this) == tabula::toCanonical(other);
    }

    // ========================================================================
    // Canonical encoding
    // ========================================================================

    inline void writeCanonical(const Value& value, std::string& out) {
        std::vector<const void*> stack;
        detail::writeCanonical(value, out, stack);
    }

    inline std::string toCanonical(const Value& value) {
        std::string out;
        writeCanonical(value, out);
        return out;
    }

    inline std::string toCanonical(const Record& record) {
        std::string out;
        out += '{';
        bool first = true;
        std::vector<const void*> stack;
        for (const auto& [key, item] : record) {
            if (item.isUndefined() || item.isSymbol()) {
                continue;
            }
            if (!first) out += ',';
            first = false;
            out += quoteString(key);
            out += ':';
            detail::writeCanonical(item, out, stack);
        }
        out += '}';
        return out;
    }

    inline std::string toCanonical(const std::vector<Record>& rows) {
        std::string out;
        out += '[';
        for (size_t i = 0; i < rows.size(); ++i) {
            if (i > 0) out += ',';
            out += toCanonical(rows[i]);
        }
        out += ']';
        return out;
    }

    inline std::string formatNumber(double value) {
        if (std::isnan(value)) return "NaN";
        if (std::isinf(value)) return value < 0 ? "-Infinity" : "Infinity";
        if (value == 0.0)      return "0";  // also -0

        // Shortest round-trip digits in scientific notation: [-]d[.ddd]e[+-]xx
        char buf[64];
        auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
        std::string_view sci(buf, static_cast<size_t>(res.ptr - buf));

        const bool negative = sci.front() == '-';
        const size_t epos = sci.find('e');
        std::string digits;
        for (size_t i = negative ? 1 : 0; i < epos; ++i) {
            if (sci[i] != '.') digits += sci[i];
        }
        while (digits.size() > 1 && digits.back() == '0') {
            digits.pop_back();
        }
        int exponent = 0;
        std::string_view exp_text = sci.substr(epos + 1);
        if (!exp_text.empty() && exp_text.front() == '+') {
            exp_text.remove_prefix(1);
        }
        std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exponent);

        const int k = static_cast<int>(digits.size());
        const int n = exponent + 1;  // value = 0.digits * 10^n
        std::string out = negative ? "-" : "";
        if (k <= n && n <= 21) {
            out += digits;
            out.append(static_cast<size_t>(n - k), '0');
        } else if (0 < n && n <= 21) {
            out += digits.substr(0, static_cast<size_t>(n));
            out += '.';
            out += digits.substr(static_cast<size_t>(n));
        } else if (-6 < n && n <= 0) {
            out += "0.";
            out.append(static_cast<size_t>(-n), '0');
            out += digits;
        } else {
            const int e = n - 1;
            out += digits[0];
            if (k > 1) {
                out += '.';
                out += digits.substr(1);
            }
            out += 'e';
            out += (e < 0) ? '-' : '+';
            out += std::to_string(std::abs(e));
        }
        return out;
    }

    // Escaping follows nlohmann::json: short escapes where JSON has them, \u00XX for
    // other control characters, UTF-8 passed through; invalid UTF-8 becomes U+FFFD.
    inline std::string quoteString(std::string_view text) {
        return nlohmann::ordered_json(std::string(text))
            .dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    }

    inline std::ostream& operator<<(std::ostream& os, const Value& value) {
        if (value.isUndefined()) {
            return os << "undefined";
        }
        if (value.isSymbol()) {
            return os << value.toString();
        }
        return os << toCanonical(value);
    }

    inline std::ostream& operator<<(std::ostream& os, const Record& record) {
        return os << toCanonical(record);
    }

} // namespace tabula
