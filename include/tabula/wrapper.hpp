/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the Tabula library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "wrapper.h"
#include "canonical_reader.h"

#include <algorithm>

namespace tabula {

    inline Wrapper::Wrapper(const std::string& key, const Value& value) {
        put(key, value);
    }

    inline Wrapper::Wrapper(const std::string& key, const Table& table) {
        put(key, table);
    }

    inline Wrapper::Wrapper(const Record& entries) {
        for (const auto& [key, value] : entries) {
            put(key, value);
        }
    }

    inline Wrapper Wrapper::fromSerialized(std::string_view text) {
        Value parsed = parseCanonical(text);
        if (!parsed.isRecord()) {
            throw InvalidArgumentError("Serialized wrapper must be an object of key-value pairs.");
        }
        Wrapper wrapper;
        for (const auto& [key, value] : parsed.asRecord()) {
            if (value.isArray()) {
                wrapper.store(key, Table::fromValue(value));
            } else {
                wrapper.put(key, value);
            }
        }
        return wrapper;
    }

    inline Wrapper::Entry Wrapper::toEntry(const Value& value) {
        switch (value.kind()) {
            case ValueKind::UNDEFINED:
                throw UndefinedValueError();
            case ValueKind::NULL_VALUE:
                return nullptr;
            case ValueKind::SYMBOL:
                if (value.asSymbol().description) return *value.asSymbol().description;
                return nullptr;
            case ValueKind::STRING:
            case ValueKind::NUMBER:
            case ValueKind::BOOLEAN:
            case ValueKind::BIGINT:
                return value.toString();
            default:
                throw UnsupportedValueTypeError("Only string-convertible values or a Table can be inserted. key value type : "
                                                + value.kindName());
        }
    }

    inline Wrapper::Entry Wrapper::cloneEntry(const Entry& entry) {
        if (const Table* table = std::get_if<Table>(&entry)) {
            return table->clone();
        }
        return entry;
    }

    inline void Wrapper::store(const std::string& key, Entry entry) {
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second = std::move(entry);
            return;
        }
        keys_.push_back(key);
        entries_.emplace(key, std::move(entry));
    }

    // ========================================================================
    // Put
    // ========================================================================

    inline Wrapper& Wrapper::put(const std::string& key, const Value& value) {
        store(key, toEntry(value));
        return *this;
    }

    inline Wrapper& Wrapper::put(const std::string& key, const Table& table) {
        store(key, table.clone());
        return *this;
    }

    inline Wrapper& Wrapper::put(const std::string& key, const Wrapper&) {
        throw NestedContainerError("You cannot insert a Wrapper within a Wrapper. key : " + key);
    }

    inline Wrapper& Wrapper::putString(const std::string& key, const Value& value) {
        if (value.isUndefined()) {
            throw UndefinedValueError();
        }
        if (!value.isStringConvertible()) {
            throw UnsupportedValueTypeError("Please insert a string-convertible value. key : " + key);
        }
        return put(key, value);
    }

    inline Wrapper& Wrapper::putTable(const std::string& key, const Table& table) {
        return put(key, table);
    }

    // ========================================================================
    // Get / remove
    // ========================================================================

    inline Wrapper::Entry Wrapper::get(const std::string& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return nullptr;
        }
        return cloneEntry(it->second);
    }

    inline std::optional<std::string> Wrapper::getString(const std::string& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (std::holds_alternative<Table>(it->second)) {
            throw EntryTypeError("The data type stored under the key is a Table, not a string. key : " + key);
        }
        if (const auto* text = std::get_if<std::string>(&it->second)) {
            return *text;
        }
        return std::nullopt;
    }

    inline Table Wrapper::getTable(const std::string& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end() || !std::holds_alternative<Table>(it->second)) {
            throw EntryTypeError("The data type stored under the key is not a Table. key : " + key);
        }
        return std::get<Table>(it->second).clone();
    }

    inline Wrapper::Entry Wrapper::remove(const std::string& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return nullptr;
        }
        Entry previous = std::move(it->second);
        entries_.erase(it);
        keys_.erase(std::find(keys_.begin(), keys_.end(), key));
        return previous;
    }

    inline std::vector<Wrapper::Entry> Wrapper::values() const {
        std::vector<Entry> result;
        result.reserve(keys_.size());
        for (const auto& key : keys_) {
            result.push_back(cloneEntry(entries_.at(key)));
        }
        return result;
    }

    inline Wrapper& Wrapper::clear() {
        keys_.clear();
        entries_.clear();
        return *this;
    }

    inline Wrapper Wrapper::clone() const {
        Wrapper copy;
        for (const auto& key : keys_) {
            copy.store(key, cloneEntry(entries_.at(key)));
        }
        return copy;
    }

    // ========================================================================
    // Snapshots
    // ========================================================================

    inline Record Wrapper::getObject() const {
        Record result;
        for (const auto& key : keys_) {
            const Entry& entry = entries_.at(key);
            std::visit([&](const auto& stored) {
                using T = std::decay_t<decltype(stored)>;
                if constexpr (std::is_same_v<T, Table>) {
                    result.set(key, stored.getObject().toValue());
                } else {
                    result.set(key, Value(stored));
                }
            }, entry);
        }
        return result;
    }

    inline std::string Wrapper::getSerialized() const {
        std::string out;
        out += '{';
        bool first = true;
        for (const auto& key : keys_) {
            if (!first) out += ',';
            first = false;
            out += quoteString(key);
            out += ':';
            std::visit([&out](const auto& stored) {
                using T = std::decay_t<decltype(stored)>;
                if constexpr (std::is_same_v<T, Table>) {
                    out += stored.getSerialized();
                } else if constexpr (std::is_same_v<T, std::string>) {
                    out += quoteString(stored);
                } else {
                    out += "null";
                }
            }, entries_.at(key));
        }
        out += '}';
        return out;
    }

} // namespace tabula
