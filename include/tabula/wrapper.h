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
 * @file wrapper.h
 * @brief Tabula Library - flat keyed container of strings and Tables
 *
 * A Wrapper maps string keys to a string, null, or a Table. Scalars are coerced
 * to their string form on insertion. Tables are stored as independent clones and
 * returned as clones, so a Wrapper never shares state with its callers. Keys keep
 * their insertion order; putting an existing key replaces its entry in place.
 *
 * Wrappers do not nest: a Wrapper cannot be stored in a Wrapper or a Table.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "errors.h"
#include "table.h"
#include "value.h"

namespace tabula {

    class Wrapper {
    public:
        using Entry = std::variant<std::nullptr_t, std::string, Table>;

    private:
        std::vector<std::string>                keys_;      // insertion order
        std::unordered_map<std::string, Entry>  entries_;

        static Entry    toEntry(const Value& value);
        static Entry    cloneEntry(const Entry& entry);
        void            store(const std::string& key, Entry entry);

    public:
        Wrapper() = default;
        Wrapper(const std::string& key, const Value& value);
        Wrapper(const std::string& key, const Table& table);
        explicit Wrapper(const Record& entries);

        /// Record of primitives, nulls and row arrays (which become Tables).
        static Wrapper fromSerialized(std::string_view text);

        Wrapper&    put(const std::string& key, const Value& value);
        Wrapper&    put(const std::string& key, const Table& table);
        Wrapper&    put(const std::string& key, const Wrapper& wrapper);
        Wrapper&    putString(const std::string& key, const Value& value);
        Wrapper&    putTable(const std::string& key, const Table& table);

        /// Stored entry, null for an absent key. Tables are returned as clones.
        Entry                       get(const std::string& key) const;
        /// Stored string; nullopt for null or absent. Throws EntryTypeError for a Table.
        std::optional<std::string>  getString(const std::string& key) const;
        /// Clone of the stored Table. Throws EntryTypeError otherwise.
        Table                       getTable(const std::string& key) const;

        Entry                       remove(const std::string& key);
        bool                        containsKey(const std::string& key) const   { return entries_.find(key) != entries_.end(); }
        bool                        isEmpty() const                             { return keys_.empty(); }
        size_t                      size() const                                { return keys_.size(); }
        const std::vector<std::string>& keys() const                            { return keys_; }
        std::vector<Entry>          values() const;
        Wrapper&                    clear();
        Wrapper                     clone() const;

        /// Snapshot with every Table expanded to TableObject::toValue().
        Record                      getObject() const;
        /// Canonical text with every Table rendered as its row list.
        std::string                 getSerialized() const;
    };

} // namespace tabula
