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
 * @file canonical_reader.h
 * @brief Tabula Library - parser for canonical (JSON) text
 *
 * Turns canonical text back into a Value graph. Used to rehydrate Tables and
 * Wrappers from serialized text. Tokenizing and validation are done by
 * nlohmann::json in SAX mode; the handler below builds Values directly, so key
 * order is kept and integers whose magnitude exceeds 2^53 are returned as
 * BigInt instead of being rounded. Errors are reported as ParseError carrying
 * the byte offset of the offending character.
 */

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "definitions.h"
#include "errors.h"
#include "value.h"

namespace tabula {

    namespace detail {

        class CanonicalSaxHandler : public nlohmann::json_sax<nlohmann::ordered_json> {
            struct Frame {
                Value       node;   // Array or Record under construction
                std::string key;    // pending key when node is a Record
            };

            std::vector<Frame>  stack_;
            Value               root_;

            bool emit(Value value) {
                if (stack_.empty()) {
                    root_ = std::move(value);
                    return true;
                }
                Frame& top = stack_.back();
                if (top.node.isArray()) {
                    top.node.asArray().push_back(std::move(value));
                } else {
                    top.node.asRecord().set(top.key, std::move(value));  // a repeated key keeps its slot, last value wins
                }
                return true;
            }

            bool open(Value node) {
                if (stack_.size() >= MAX_PARSE_DEPTH) {
                    // nlohmann reports no offset for structural events
                    throw ParseError("Maximum nesting depth of " + std::to_string(MAX_PARSE_DEPTH) + " exceeded", 0);
                }
                stack_.push_back(Frame{std::move(node), {}});
                return true;
            }

            bool close() {
                Value node = std::move(stack_.back().node);
                stack_.pop_back();
                return emit(std::move(node));
            }

        public:
            Value result() { return std::move(root_); }

            bool null() override                                { return emit(Value(nullptr)); }
            bool boolean(bool value) override                   { return emit(Value(value)); }
            // Value routes 64-bit integers beyond 2^53 to BigInt
            bool number_integer(number_integer_t value) override    { return emit(Value(value)); }
            bool number_unsigned(number_unsigned_t value) override  { return emit(Value(value)); }

            bool number_float(number_float_t value, const string_t& raw) override {
                // an integer literal lands here only when it overflows 64 bits
                if (raw.find_first_of(".eE") == string_t::npos) {
                    return emit(Value(BigInt(raw)));
                }
                return emit(Value(value));
            }

            bool string(string_t& value) override               { return emit(Value(std::move(value))); }
            bool binary(binary_t&) override                     { return false; }  // not produced by JSON input

            bool start_object(std::size_t) override             { return open(Value(Record())); }
            bool key(string_t& value) override                  { stack_.back().key = std::move(value); return true; }
            bool end_object() override                          { return close(); }
            bool start_array(std::size_t) override              { return open(Value(Array())); }
            bool end_array() override                           { return close(); }

            bool parse_error(std::size_t position, const std::string&, const nlohmann::detail::exception& ex) override {
                // position counts the characters read, the last one is at fault
                throw ParseError(ex.what(), position > 0 ? position - 1 : 0);
            }
        };

    } // namespace detail

    /// Parse canonical text into a Value. Trailing non-whitespace is an error.
    inline Value parseCanonical(std::string_view text) {
        detail::CanonicalSaxHandler handler;
        if (!nlohmann::ordered_json::sax_parse(text.begin(), text.end(), &handler)) {
            throw ParseError("Malformed canonical text", 0);
        }
        return handler.result();
    }

} // namespace tabula
