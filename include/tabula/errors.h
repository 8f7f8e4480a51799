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
 * @file errors.h
 * @brief Tabula Library - exception types
 *
 * Every failure is reported synchronously by throwing one of the types below.
 * All of them derive from tabula::Error, which carries an ErrorCode so callers
 * can either catch a specific type or switch on code().
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tabula {

    enum class ErrorCode : uint8_t {
        INVALID_ARGUMENT = 1,
        INVALID_FUNCTION,
        ENTRY_TYPE,
        COLUMN_NOT_FOUND,
        DUPLICATE_COLUMN,
        COLUMNS_UNDECLARED,
        ROW_INDEX_OUT_OF_RANGE,
        TYPE_CONSISTENCY,
        UNDEFINED_VALUE,
        NESTED_CONTAINER,
        UNSUPPORTED_VALUE_TYPE,
        SORT_TYPE,
        CIRCULAR_STRUCTURE,
        PARSE
    };

    inline std::string errorCodeToString(ErrorCode code) {
        switch (code) {
            case ErrorCode::INVALID_ARGUMENT:       return "invalid_argument";
            case ErrorCode::INVALID_FUNCTION:       return "invalid_function";
            case ErrorCode::ENTRY_TYPE:             return "entry_type";
            case ErrorCode::COLUMN_NOT_FOUND:       return "column_not_found";
            case ErrorCode::DUPLICATE_COLUMN:       return "duplicate_column";
            case ErrorCode::COLUMNS_UNDECLARED:     return "columns_undeclared";
            case ErrorCode::ROW_INDEX_OUT_OF_RANGE: return "row_index_out_of_range";
            case ErrorCode::TYPE_CONSISTENCY:       return "type_consistency";
            case ErrorCode::UNDEFINED_VALUE:        return "undefined_value";
            case ErrorCode::NESTED_CONTAINER:       return "nested_container";
            case ErrorCode::UNSUPPORTED_VALUE_TYPE: return "unsupported_value_type";
            case ErrorCode::SORT_TYPE:              return "sort_type";
            case ErrorCode::CIRCULAR_STRUCTURE:     return "circular_structure";
            case ErrorCode::PARSE:                  return "parse";
            default:                                return "unknown";
        }
    }

    class Error : public std::runtime_error {
        ErrorCode code_;
    public:
        Error(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {}
        ErrorCode code() const noexcept { return code_; }
    };

    // Wrong kind of argument passed to a typed parameter
    class InvalidArgumentError : public Error {
    public:
        explicit InvalidArgumentError(const std::string& msg) : Error(ErrorCode::INVALID_ARGUMENT, msg) {}
    protected:
        InvalidArgumentError(ErrorCode code, const std::string& msg) : Error(code, msg) {}
    };

    // Validator, formatter or filter is not callable
    class InvalidFunctionError : public InvalidArgumentError {
    public:
        explicit InvalidFunctionError(const std::string& msg = "Please insert a valid function.")
            : InvalidArgumentError(ErrorCode::INVALID_FUNCTION, msg) {}
    };

    // Wrapper entry exists but holds a different kind than requested
    class EntryTypeError : public InvalidArgumentError {
    public:
        explicit EntryTypeError(const std::string& msg) : InvalidArgumentError(ErrorCode::ENTRY_TYPE, msg) {}
    };

    class ColumnNotFoundError : public Error {
        std::string column_;
    public:
        explicit ColumnNotFoundError(const std::string& column)
            : Error(ErrorCode::COLUMN_NOT_FOUND, "The column does not exist. column : " + column), column_(column) {}
        const std::string& column() const noexcept { return column_; }
    };

    class DuplicateColumnError : public Error {
        std::string column_;
    public:
        explicit DuplicateColumnError(const std::string& column)
            : Error(ErrorCode::DUPLICATE_COLUMN, "There are duplicate columns to add. column : " + column), column_(column) {}
        const std::string& column() const noexcept { return column_; }
    };

    class ColumnsUndeclaredError : public Error {
    public:
        ColumnsUndeclaredError() : Error(ErrorCode::COLUMNS_UNDECLARED, "Please define the column first.") {}
    };

    class RowIndexOutOfRangeError : public Error {
        size_t index_;
        size_t row_count_;
    public:
        RowIndexOutOfRangeError(size_t index, size_t rowCount)
            : Error(ErrorCode::ROW_INDEX_OUT_OF_RANGE,
                    "Invalid row index " + std::to_string(index) + ", table has " + std::to_string(rowCount) + " rows")
            , index_(index), row_count_(rowCount) {}
        size_t index() const noexcept    { return index_; }
        size_t rowCount() const noexcept { return row_count_; }
    };

    class TypeConsistencyError : public Error {
        std::string column_;
    public:
        TypeConsistencyError(const std::string& column, const std::string& expected, const std::string& actual)
            : Error(ErrorCode::TYPE_CONSISTENCY,
                    "Data of the same type must be inserted into the same column. column : " + column +
                    " (expected " + expected + ", got " + actual + ")")
            , column_(column) {}
        const std::string& column() const noexcept { return column_; }
    };

    class UndefinedValueError : public Error {
    public:
        UndefinedValueError() : Error(ErrorCode::UNDEFINED_VALUE, "You can not put a value of undefined type.") {}
    };

    class NestedContainerError : public Error {
    public:
        explicit NestedContainerError(const std::string& msg) : Error(ErrorCode::NESTED_CONTAINER, msg) {}
    };

    class UnsupportedValueTypeError : public Error {
    public:
        explicit UnsupportedValueTypeError(const std::string& msg) : Error(ErrorCode::UNSUPPORTED_VALUE_TYPE, msg) {}
    };

    class SortTypeError : public Error {
    public:
        SortTypeError() : Error(ErrorCode::SORT_TYPE, "Cannot sort rows: non-integer value encountered.") {}
    };

    class CircularStructureError : public Error {
    public:
        CircularStructureError() : Error(ErrorCode::CIRCULAR_STRUCTURE, "Converting circular structure to canonical text") {}
    };

    class ParseError : public Error {
        size_t position_;
    public:
        ParseError(const std::string& msg, size_t position)
            : Error(ErrorCode::PARSE, msg + " at position " + std::to_string(position)), position_(position) {}
        size_t position() const noexcept { return position_; }
    };

} // namespace tabula
