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
 * @file options.h
 * @brief Tabula Library - process wide configuration
 *
 * Holds the value conversion hook consulted by DeepCopier for opaque values and
 * the default KindCheckMode assigned to newly constructed Tables.
 *
 * Options is plain mutable state without locking. Configure it once at start-up,
 * before Tables are used from more than one thread.
 */

#include <functional>
#include <utility>

#include "definitions.h"
#include "errors.h"
#include "value.h"

namespace tabula {

    /**
     * Conversion hook for opaque values. Return a replacement Value, or an
     * undefined Value to keep the original reference.
     */
    using ConvertHook = std::function<Value(const Value&)>;

    class Options {
        ConvertHook     convert_value_;
        KindCheckMode   kind_check_mode_ = KindCheckMode::BACKWARD_SCAN;

        Options() : convert_value_(passThrough) {}

        static Value passThrough(const Value& value) { return value; }

    public:
        Options(const Options&) = delete;
        Options& operator=(const Options&) = delete;

        static Options& instance() {
            static Options options;
            return options;
        }

        const ConvertHook&  convertValue() const            { return convert_value_; }
        KindCheckMode       kindCheckMode() const           { return kind_check_mode_; }

        Options& setConvertValue(ConvertHook hook) {
            if (!hook) {
                throw InvalidFunctionError();
            }
            convert_value_ = std::move(hook);
            return *this;
        }

        Options& resetConvertValue() {
            convert_value_ = passThrough;
            return *this;
        }

        Options& setKindCheckMode(KindCheckMode mode) {
            kind_check_mode_ = mode;
            return *this;
        }

        /// Restore all defaults.
        Options& reset() {
            convert_value_ = passThrough;
            kind_check_mode_ = KindCheckMode::BACKWARD_SCAN;
            return *this;
        }
    };

} // namespace tabula
