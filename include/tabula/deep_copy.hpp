/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the Tabula library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

#include "deep_copy.h"

#include <algorithm>
#include <memory>

namespace tabula {

    inline DeepCopier::DeepCopier() : hook_(Options::instance().convertValue()) {}

    inline DeepCopier::DeepCopier(ConvertHook hook) : hook_(std::move(hook)) {
        if (!hook_) {
            throw InvalidFunctionError();
        }
    }

    inline Value DeepCopier::copy(const Value& source) {
        return copyValue(source);
    }

    inline Record DeepCopier::copy(const Record& source) {
        Record result;
        for (const auto& [key, value] : source) {
            result.set(key, copyValue(value));
        }
        return result;
    }

    inline Value DeepCopier::copyValue(const Value& source) {
        switch (source.kind()) {
            case ValueKind::ARRAY:  return copyArray(source);
            case ValueKind::RECORD: return copyRecord(source);
            case ValueKind::OPAQUE: return convertOpaque(source);
            default:                return source;  // primitives are immutable
        }
    }

    inline std::optional<Value> DeepCopier::findCopied(const void* id) const {
        for (const auto& [seen, copied] : visited_) {
            if (seen != id) continue;
            // an edge back to a node still being copied closes a cycle
            if (std::find(active_.begin(), active_.end(), id) != active_.end()) {
                return Value::backReference(copied);
            }
            return copied;
        }
        return std::nullopt;
    }

    inline Value DeepCopier::copyArray(const Value& source) {
        const void* id = source.identity();
        if (auto copied = findCopied(id)) {
            return *copied;
        }

        auto target = std::make_shared<Array>();
        Value result(target);
        // register before recursing so self references resolve to the new node
        visited_.emplace_back(id, result);
        ActiveGuard guard(active_, id);

        const Array& items = source.asArray();
        target->reserve(items.size());
        for (const auto& item : items) {
            target->push_back(copyValue(item));
        }
        return result;
    }

    inline Value DeepCopier::copyRecord(const Value& source) {
        const void* id = source.identity();
        if (auto copied = findCopied(id)) {
            return *copied;
        }

        auto target = std::make_shared<Record>();
        Value result(target);
        visited_.emplace_back(id, result);
        ActiveGuard guard(active_, id);

        for (const auto& [key, item] : source.asRecord()) {
            target->set(key, copyValue(item));
        }
        return result;
    }

    inline Value DeepCopier::convertOpaque(const Value& source) {
        Value converted = hook_(source);
        if (converted.isUndefined()) {
            return source;
        }
        return converted;
    }

    inline Value deepCopy(const Value& source) {
        DeepCopier copier;
        return copier.copy(source);
    }

    inline Record deepCopy(const Record& source) {
        DeepCopier copier;
        return copier.copy(source);
    }

} // namespace tabula
