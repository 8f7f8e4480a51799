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
 * @file deep_copy.h
 * @brief Tabula Library - recursive Value copier
 *
 * A deep copy shares no mutable node with its source: arrays and records are
 * rebuilt, primitives are copied by value, opaque values are routed through the
 * conversion hook (see Options). Nodes that are reachable more than once from
 * the source are copied once, so aliasing inside the source graph is preserved
 * in the copy and cyclic graphs terminate.
 *
 * The copy is owned as a tree: an edge that closes a cycle is rebuilt as a back
 * reference (see Value::backReference), so a cyclic copy is released together
 * with its root.
 */

#include <optional>
#include <utility>
#include <vector>

#include "options.h"
#include "value.h"

namespace tabula {

    class DeepCopier {
        using Visited = std::vector<std::pair<const void*, Value>>;

        // Marks a source node as being copied for the lifetime of the guard
        struct ActiveGuard {
            std::vector<const void*>& active;
            ActiveGuard(std::vector<const void*>& stack, const void* id) : active(stack) { active.push_back(id); }
            ~ActiveGuard() { active.pop_back(); }
            ActiveGuard(const ActiveGuard&) = delete;
            ActiveGuard& operator=(const ActiveGuard&) = delete;
        };

        ConvertHook                 hook_;
        Visited                     visited_;
        std::vector<const void*>    active_;    // source nodes on the current copy path

        std::optional<Value> findCopied(const void* id) const;
        Value copyValue(const Value& source);
        Value copyArray(const Value& source);
        Value copyRecord(const Value& source);
        Value convertOpaque(const Value& source);

    public:
        /// Copier using the process wide hook from Options.
        DeepCopier();
        /// Copier using an explicit hook; an empty function throws InvalidFunctionError.
        explicit DeepCopier(ConvertHook hook);

        /**
         * Copy a value. The visited list is kept between calls, so values copied
         * through the same DeepCopier share nodes that were shared in the sources.
         */
        Value copy(const Value& source);
        Record copy(const Record& source);

        /// Forget all previously copied nodes.
        void reset() { visited_.clear(); active_.clear(); }
    };

    /// Deep copy with the process wide conversion hook.
    Value deepCopy(const Value& source);
    Record deepCopy(const Record& source);

} // namespace tabula
