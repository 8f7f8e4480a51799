/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the Tabula library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_table_ops.cpp
 * @brief Micro-benchmarks for Table operations and serialization.
 *
 * Measures row insertion (with kind checks in both modes), duplicate
 * detection, search, sorting, serialization and rehydration for tables of
 * growing size.
 */

#include <benchmark/benchmark.h>
#include <tabula/tabula.h>
#include <cstdint>
#include <string>

using namespace tabula;

// ============================================================================
// Setup helpers
// ============================================================================

namespace {

Record makeRow(size_t i) {
    return Record{
        {"id", i},
        {"name", "user" + std::to_string(i % 997)},
        {"score", static_cast<double>((i * 7919) % 1000) / 10.0},
        {"active", i % 3 != 0},
        {"tags", Value::array({"a", static_cast<double>(i % 5)})},
    };
}

Table makeTable(size_t rows, KindCheckMode mode = KindCheckMode::BACKWARD_SCAN) {
    Table table({"id", "name", "score", "active", "tags"});
    table.setKindCheckMode(mode);
    for (size_t i = 0; i < rows; ++i) {
        table.addRow(makeRow(i));
    }
    return table;
}

} // namespace

// ============================================================================
// Insertion
// ============================================================================

static void BM_Table_AddRow_BackwardScan(benchmark::State& state) {
    const size_t rows = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        Table table = makeTable(rows, KindCheckMode::BACKWARD_SCAN);
        benchmark::DoNotOptimize(table.getRowCount());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rows));
}
BENCHMARK(BM_Table_AddRow_BackwardScan)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_Table_AddRow_DeclaredKind(benchmark::State& state) {
    const size_t rows = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        Table table = makeTable(rows, KindCheckMode::DECLARED_KIND);
        benchmark::DoNotOptimize(table.getRowCount());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rows));
}
BENCHMARK(BM_Table_AddRow_DeclaredKind)->Arg(100)->Arg(1000)->Arg(10000);

// Sparse column: backward scan walks over many nulls per insert
static void BM_Table_AddRow_SparseColumn(benchmark::State& state) {
    const size_t rows = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        Table table({"v"});
        table.addRow(Record{{"v", 1}});
        for (size_t i = 1; i < rows; ++i) {
            table.addRow();
        }
        table.addRow(Record{{"v", 2}});
        benchmark::DoNotOptimize(table.getRowCount());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rows));
}
BENCHMARK(BM_Table_AddRow_SparseColumn)->Arg(1000)->Arg(10000);

// ============================================================================
// Queries
// ============================================================================

static void BM_Table_DuplicateCheck(benchmark::State& state) {
    const size_t rows = static_cast<size_t>(state.range(0));
    Table table = makeTable(rows);
    for (auto _ : state) {
        benchmark::DoNotOptimize(table.isNotDuplColumn("id"));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rows));
}
BENCHMARK(BM_Table_DuplicateCheck)->Arg(1000)->Arg(10000);

static void BM_Table_Search(benchmark::State& state) {
    const size_t rows = static_cast<size_t>(state.range(0));
    Table table = makeTable(rows);
    const Record condition{{"name", "user42"}, {"active", true}};
    for (auto _ : state) {
        auto hits = table.searchRowIndexes(condition);
        benchmark::DoNotOptimize(hits.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rows));
}
BENCHMARK(BM_Table_Search)->Arg(1000)->Arg(10000);

static void BM_Table_SortRows(benchmark::State& state) {
    const size_t rows = static_cast<size_t>(state.range(0));
    Table source = makeTable(rows);
    for (auto _ : state) {
        state.PauseTiming();
        Table table = source.clone();
        state.ResumeTiming();
        table.sortRowDescending("score");
        benchmark::DoNotOptimize(table.getRowCount());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rows));
}
BENCHMARK(BM_Table_SortRows)->Arg(1000)->Arg(10000);

// ============================================================================
// Serialization
// ============================================================================

static void BM_Table_Serialize(benchmark::State& state) {
    const size_t rows = static_cast<size_t>(state.range(0));
    Table table = makeTable(rows);
    size_t bytes = 0;
    for (auto _ : state) {
        std::string text = table.getSerialized();
        bytes = text.size();
        benchmark::DoNotOptimize(text.data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
}
BENCHMARK(BM_Table_Serialize)->Arg(1000)->Arg(10000);

static void BM_Wrapper_Rehydrate(benchmark::State& state) {
    const size_t rows = static_cast<size_t>(state.range(0));
    Wrapper request;
    request.put("action", "save").put("rows", makeTable(rows));
    const std::string text = request.getSerialized();
    for (auto _ : state) {
        Wrapper restored = Wrapper::fromSerialized(text);
        benchmark::DoNotOptimize(restored.size());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_Wrapper_Rehydrate)->Arg(1000)->Arg(10000);

BENCHMARK_MAIN();
