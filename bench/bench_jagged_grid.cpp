#include <benchmark/benchmark.h>
#include <cstdint>
#include <string>
#include <vector>

// The competitors
#include "jagged_grid.hpp"
#include "absl/container/inlined_vector.h"
#include "boost/container/small_vector.hpp"

// --- Configuration ---

// Inline row capacity used by the SBO-based "vector of rows" competitors
constexpr size_t kInlineRow = 8;

// The types we will test
using TrivialType = uint64_t;
using ComplexType = std::string;

// Use a static value to prevent optimization
static TrivialType g_trivial_val = 42;
static ComplexType g_complex_val = "hello world a longer string";

// Row lengths cycle through 0..kMaxRowLen-1, so every shape is jagged and has empty rows.
constexpr size_t kMaxRowLen = 13;
static size_t row_len(size_t r) { return (r * 7) % kMaxRowLen; }

// =========================================================================
// Adapters: the benchmarks below are written once against this interface.
// =========================================================================

// Nested containers: one independently allocated Row per row.
template <typename Row>
struct Nested {
    using value_type = typename Row::value_type;
    std::vector<Row> rows;

    void add_row() { rows.emplace_back(); }
    void push(const value_type& v) { rows.back().push_back(v); }
    void insert(size_t r, size_t c, const value_type& v) { rows[r].insert(rows[r].begin() + c, v); }
    void remove_row(size_t r) { rows.erase(rows.begin() + r); }
    size_t row_count() const { return rows.size(); }
    template <typename F> void for_each(F&& f) const { for (const auto& row : rows) for (const auto& v : row) f(v); }
};

// The flat grid.
template <typename T>
struct Flat {
    using value_type = T;
    jagged::Grid<T> grid;

    void add_row() { grid.add_row(); }
    void push(const T& v) { grid.push(v); }
    void insert(size_t r, size_t c, const T& v) { grid.insert(r, c, v); }
    void remove_row(size_t r) { grid.remove_row(r); }
    size_t row_count() const { return grid.row_count(); }
    template <typename F> void for_each(F&& f) const { for (const auto& v : grid) f(v); }
};

template <typename G>
static G build(size_t rows, const typename G::value_type& v) {
    G g;
    for (size_t r = 0; r < rows; ++r) {
        g.add_row();
        for (size_t c = 0; c < row_len(r); ++c) g.push(v);
    }
    return g;
}

template <typename T> using StdRows = Nested<std::vector<T>>;
template <typename T> using AbslRows = Nested<absl::InlinedVector<T, kInlineRow>>;
template <typename T> using BoostRows = Nested<boost::container::small_vector<T, kInlineRow>>;

// =========================================================================
// BENCHMARK 1: Build (add_row + push)
// =========================================================================

template <typename G>
static void BM_Build_Trivial(benchmark::State& state) {
    const size_t rows = state.range(0);
    for (auto _ : state) {
        G g = build<G>(rows, g_trivial_val);
        benchmark::DoNotOptimize(g);
        benchmark::ClobberMemory();
    }
}
BENCHMARK_TEMPLATE(BM_Build_Trivial, StdRows<TrivialType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_Build_Trivial, AbslRows<TrivialType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_Build_Trivial, BoostRows<TrivialType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_Build_Trivial, Flat<TrivialType>)->Range(8, 1024);

template <typename G>
static void BM_Build_Complex(benchmark::State& state) {
    const size_t rows = state.range(0);
    for (auto _ : state) {
        G g = build<G>(rows, g_complex_val);
        benchmark::DoNotOptimize(g);
        benchmark::ClobberMemory();
    }
}
BENCHMARK_TEMPLATE(BM_Build_Complex, StdRows<ComplexType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_Build_Complex, AbslRows<ComplexType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_Build_Complex, BoostRows<ComplexType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_Build_Complex, Flat<ComplexType>)->Range(8, 1024);

// =========================================================================
// BENCHMARK 2: Row-Major Traversal
// =========================================================================

// This is where the flat buffer should win: one contiguous scan instead of
// one pointer chase per row.
template <typename G>
static void BM_Traverse(benchmark::State& state) {
    const size_t rows = state.range(0);
    G g = build<G>(rows, g_trivial_val);
    for (auto _ : state) {
        TrivialType sum = 0;
        g.for_each([&](TrivialType v) { sum += v; });
        benchmark::DoNotOptimize(sum);
    }
}
BENCHMARK_TEMPLATE(BM_Traverse, StdRows<TrivialType>)->Range(8, 4096);
BENCHMARK_TEMPLATE(BM_Traverse, AbslRows<TrivialType>)->Range(8, 4096);
BENCHMARK_TEMPLATE(BM_Traverse, BoostRows<TrivialType>)->Range(8, 4096);
BENCHMARK_TEMPLATE(BM_Traverse, Flat<TrivialType>)->Range(8, 4096);

// =========================================================================
// BENCHMARK 3: Insert into the First Row
// =========================================================================

// Worst case for the flat grid: every element behind the insertion point
// moves, and every later row start is shifted.
template <typename G>
static void BM_InsertFirstRow(benchmark::State& state) {
    const size_t rows = state.range(0);
    for (auto _ : state) {
        state.PauseTiming();
        G g = build<G>(rows, g_trivial_val);
        state.ResumeTiming();

        g.insert(0, 0, g_trivial_val);
        benchmark::ClobberMemory();
    }
}
BENCHMARK_TEMPLATE(BM_InsertFirstRow, StdRows<TrivialType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_InsertFirstRow, AbslRows<TrivialType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_InsertFirstRow, BoostRows<TrivialType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_InsertFirstRow, Flat<TrivialType>)->Range(8, 1024);

// =========================================================================
// BENCHMARK 4: Insert into the Last Row
// =========================================================================

template <typename G>
static void BM_InsertLastRow(benchmark::State& state) {
    const size_t rows = state.range(0);
    for (auto _ : state) {
        state.PauseTiming();
        G g = build<G>(rows, g_trivial_val);
        state.ResumeTiming();

        g.insert(g.row_count() - 1, 0, g_trivial_val);
        benchmark::ClobberMemory();
    }
}
BENCHMARK_TEMPLATE(BM_InsertLastRow, StdRows<TrivialType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_InsertLastRow, AbslRows<TrivialType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_InsertLastRow, BoostRows<TrivialType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_InsertLastRow, Flat<TrivialType>)->Range(8, 1024);

// =========================================================================
// BENCHMARK 5: Remove the First Row
// =========================================================================

template <typename G>
static void BM_RemoveFirstRow_Complex(benchmark::State& state) {
    const size_t rows = state.range(0);
    for (auto _ : state) {
        state.PauseTiming();
        G g = build<G>(rows, g_complex_val);
        state.ResumeTiming();

        g.remove_row(0);
        benchmark::ClobberMemory();
    }
}
BENCHMARK_TEMPLATE(BM_RemoveFirstRow_Complex, StdRows<ComplexType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_RemoveFirstRow_Complex, AbslRows<ComplexType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_RemoveFirstRow_Complex, BoostRows<ComplexType>)->Range(8, 1024);
BENCHMARK_TEMPLATE(BM_RemoveFirstRow_Complex, Flat<ComplexType>)->Range(8, 1024);

// =========================================================================
// BENCHMARK 6: Row Table Inline vs Heap
// =========================================================================

// Builds grids just below and just above the row table's inline capacity.
template <size_t InlineRows>
static void BM_SmallGridBuild(benchmark::State& state) {
    const size_t rows = state.range(0);
    for (auto _ : state) {
        jagged::Grid<TrivialType, InlineRows> g;
        for (size_t r = 0; r < rows; ++r) g.push_new_row(g_trivial_val);
        benchmark::DoNotOptimize(g);
        benchmark::ClobberMemory();
    }
}
BENCHMARK_TEMPLATE(BM_SmallGridBuild, 1)->Arg(4)->Arg(8);
BENCHMARK_TEMPLATE(BM_SmallGridBuild, 8)->Arg(4)->Arg(8);
BENCHMARK_TEMPLATE(BM_SmallGridBuild, 16)->Arg(4)->Arg(8);


// --- Main ---
