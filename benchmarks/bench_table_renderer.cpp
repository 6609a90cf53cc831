// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Table Renderer Benchmarks                                          ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "tabula/table_renderer.hpp"

#include <string>
#include <vector>

using namespace tabula;

namespace {

ResultSet make_users(std::size_t count) {
    std::vector<ColumnDescriptor> columns{
        {"id", TypeCode::Varchar},
        {"name", TypeCode::Varchar},
        {"age", TypeCode::Int},
        {"score", TypeCode::Double},
    };

    std::vector<Row> rows;
    rows.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        rows.emplace_back(columns, std::vector<Value>{
            std::to_string(i),
            "user-" + std::string(i % 17, 'x'),
            static_cast<std::int32_t>(i % 100),
            static_cast<double>(i) / 8.0,
        });
    }
    return ResultSet(std::move(columns), std::move(rows));
}

} // anonymous namespace

static void BM_RenderTable(benchmark::State& state) {
    auto users = make_users(static_cast<std::size_t>(state.range(0)));
    TableRenderer renderer;

    for (auto _ : state) {
        auto text = renderer.render(users);
        benchmark::DoNotOptimize(text);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_RenderTable)->Range(8, 8192);

static void BM_RenderProjected(benchmark::State& state) {
    auto users = make_users(static_cast<std::size_t>(state.range(0)));
    std::vector<ColumnDescriptor> columns{{"age", ValueKind::Numeric}, {"id", ValueKind::Other}};
    TableRenderer renderer;

    for (auto _ : state) {
        auto text = renderer.render(columns, users.all());
        benchmark::DoNotOptimize(text);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_RenderProjected)->Range(8, 8192);

static void BM_TextWidth(benchmark::State& state) {
    const std::string text = "Emma-Sophie Zoé 日本語";

    for (auto _ : state) {
        auto width = text_width(text);
        benchmark::DoNotOptimize(width);
    }
}
BENCHMARK(BM_TextWidth);

BENCHMARK_MAIN();
