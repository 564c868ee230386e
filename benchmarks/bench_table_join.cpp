// Table operation benchmarks
// Key join of metric columns to geometry rows and the list explode used by the catalog view

#include <benchmark/benchmark.h>

#include "storage/table_ops.h"

#include <arrow/api.h>

#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace statlas;

namespace {

void ok(const arrow::Status& st) {
    if (!st.ok()) throw std::runtime_error(st.ToString());
}

std::shared_ptr<arrow::Table> keyedTable(int64_t rows, const std::string& value_column, uint32_t seed) {
    std::vector<int64_t> order(static_cast<size_t>(rows));
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), std::mt19937(seed));

    arrow::StringBuilder keys;
    arrow::Int64Builder values;
    for (int64_t i : order) {
        ok(keys.Append("E" + std::to_string(i)));
        ok(values.Append(i * 7));
    }
    auto schema = arrow::schema({arrow::field("GEO_ID", arrow::utf8()), arrow::field(value_column, arrow::int64())});
    return arrow::Table::Make(schema, {keys.Finish().ValueOrDie(), values.Finish().ValueOrDie()});
}

std::shared_ptr<arrow::Table> listTable(int64_t rows, int per_row) {
    auto value_builder = std::make_shared<arrow::StringBuilder>();
    arrow::ListBuilder lists(arrow::default_memory_pool(), value_builder);
    arrow::Int64Builder ids;
    for (int64_t i = 0; i < rows; ++i) {
        ok(ids.Append(i));
        ok(lists.Append());
        for (int j = 0; j < per_row; ++j) {
            ok(value_builder->Append("C" + std::to_string(j)));
        }
    }
    auto schema = arrow::schema({arrow::field("id", arrow::int64()),
                                 arrow::field("countries", arrow::list(arrow::utf8()))});
    return arrow::Table::Make(schema, {ids.Finish().ValueOrDie(), lists.Finish().ValueOrDie()});
}

} // namespace

static void BM_Table_InnerJoin(benchmark::State& state) {
    const auto left = keyedTable(state.range(0), "geometry_rank", 1);
    const auto right = keyedTable(state.range(0), "population", 2);
    for (auto _ : state) {
        auto out = storage::innerJoin(left, right, "GEO_ID", "GEO_ID");
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Table_InnerJoin)->Arg(1000)->Arg(100000)->Arg(1000000);

static void BM_Table_ExplodeList(benchmark::State& state) {
    const auto t = listTable(state.range(0), 3);
    for (auto _ : state) {
        auto out = storage::explodeList(t, "countries");
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * 3);
}
BENCHMARK(BM_Table_ExplodeList)->Arg(1000)->Arg(100000);

static void BM_Table_ConcatUnified(benchmark::State& state) {
    std::vector<std::shared_ptr<arrow::Table>> parts;
    for (int i = 0; i < state.range(0); ++i) {
        parts.push_back(keyedTable(1000, "value", static_cast<uint32_t>(i)));
    }
    for (auto _ : state) {
        auto out = storage::concatUnified(parts);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_Table_ConcatUnified)->Arg(2)->Arg(16);

BENCHMARK_MAIN();
