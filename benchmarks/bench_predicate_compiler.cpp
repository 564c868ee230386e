// Search predicate benchmarks
// Compile cost of multi-facet searches and filter cost over a synthetic catalog view

#include <benchmark/benchmark.h>

#include "catalog/column_names.h"
#include "query/predicate_compiler.h"
#include "storage/table_ops.h"

#include <arrow/api.h>

#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace statlas;
using namespace statlas::query;

namespace {

void ok(const arrow::Status& st) {
    if (!st.ok()) throw std::runtime_error(st.ToString());
}

std::shared_ptr<arrow::Table> syntheticView(int64_t rows, uint32_t seed) {
    static const char* kWords[] = {"population", "households", "age", "sex", "tenure", "income", "occupation"};
    std::mt19937 rng(seed);
    std::uniform_int_distribution<size_t> word(0, 6);
    std::uniform_int_distribution<int> year(1990, 2022);

    arrow::StringBuilder ids, names, hxl, desc, level;
    arrow::Date32Builder start, end;
    for (int64_t i = 0; i < rows; ++i) {
        ok(ids.Append("m" + std::to_string(i)));
        ok(names.Append(std::string(kWords[word(rng)]) + " by " + kWords[word(rng)]));
        ok(hxl.Append(std::string("#") + kWords[word(rng)]));
        ok(desc.Append(std::string("Count of ") + kWords[word(rng)]));
        ok(level.Append(i % 3 == 0 ? "oa" : "msoa"));
        const int y = year(rng);
        ok(start.Append(PredicateCompiler::daysFromCivil(y, 1, 1)));
        ok(end.Append(PredicateCompiler::daysFromCivil(y, 12, 31)));
    }
    auto schema = arrow::schema({
        arrow::field(col::METRIC_ID, arrow::utf8()),
        arrow::field(col::METRIC_HUMAN_READABLE_NAME, arrow::utf8()),
        arrow::field(col::METRIC_HXL_TAG, arrow::utf8()),
        arrow::field(col::METRIC_DESCRIPTION, arrow::utf8()),
        arrow::field(col::GEOMETRY_LEVEL, arrow::utf8()),
        arrow::field(col::SOURCE_DATA_RELEASE_REFERENCE_PERIOD_START, arrow::date32()),
        arrow::field(col::SOURCE_DATA_RELEASE_REFERENCE_PERIOD_END, arrow::date32()),
    });
    return arrow::Table::Make(schema, {ids.Finish().ValueOrDie(), names.Finish().ValueOrDie(),
                                       hxl.Finish().ValueOrDie(), desc.Finish().ValueOrDie(),
                                       level.Finish().ValueOrDie(), start.Finish().ValueOrDie(),
                                       end.Finish().ValueOrDie()});
}

SearchParams typicalSearch() {
    SearchParams params;
    params.text.push_back({"households", allSearchContexts(), {MatchType::Contains, CaseSensitivity::Insensitive}});
    params.year_range = std::vector<YearRange>{YearRange::between(2000, 2015)};
    params.geometry_level = TextFilter{"oa", {}};
    params.metric_id.push_back({"m42"});
    return params;
}

} // namespace

// ============================================================================
// Compile
// ============================================================================

static void BM_Predicate_Compile(benchmark::State& state) {
    const auto params = typicalSearch();
    for (auto _ : state) {
        auto expr = PredicateCompiler::compile(params);
        benchmark::DoNotOptimize(expr);
    }
    state.SetLabel("text+year+level+id");
}
BENCHMARK(BM_Predicate_Compile);

static void BM_Predicate_CompileRegex(benchmark::State& state) {
    SearchParams params;
    params.text.push_back({"^(pop|house).*s$", allSearchContexts(), {MatchType::Regex, CaseSensitivity::Insensitive}});
    for (auto _ : state) {
        auto expr = PredicateCompiler::compile(params);
        benchmark::DoNotOptimize(expr);
    }
}
BENCHMARK(BM_Predicate_CompileRegex);

// ============================================================================
// Filter
// ============================================================================

static void BM_Predicate_Filter(benchmark::State& state) {
    const auto view = syntheticView(state.range(0), 42);
    const auto expr = *PredicateCompiler::compile(typicalSearch());
    int64_t matched = 0;
    for (auto _ : state) {
        auto out = storage::filter(view, expr);
        matched = out->num_rows();
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.counters["matched"] = static_cast<double>(matched);
}
BENCHMARK(BM_Predicate_Filter)->Arg(1000)->Arg(10000)->Arg(100000);

BENCHMARK_MAIN();
