#include "query/predicate_compiler.h"
#include "catalog/column_names.h"
#include "storage/table_ops.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include "utils/string_utils.h"

#include <arrow/api.h>
#include <arrow/compute/api.h>

namespace statlas {
namespace query {

namespace cp = arrow::compute;

namespace {

// Compile the pattern through the same kernel the filter will use
void validatePattern(const std::string& pattern, bool ignore_case) {
    storage::ensureComputeKernels();
    arrow::StringBuilder builder;
    std::shared_ptr<arrow::Array> sample;
    auto st = builder.Append("");
    if (st.ok()) st = builder.Finish(&sample);
    if (!st.ok()) {
        throw StatlasError("regex check: " + st.ToString());
    }
    cp::MatchSubstringOptions options(pattern, ignore_case);
    auto result = cp::CallFunction("match_substring_regex", {sample}, &options);
    if (!result.ok()) {
        throw ValidationError("invalid regular expression '" + pattern + "': " + result.status().message());
    }
}

const char* contextColumn(SearchContext c) {
    switch (c) {
        case SearchContext::Hxl: return col::METRIC_HXL_TAG;
        case SearchContext::HumanReadableName: return col::METRIC_HUMAN_READABLE_NAME;
        case SearchContext::Description: return col::METRIC_DESCRIPTION;
    }
    return col::METRIC_HUMAN_READABLE_NAME;
}

cp::Expression dateLiteral(int year, unsigned month, unsigned day) {
    return cp::literal(std::make_shared<arrow::Date32Scalar>(PredicateCompiler::daysFromCivil(year, month, day)));
}

} // namespace

int32_t PredicateCompiler::daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int>(doe) - 719468;
}

std::string PredicateCompiler::regexFor(const std::string& value, MatchType match_type) {
    switch (match_type) {
        case MatchType::Exact: return "^" + utils::escapeRegex(value) + "$";
        case MatchType::Contains: return utils::escapeRegex(value);
        case MatchType::Startswith: return "^" + utils::escapeRegex(value);
        case MatchType::Regex: return value;
    }
    return value;
}

cp::Expression PredicateCompiler::textMatch(const std::string& column, const std::string& value,
                                            const SearchConfig& config) {
    const std::string pattern = regexFor(value, config.match_type);
    const bool ignore_case = config.case_sensitivity == CaseSensitivity::Insensitive;
    if (config.match_type == MatchType::Regex) {
        validatePattern(pattern, ignore_case);
    }
    return cp::call("match_substring_regex", {cp::field_ref(column)},
                    cp::MatchSubstringOptions(pattern, ignore_case));
}

cp::Expression PredicateCompiler::searchText(const SearchText& text) {
    if (text.context.empty()) {
        throw ValidationError("text search '" + text.text + "' has no context");
    }
    std::vector<cp::Expression> tests;
    for (auto c : text.context) {
        tests.push_back(textMatch(contextColumn(c), text.text, text.config));
    }
    return *anyOf(std::move(tests));
}

cp::Expression PredicateCompiler::yearRange(const YearRange& range) {
    const auto start_col = cp::field_ref(col::SOURCE_DATA_RELEASE_REFERENCE_PERIOD_START);
    const auto end_col = cp::field_ref(col::SOURCE_DATA_RELEASE_REFERENCE_PERIOD_END);
    switch (range.kind) {
        case YearRange::Kind::Before:
            return cp::less_equal(start_col, dateLiteral(range.end, 12, 31));
        case YearRange::Kind::After:
            return cp::greater_equal(end_col, dateLiteral(range.start, 1, 1));
        case YearRange::Kind::Between:
            break;
    }
    // Closed intervals [start, end] and [first-01-01, last-12-31] overlap
    return cp::and_(cp::less_equal(start_col, dateLiteral(range.end, 12, 31)),
                    cp::greater_equal(end_col, dateLiteral(range.start, 1, 1)));
}

cp::Expression PredicateCompiler::country(const TextFilter& filter) {
    const SearchConfig config{filter.config.match_type, CaseSensitivity::Insensitive};
    static const char* const kColumns[] = {
        col::COUNTRY_NAME_SHORT_EN,
        col::COUNTRY_NAME_OFFICIAL,
        col::COUNTRY_ISO2,
        col::COUNTRY_ISO3,
        col::COUNTRY_ISO3166_2,
        col::DATA_PUBLISHER_COUNTRIES_OF_INTEREST,
    };
    std::vector<cp::Expression> tests;
    for (const char* c : kColumns) {
        tests.push_back(textMatch(c, filter.value, config));
    }
    return *anyOf(std::move(tests));
}

cp::Expression PredicateCompiler::metricId(const MetricId& id) {
    return textMatch(col::METRIC_ID, id.id, id.config);
}

std::optional<cp::Expression> PredicateCompiler::anyOf(std::vector<cp::Expression> exprs) {
    if (exprs.empty()) return std::nullopt;
    cp::Expression out = exprs.front();
    for (size_t i = 1; i < exprs.size(); ++i) {
        out = cp::or_(out, exprs[i]);
    }
    return out;
}

std::optional<cp::Expression> PredicateCompiler::allOf(std::vector<cp::Expression> exprs) {
    if (exprs.empty()) return std::nullopt;
    cp::Expression out = exprs.front();
    for (size_t i = 1; i < exprs.size(); ++i) {
        out = cp::and_(out, exprs[i]);
    }
    return out;
}

std::optional<cp::Expression> PredicateCompiler::compile(const SearchParams& params) {
    std::vector<cp::Expression> refinement;

    // Each text search is its own facet
    for (const auto& t : params.text) {
        refinement.push_back(searchText(t));
    }

    if (params.year_range) {
        std::vector<cp::Expression> years;
        for (const auto& y : *params.year_range) {
            years.push_back(yearRange(y));
        }
        if (auto e = anyOf(std::move(years))) refinement.push_back(*e);
    }

    auto single = [&refinement](const std::optional<TextFilter>& f, const char* column) {
        if (f) refinement.push_back(textMatch(column, f->value, f->config));
    };
    single(params.geometry_level, col::GEOMETRY_LEVEL);
    single(params.source_data_release, col::SOURCE_DATA_RELEASE_NAME);
    single(params.data_publisher, col::DATA_PUBLISHER_NAME);
    single(params.source_download_url, col::METRIC_SOURCE_DOWNLOAD_URL);
    single(params.source_metric_id, col::METRIC_SOURCE_METRIC_ID);
    if (params.country) refinement.push_back(country(*params.country));

    std::vector<cp::Expression> ids;
    for (const auto& m : params.metric_id) {
        ids.push_back(metricId(m));
    }

    auto refine = allOf(std::move(refinement));
    auto identity = anyOf(std::move(ids));
    if (refine && identity) {
        return cp::or_(*refine, *identity);
    }
    if (refine) return refine;
    if (identity) return identity;
    STATLAS_DEBUG("Search has no facets; every catalog row matches");
    return std::nullopt;
}

} // namespace query
} // namespace statlas
