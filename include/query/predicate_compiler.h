#pragma once

#include "query/search_params.h"

#include <arrow/compute/expression.h>

#include <optional>
#include <string>
#include <vector>

namespace statlas {
namespace query {

/**
 * @brief Translates SearchParams into one boolean Arrow expression over the
 * denormalized catalog view
 *
 * Text matching is always done with the "match_substring_regex" kernel:
 * literal inputs are escaped and anchored according to the match type.
 * Regex inputs are checked eagerly so a bad pattern is reported here rather
 * than when the filter runs.
 */
class PredicateCompiler {
public:
    /**
     * @brief Full predicate, or nullopt when nothing restricts the search
     * @throws ValidationError for an invalid regular expression
     */
    static std::optional<arrow::compute::Expression> compile(const SearchParams& params);

    /// One column test: Exact/Contains/Startswith/Regex, case (in)sensitive
    static arrow::compute::Expression textMatch(const std::string& column, const std::string& value,
                                                const SearchConfig& config);

    /// OR over the context columns of one text search
    static arrow::compute::Expression searchText(const SearchText& text);

    static arrow::compute::Expression yearRange(const YearRange& range);

    /// OR over the six country columns; case-insensitive whatever the config says
    static arrow::compute::Expression country(const TextFilter& filter);

    static arrow::compute::Expression metricId(const MetricId& id);

    /// Regex handed to the kernel for a match type (no case flag)
    static std::string regexFor(const std::string& value, MatchType match_type);

    static std::optional<arrow::compute::Expression> anyOf(std::vector<arrow::compute::Expression> exprs);
    static std::optional<arrow::compute::Expression> allOf(std::vector<arrow::compute::Expression> exprs);

    /// Days since 1970-01-01 for a proleptic Gregorian date (Date32 encoding)
    static int32_t daysFromCivil(int year, unsigned month, unsigned day);
};

} // namespace query
} // namespace statlas
