#pragma once

#include "geo/region_spec.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace statlas {
namespace query {

enum class MatchType {
    Regex,
    Exact,
    Contains,
    Startswith
};

enum class CaseSensitivity {
    Insensitive,
    Sensitive
};

/// How a text facet is compared against a column
struct SearchConfig {
    MatchType match_type = MatchType::Exact;
    CaseSensitivity case_sensitivity = CaseSensitivity::Insensitive;

    bool operator==(const SearchConfig& o) const {
        return match_type == o.match_type && case_sensitivity == o.case_sensitivity;
    }
};

/// Metric ids are prefixes by default ("f2ca" finds "f2ca9e...")
SearchConfig metricIdSearchConfig();

/// Metric columns a free-text search may look at
enum class SearchContext {
    Hxl,
    HumanReadableName,
    Description
};

std::vector<SearchContext> allSearchContexts();

struct SearchText {
    std::string text;
    std::vector<SearchContext> context = allSearchContexts();  // never empty
    SearchConfig config;
};

/**
 * @brief Year filter against a release's reference period
 *
 * Before(y): period starts on or before y-12-31.
 * After(y): period ends on or after y-01-01.
 * Between(a, b): period overlaps [a-01-01, b-12-31].
 */
struct YearRange {
    enum class Kind { Before, After, Between };

    Kind kind = Kind::Between;
    uint16_t start = 0;  // Between/After
    uint16_t end = 0;    // Between/Before

    static YearRange before(uint16_t year);
    static YearRange after(uint16_t year);
    static YearRange between(uint16_t first, uint16_t last);

    /**
     * @brief "2011", "...2015", "2000...", "2000...2010"
     * @throws ValidationError for non-numeric parts or first > last
     */
    static YearRange parse(const std::string& text);

    /// Comma separated list of the forms accepted by parse()
    static std::vector<YearRange> parseList(const std::string& text);

    std::string toString() const;

    bool operator==(const YearRange& o) const { return kind == o.kind && start == o.start && end == o.end; }
};

struct MetricId {
    std::string id;
    SearchConfig config = metricIdSearchConfig();
};

/// Single-valued text facet (geometry level, publisher, country, ...)
struct TextFilter {
    std::string value;
    SearchConfig config;
};

/**
 * @brief All facets a catalog search can be narrowed by
 *
 * Every facet other than metric_id is AND-combined, each text search counting
 * as its own facet. Several year ranges are OR-combined. metric_id entries are
 * OR-ed with the result of all other facets, so an explicitly requested id is
 * always returned.
 */
struct SearchParams {
    std::vector<SearchText> text;
    std::optional<std::vector<YearRange>> year_range;
    std::vector<MetricId> metric_id;
    std::optional<TextFilter> geometry_level;
    std::optional<TextFilter> source_data_release;
    std::optional<TextFilter> data_publisher;
    std::optional<TextFilter> source_download_url;
    std::optional<TextFilter> country;
    std::optional<TextFilter> source_metric_id;
    std::vector<geo::RegionSpec> region_spec;

    /// No facet restricts the search (region_spec does not filter the catalog)
    bool matchesAll() const;

    /**
     * @brief Parse the JSON dictionary form
     * @throws ValidationError
     */
    static SearchParams fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

// nlohmann ADL hooks; enum names are serialized verbatim ("Exact", "Insensitive", "Hxl")
void to_json(nlohmann::json& j, const SearchConfig& c);
void from_json(const nlohmann::json& j, SearchConfig& c);
void to_json(nlohmann::json& j, const SearchText& t);
void from_json(const nlohmann::json& j, SearchText& t);
void to_json(nlohmann::json& j, const YearRange& y);
void from_json(const nlohmann::json& j, YearRange& y);
void to_json(nlohmann::json& j, const MetricId& m);
void from_json(const nlohmann::json& j, MetricId& m);
void to_json(nlohmann::json& j, const TextFilter& f);
void from_json(const nlohmann::json& j, TextFilter& f);

} // namespace query
} // namespace statlas
