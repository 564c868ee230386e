#include "query/search_params.h"
#include "utils/errors.h"
#include "utils/string_utils.h"

#include <algorithm>
#include <cctype>

namespace statlas {
namespace query {

using nlohmann::json;

namespace {

const char* toString(MatchType m) {
    switch (m) {
        case MatchType::Regex: return "Regex";
        case MatchType::Exact: return "Exact";
        case MatchType::Contains: return "Contains";
        case MatchType::Startswith: return "Startswith";
    }
    return "Exact";
}

MatchType matchTypeFromString(const std::string& s) {
    if (s == "Regex") return MatchType::Regex;
    if (s == "Exact") return MatchType::Exact;
    if (s == "Contains") return MatchType::Contains;
    if (s == "Startswith") return MatchType::Startswith;
    throw ValidationError("unknown match type '" + s + "'");
}

const char* toString(CaseSensitivity c) {
    return c == CaseSensitivity::Sensitive ? "Sensitive" : "Insensitive";
}

CaseSensitivity caseFromString(const std::string& s) {
    if (s == "Insensitive") return CaseSensitivity::Insensitive;
    if (s == "Sensitive") return CaseSensitivity::Sensitive;
    throw ValidationError("unknown case sensitivity '" + s + "'");
}

const char* toString(SearchContext c) {
    switch (c) {
        case SearchContext::Hxl: return "Hxl";
        case SearchContext::HumanReadableName: return "HumanReadableName";
        case SearchContext::Description: return "Description";
    }
    return "Hxl";
}

SearchContext contextFromString(const std::string& s) {
    if (s == "Hxl") return SearchContext::Hxl;
    if (s == "HumanReadableName") return SearchContext::HumanReadableName;
    if (s == "Description") return SearchContext::Description;
    throw ValidationError("unknown search context '" + s + "'");
}

// Empty -> nullopt; digits only, fits u16
std::optional<uint16_t> parseYear(const std::string& raw, const std::string& whole) {
    const std::string s = utils::trim(raw);
    if (s.empty()) return std::nullopt;
    if (s.size() > 5 || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ValidationError("invalid year range '" + whole + "'");
    }
    unsigned long v = std::stoul(s);
    if (v > 65535) {
        throw ValidationError("invalid year range '" + whole + "'");
    }
    return static_cast<uint16_t>(v);
}

uint16_t yearFromJson(const json& j) {
    if (!j.is_number_unsigned() || j.get<uint64_t>() > 65535) {
        throw ValidationError("year must be an integer in [0, 65535]");
    }
    return j.get<uint16_t>();
}

template<typename T>
void optionalField(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = j.at(key).get<T>();
    }
}

template<typename T>
void listField(const json& j, const char* key, std::vector<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        if (!j.at(key).is_array()) {
            throw ValidationError(std::string("'") + key + "' must be an array");
        }
        out = j.at(key).get<std::vector<T>>();
    }
}

} // namespace

SearchConfig metricIdSearchConfig() {
    return SearchConfig{MatchType::Startswith, CaseSensitivity::Insensitive};
}

std::vector<SearchContext> allSearchContexts() {
    return {SearchContext::Hxl, SearchContext::HumanReadableName, SearchContext::Description};
}

YearRange YearRange::before(uint16_t year) {
    return YearRange{Kind::Before, 0, year};
}

YearRange YearRange::after(uint16_t year) {
    return YearRange{Kind::After, year, 0};
}

YearRange YearRange::between(uint16_t first, uint16_t last) {
    if (first > last) {
        throw ValidationError("invalid year range " + std::to_string(first) + "..." + std::to_string(last));
    }
    return YearRange{Kind::Between, first, last};
}

YearRange YearRange::parse(const std::string& text) {
    const auto parts = utils::split(text, "...");
    std::vector<std::optional<uint16_t>> years;
    for (const auto& p : parts) {
        years.push_back(parseYear(p, text));
    }
    if (years.size() == 1 && years[0]) {
        return between(*years[0], *years[0]);
    }
    if (years.size() == 2) {
        if (!years[0] && years[1]) return before(*years[1]);
        if (years[0] && !years[1]) return after(*years[0]);
        if (years[0] && years[1]) return between(*years[0], *years[1]);
    }
    throw ValidationError("invalid year range '" + text + "'");
}

std::vector<YearRange> YearRange::parseList(const std::string& text) {
    std::vector<YearRange> ranges;
    for (const auto& part : utils::split(text, ",")) {
        ranges.push_back(parse(part));
    }
    return ranges;
}

std::string YearRange::toString() const {
    switch (kind) {
        case Kind::Before: return "..." + std::to_string(end);
        case Kind::After: return std::to_string(start) + "...";
        case Kind::Between:
            return start == end ? std::to_string(start) : std::to_string(start) + "..." + std::to_string(end);
    }
    return "";
}

bool SearchParams::matchesAll() const {
    return text.empty() && !year_range && metric_id.empty() && !geometry_level &&
           !source_data_release && !data_publisher && !source_download_url && !country &&
           !source_metric_id;
}

SearchParams SearchParams::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("search params must be a JSON object");
    }
    SearchParams p;
    try {
        listField(j, "text", p.text);
        optionalField(j, "year_range", p.year_range);
        listField(j, "metric_id", p.metric_id);
        optionalField(j, "geometry_level", p.geometry_level);
        optionalField(j, "source_data_release", p.source_data_release);
        optionalField(j, "data_publisher", p.data_publisher);
        optionalField(j, "source_download_url", p.source_download_url);
        optionalField(j, "country", p.country);
        optionalField(j, "source_metric_id", p.source_metric_id);
        listField(j, "region_spec", p.region_spec);
    } catch (const json::exception& e) {
        throw ValidationError(std::string("search params: ") + e.what());
    }
    return p;
}

json SearchParams::toJson() const {
    json j = json::object();
    j["text"] = text;
    j["year_range"] = year_range ? json(*year_range) : json(nullptr);
    j["metric_id"] = metric_id;
    auto opt = [](const std::optional<TextFilter>& f) { return f ? json(*f) : json(nullptr); };
    j["geometry_level"] = opt(geometry_level);
    j["source_data_release"] = opt(source_data_release);
    j["data_publisher"] = opt(data_publisher);
    j["source_download_url"] = opt(source_download_url);
    j["country"] = opt(country);
    j["source_metric_id"] = opt(source_metric_id);
    j["region_spec"] = json::array();
    for (const auto& r : region_spec) {
        j["region_spec"].push_back(r);
    }
    return j;
}

void to_json(json& j, const SearchConfig& c) {
    j = json{{"match_type", toString(c.match_type)}, {"case_sensitivity", toString(c.case_sensitivity)}};
}

void from_json(const json& j, SearchConfig& c) {
    if (j.contains("match_type")) c.match_type = matchTypeFromString(j.at("match_type").get<std::string>());
    if (j.contains("case_sensitivity")) c.case_sensitivity = caseFromString(j.at("case_sensitivity").get<std::string>());
}

void to_json(json& j, const SearchText& t) {
    json ctx = json::array();
    for (auto c : t.context) ctx.push_back(toString(c));
    j = json{{"text", t.text}, {"context", ctx}, {"config", t.config}};
}

void from_json(const json& j, SearchText& t) {
    t.text = j.at("text").get<std::string>();
    if (j.contains("context")) {
        t.context.clear();
        for (const auto& c : j.at("context")) {
            t.context.push_back(contextFromString(c.get<std::string>()));
        }
        if (t.context.empty()) {
            throw ValidationError("text search '" + t.text + "' has no context");
        }
    }
    if (j.contains("config")) t.config = j.at("config").get<SearchConfig>();
}

void to_json(json& j, const YearRange& y) {
    switch (y.kind) {
        case YearRange::Kind::Before: j = json{{"Before", y.end}}; break;
        case YearRange::Kind::After: j = json{{"After", y.start}}; break;
        case YearRange::Kind::Between: j = json{{"Between", json::array({y.start, y.end})}}; break;
    }
}

void from_json(const json& j, YearRange& y) {
    if (j.is_string()) {
        y = YearRange::parse(j.get<std::string>());
        return;
    }
    if (!j.is_object() || j.size() != 1) {
        throw ValidationError("year range must be a string or one of {Before|After|Between}");
    }
    if (j.contains("Before")) {
        y = YearRange::before(yearFromJson(j.at("Before")));
    } else if (j.contains("After")) {
        y = YearRange::after(yearFromJson(j.at("After")));
    } else if (j.contains("Between")) {
        const auto& b = j.at("Between");
        if (!b.is_array() || b.size() != 2) {
            throw ValidationError("Between needs two years");
        }
        y = YearRange::between(yearFromJson(b[0]), yearFromJson(b[1]));
    } else {
        throw ValidationError("unknown year range kind '" + j.begin().key() + "'");
    }
}

void to_json(json& j, const MetricId& m) {
    j = json{{"id", m.id}, {"config", m.config}};
}

void from_json(const json& j, MetricId& m) {
    m.id = j.at("id").get<std::string>();
    m.config = j.contains("config") ? j.at("config").get<SearchConfig>() : metricIdSearchConfig();
}

void to_json(json& j, const TextFilter& f) {
    j = json{{"value", f.value}, {"config", f.config}};
}

void from_json(const json& j, TextFilter& f) {
    if (j.is_string()) {
        f.value = j.get<std::string>();
        return;
    }
    f.value = j.at("value").get<std::string>();
    if (j.contains("config")) f.config = j.at("config").get<SearchConfig>();
}

} // namespace query
} // namespace statlas
