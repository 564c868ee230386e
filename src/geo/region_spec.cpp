#include "geo/region_spec.h"
#include "utils/errors.h"
#include "utils/string_utils.h"

#include <cerrno>
#include <cstdlib>

namespace statlas {
namespace geo {

namespace {

double parseCoordinate(const std::string& raw, const std::string& whole) {
    const std::string s = utils::trim(raw);
    if (s.empty()) {
        throw ValidationError("bounding box '" + whole + "' has an empty coordinate");
    }
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size()) {
        throw ValidationError("bounding box '" + whole + "': '" + s + "' is not a number");
    }
    return v;
}

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

BBox BBox::parse(const std::string& text) {
    const auto parts = utils::split(text, ",");
    if (parts.size() != 4) {
        throw ValidationError("bounding box needs 4 coordinates, got '" + text + "'");
    }
    BBox bbox;
    for (size_t i = 0; i < 4; ++i) {
        bbox.coords[i] = parseCoordinate(parts[i], text);
    }
    return bbox;
}

std::optional<BBox> bboxOf(const RegionSpec& region) {
    if (const auto* bbox = std::get_if<BBox>(&region)) {
        return *bbox;
    }
    return std::nullopt;
}

std::string describe(const RegionSpec& region) {
    return std::visit(overloaded{
        [](const BBox& b) {
            return "bbox(" + std::to_string(b.minX()) + ", " + std::to_string(b.minY()) + ", " +
                   std::to_string(b.maxX()) + ", " + std::to_string(b.maxY()) + ")";
        },
        [](const PolygonRegion&) { return std::string("polygon"); },
        [](const NamedArea& a) { return "named area '" + a.name + "'"; },
    }, region);
}

void to_json(nlohmann::json& j, const BBox& bbox) {
    j = nlohmann::json::array({bbox.coords[0], bbox.coords[1], bbox.coords[2], bbox.coords[3]});
}

void from_json(const nlohmann::json& j, BBox& bbox) {
    if (j.is_string()) {
        bbox = BBox::parse(j.get<std::string>());
        return;
    }
    if (!j.is_array() || j.size() != 4) {
        throw ValidationError("bounding box must be an array of 4 numbers");
    }
    for (size_t i = 0; i < 4; ++i) {
        if (!j[i].is_number()) {
            throw ValidationError("bounding box must be an array of 4 numbers");
        }
        bbox.coords[i] = j[i].get<double>();
    }
}

void to_json(nlohmann::json& j, const RegionSpec& region) {
    std::visit(overloaded{
        [&j](const BBox& b) { j = nlohmann::json{{"boundingBox", b}}; },
        [&j](const PolygonRegion&) { j = nlohmann::json{{"polygon", nullptr}}; },
        [&j](const NamedArea& a) { j = nlohmann::json{{"namedArea", a.name}}; },
    }, region);
}

void from_json(const nlohmann::json& j, RegionSpec& region) {
    if (!j.is_object() || j.size() != 1) {
        throw ValidationError("region must be an object with exactly one of boundingBox, polygon, namedArea");
    }
    if (j.contains("boundingBox")) {
        region = j.at("boundingBox").get<BBox>();
    } else if (j.contains("polygon")) {
        region = PolygonRegion{};
    } else if (j.contains("namedArea")) {
        if (!j.at("namedArea").is_string()) {
            throw ValidationError("namedArea must be a string");
        }
        region = NamedArea{j.at("namedArea").get<std::string>()};
    } else {
        throw ValidationError("unknown region kind '" + j.begin().key() + "'");
    }
}

} // namespace geo
} // namespace statlas
