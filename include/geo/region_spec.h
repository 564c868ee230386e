#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <variant>

namespace statlas {
namespace geo {

/**
 * @brief Axis-aligned rectangle (xmin, ymin, xmax, ymax) in the CRS of the
 * geometry file it is applied to
 */
struct BBox {
    std::array<double, 4> coords{0.0, 0.0, 0.0, 0.0};

    double minX() const { return coords[0]; }
    double minY() const { return coords[1]; }
    double maxX() const { return coords[2]; }
    double maxY() const { return coords[3]; }

    /**
     * @brief Parse "xmin,ymin,xmax,ymax"
     * @throws ValidationError unless there are exactly four numbers
     */
    static BBox parse(const std::string& text);

    bool operator==(const BBox& other) const { return coords == other.coords; }
};

/// Polygon regions are accepted for forward compatibility but carry no geometry yet
struct PolygonRegion {
    bool operator==(const PolygonRegion&) const { return true; }
};

struct NamedArea {
    std::string name;
    bool operator==(const NamedArea& other) const { return name == other.name; }
};

using RegionSpec = std::variant<BBox, PolygonRegion, NamedArea>;

/// Bounding box of a region, if it has one (only BBox regions do)
std::optional<BBox> bboxOf(const RegionSpec& region);

std::string describe(const RegionSpec& region);

// JSON form: {"boundingBox": [x0, y0, x1, y1]} | {"polygon": null} | {"namedArea": "name"}
void to_json(nlohmann::json& j, const BBox& bbox);
void from_json(const nlohmann::json& j, BBox& bbox);
void to_json(nlohmann::json& j, const RegionSpec& region);
void from_json(const nlohmann::json& j, RegionSpec& region);

} // namespace geo
} // namespace statlas
