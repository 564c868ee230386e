#pragma once

#include <ostream>
#include <string>

namespace statlas {
namespace download {

/// One resolved (column, metric file, geometry file) triple, derived per matched catalog row
struct MetricRequest {
    std::string column;
    std::string metric_file;
    std::string geom_file;

    bool operator==(const MetricRequest& o) const {
        return column == o.column && metric_file == o.metric_file && geom_file == o.geom_file;
    }
};

inline std::ostream& operator<<(std::ostream& os, const MetricRequest& r) {
    return os << "MetricRequest{" << r.column << ", " << r.metric_file << ", " << r.geom_file << "}";
}

} // namespace download
} // namespace statlas
