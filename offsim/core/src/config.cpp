#include <offsim/core/config.hpp>

namespace offsim::core {

std::vector<AccessPoint> SimulationConfig::access_points() const {
    std::vector<AccessPoint> result;
    result.reserve(edge_datacenters.size());
    for (const auto& dc : edge_datacenters) {
        result.push_back(dc.access_point);
    }
    return result;
}

} // namespace offsim::core
