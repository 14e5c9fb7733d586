#ifndef ENVELOPEKIT_TOWER_TOWER_TWISTER_HPP
#define ENVELOPEKIT_TOWER_TOWER_TWISTER_HPP

#include <geometry/geometry.hpp>
#include <optional>
#include <vector>

namespace envelopekit {

struct TowerConfig {
    int floor_count = 10;
    double floor_height = 3.5;          // model units between floors
    int rotation_per_floor = 5;         // degrees, cumulative
    std::optional<Vec3> axis_point;     // defaults to the base curve's bounding box center
};

struct TowerResult {
    std::vector<SurfacePtr> surfaces;   // loft faces, in floor order
    std::vector<Curve> floor_curves;    // one per floor
};

// Transform placing floor `floor_index`: lift by index * floor_height, then
// rotate index * rotation_per_floor degrees about +Z through the axis point
// raised to that floor's elevation.
Transform floor_transform(int floor_index, double floor_height, int rotation_per_floor,
                          const Vec3& axis_point);

// Twisted tower from a closed plan curve: one rotated, elevated copy per
// floor and a loft between each consecutive pair. The base curve is only
// copied, never modified.
//
// Throws InputValidationError for an empty, open or degenerate curve (fewer
// than 3 points or no enclosed area), floor_count < 2 or floor_height <= 0,
// all before any floor is built, and GeometryConstructionError naming the
// floor pair when a loft fails.
TowerResult twist_tower(const Curve& base_curve,
                        int floor_count,
                        double floor_height,
                        int rotation_per_floor,
                        std::optional<Vec3> axis_point = std::nullopt);

inline TowerResult twist_tower(const Curve& base_curve, const TowerConfig& config) {
    return twist_tower(base_curve, config.floor_count, config.floor_height,
                       config.rotation_per_floor, config.axis_point);
}

}  // namespace envelopekit

#endif // ENVELOPEKIT_TOWER_TOWER_TWISTER_HPP
