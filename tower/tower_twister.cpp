#include "tower_twister.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <numbers>

namespace envelopekit {

Transform floor_transform(int floor_index, double floor_height, int rotation_per_floor,
                          const Vec3& axis_point) {
    double z_offset = floor_index * floor_height;
    int rotation_degrees = floor_index * rotation_per_floor;

    Transform xform = Transform::translation(Vec3(0.0, 0.0, z_offset));

    if (rotation_degrees != 0) {
        double angle_rad = rotation_degrees * std::numbers::pi / 180.0;
        Vec3 axis_elevated(axis_point.x, axis_point.y, z_offset);
        xform = Transform::rotation(angle_rad, vec3::unit_z(), axis_elevated) * xform;
    }
    return xform;
}

TowerResult twist_tower(const Curve& base_curve,
                        int floor_count,
                        double floor_height,
                        int rotation_per_floor,
                        std::optional<Vec3> axis_point) {
    auto log = envelopekit::logging::get_logger();

    if (base_curve.empty()) {
        throw InputValidationError("No base curve provided.");
    }
    if (!base_curve.is_closed()) {
        throw InputValidationError(
            "Base curve must be closed. "
            "Use closed polylines, circles, rectangles, or polygons.");
    }
    if (base_curve.point_count() < 3 ||
        !(base_curve.area_vector().length() > kModelTolerance * kModelTolerance)) {
        throw InputValidationError(
            "Base curve is degenerate: it needs at least 3 points enclosing a non-zero area.");
    }
    if (floor_count < 2) {
        throw InputValidationError("Floor count must be at least 2.");
    }
    if (!(floor_height > 0.0) || !std::isfinite(floor_height)) {
        throw InputValidationError("Floor height must be > 0.");
    }

    Vec3 axis = axis_point ? *axis_point : base_curve.bounding_box().center();

    log->debug("twist_tower: {} floors, height {}, {} deg/floor about ({}, {})",
               floor_count, floor_height, rotation_per_floor, axis.x, axis.y);

    TowerResult result;
    result.floor_curves.reserve(static_cast<size_t>(floor_count));
    for (int i = 0; i < floor_count; ++i) {
        result.floor_curves.push_back(
            base_curve.transformed(floor_transform(i, floor_height, rotation_per_floor, axis)));
    }

    for (int i = 0; i + 1 < floor_count; ++i) {
        std::optional<Brep> lofted = loft({result.floor_curves[i], result.floor_curves[i + 1]});
        if (!lofted || lofted->empty()) {
            throw GeometryConstructionError(
                fmt::format("Loft failed between floors {} and {}.", i + 1, i + 2),
                fmt::format("floors {}-{}", i + 1, i + 2));
        }

        for (const auto& face : lofted->faces()) {
            result.surfaces.push_back(face.surface());
        }
    }

    log->debug("twist_tower: {} floor curves, {} surfaces",
               result.floor_curves.size(), result.surfaces.size());
    return result;
}

}  // namespace envelopekit
