#ifndef ENVELOPEKIT_GEOMETRY_BOUNDING_BOX_HPP
#define ENVELOPEKIT_GEOMETRY_BOUNDING_BOX_HPP

#include <math/vec3.hpp>
#include <algorithm>
#include <vector>

namespace envelopekit {

// World-axis aligned box
struct BoundingBox {
    Vec3 min = vec3::zero();
    Vec3 max = vec3::zero();
    bool valid = false;

    static BoundingBox from_points(const std::vector<Vec3>& points) {
        BoundingBox box;
        for (const auto& p : points) {
            box.include(p);
        }
        return box;
    }

    void include(const Vec3& p) {
        if (!valid) {
            min = p;
            max = p;
            valid = true;
            return;
        }
        min = {std::min(min.x, p.x), std::min(min.y, p.y), std::min(min.z, p.z)};
        max = {std::max(max.x, p.x), std::max(max.y, p.y), std::max(max.z, p.z)};
    }

    Vec3 center() const { return (min + max) * 0.5; }
};

}  // namespace envelopekit

#endif // ENVELOPEKIT_GEOMETRY_BOUNDING_BOX_HPP
