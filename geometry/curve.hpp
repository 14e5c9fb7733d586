#ifndef ENVELOPEKIT_GEOMETRY_CURVE_HPP
#define ENVELOPEKIT_GEOMETRY_CURVE_HPP

#include "interval.hpp"
#include "bounding_box.hpp"
#include <math/vec3.hpp>
#include <math/plane.hpp>
#include <math/transform.hpp>
#include <cstddef>
#include <vector>

namespace envelopekit {

// Polyline curve. A closed curve does not repeat its first point; the
// closing segment is implied. An empty curve stands for "no curve".
class Curve {
public:
    Curve() = default;
    Curve(std::vector<Vec3> points, bool closed);

    // Open polyline, or closed when the last point repeats the first
    static Curve polyline(const std::vector<Vec3>& points);

    // Closed rectangle centered on the plane origin
    static Curve rectangle(const Plane& plane, double width, double height);

    // Closed circle sampled as a regular polygon with `segments` sides
    static Curve circle(const Plane& plane, double radius, int segments = 64);

    // Closed regular polygon with circumradius `radius`, first vertex on +x
    static Curve regular_polygon(const Plane& plane, double radius, int sides);

    const std::vector<Vec3>& points() const { return points_; }
    size_t point_count() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    bool is_closed() const { return closed_; }

    size_t segment_count() const;

    // [0, segment_count], one unit per segment
    Interval domain() const;

    Vec3 point_at(double t) const;

    // New curve with every point transformed; this curve is untouched
    Curve transformed(const Transform& xform) const;

    BoundingBox bounding_box() const;

    double length() const;

    // Half the sum of p[i] x p[i+1] around the closed loop.
    // Its magnitude is the enclosed area for planar loops.
    Vec3 area_vector() const;

    bool operator==(const Curve& other) const {
        return closed_ == other.closed_ && points_ == other.points_;
    }

    bool operator!=(const Curve& other) const {
        return !(*this == other);
    }

private:
    std::vector<Vec3> points_;
    bool closed_ = false;
};

}  // namespace envelopekit

#endif // ENVELOPEKIT_GEOMETRY_CURVE_HPP
