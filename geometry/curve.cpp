#include "curve.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>
#include <utility>

namespace envelopekit {

Curve::Curve(std::vector<Vec3> points, bool closed)
    : points_(std::move(points)), closed_(closed) {}

Curve Curve::polyline(const std::vector<Vec3>& points) {
    if (points.size() > 2 && points.front() == points.back()) {
        return Curve(std::vector<Vec3>(points.begin(), points.end() - 1), true);
    }
    return Curve(points, false);
}

Curve Curve::rectangle(const Plane& plane, double width, double height) {
    if (!(width > 0.0) || !(height > 0.0)) {
        throw InputValidationError("Rectangle width and height must be > 0.");
    }
    double hw = width * 0.5;
    double hh = height * 0.5;
    return Curve({
        plane.point_at(-hw, -hh),
        plane.point_at(hw, -hh),
        plane.point_at(hw, hh),
        plane.point_at(-hw, hh)
    }, true);
}

Curve Curve::circle(const Plane& plane, double radius, int segments) {
    if (segments < 3) {
        throw InputValidationError("Circle needs at least 3 segments, got " + std::to_string(segments));
    }
    return regular_polygon(plane, radius, segments);
}

Curve Curve::regular_polygon(const Plane& plane, double radius, int sides) {
    if (sides < 3) {
        throw InputValidationError("Polygon needs at least 3 sides, got " + std::to_string(sides));
    }
    if (!(radius > 0.0)) {
        throw InputValidationError("Polygon radius must be > 0.");
    }
    std::vector<Vec3> points;
    points.reserve(static_cast<size_t>(sides));
    for (int i = 0; i < sides; ++i) {
        double theta = 2.0 * std::numbers::pi * i / sides;
        points.push_back(plane.point_at(radius * std::cos(theta), radius * std::sin(theta)));
    }
    return Curve(std::move(points), true);
}

size_t Curve::segment_count() const {
    if (points_.size() < 2) {
        return 0;
    }
    return closed_ ? points_.size() : points_.size() - 1;
}

Interval Curve::domain() const {
    return Interval{0.0, static_cast<double>(segment_count())};
}

Vec3 Curve::point_at(double t) const {
    if (points_.empty()) {
        return vec3::zero();
    }
    size_t segments = segment_count();
    if (segments == 0) {
        return points_.front();
    }

    double clamped = std::clamp(t, 0.0, static_cast<double>(segments));
    size_t index = std::min(static_cast<size_t>(clamped), segments - 1);
    double local = clamped - static_cast<double>(index);

    const Vec3& a = points_[index];
    const Vec3& b = points_[(index + 1) % points_.size()];
    return a + (b - a) * local;
}

Curve Curve::transformed(const Transform& xform) const {
    std::vector<Vec3> moved;
    moved.reserve(points_.size());
    for (const auto& p : points_) {
        moved.push_back(xform.apply(p));
    }
    return Curve(std::move(moved), closed_);
}

BoundingBox Curve::bounding_box() const {
    return BoundingBox::from_points(points_);
}

double Curve::length() const {
    double total = 0.0;
    size_t segments = segment_count();
    for (size_t i = 0; i < segments; ++i) {
        total += points_[i].distance_to(points_[(i + 1) % points_.size()]);
    }
    return total;
}

Vec3 Curve::area_vector() const {
    Vec3 sum = vec3::zero();
    if (!closed_ || points_.size() < 3) {
        return sum;
    }
    // Relative to the first point to keep the sum well conditioned far from origin
    const Vec3& base = points_.front();
    for (size_t i = 1; i + 1 < points_.size(); ++i) {
        sum += (points_[i] - base).cross(points_[i + 1] - base);
    }
    return sum * 0.5;
}

}  // namespace envelopekit
