#ifndef ENVELOPEKIT_MATH_PLANE_HPP
#define ENVELOPEKIT_MATH_PLANE_HPP

#include <math/vec3.hpp>
#include <gp_Ax3.hxx>
#include <gp_Dir.hxx>
#include <cmath>

namespace envelopekit {

// Oriented coordinate system: origin plus orthonormal axes.
// A surface frame is a Plane.
struct Plane {
    Vec3 origin = vec3::zero();
    Vec3 x_axis = vec3::unit_x();
    Vec3 y_axis = vec3::unit_y();
    Vec3 z_axis = vec3::unit_z();

    Plane() = default;

    // Orthonormalizes: x follows x_dir, z = x × y_dir, y completes the frame
    Plane(const Vec3& origin_, const Vec3& x_dir, const Vec3& y_dir)
        : origin(origin_) {
        x_axis = x_dir.normalized();
        z_axis = x_axis.cross(y_dir).normalized();
        y_axis = z_axis.cross(x_axis);
    }

    static Plane world_xy() { return Plane{}; }

    // Right-handed placement of an OpenCASCADE elementary surface
    static Plane from(const gp_Ax3& ax) {
        return Plane(Vec3::from(ax.Location()),
                     Vec3::from(ax.XDirection().XYZ()),
                     Vec3::from(ax.YDirection().XYZ()));
    }

    gp_Ax3 ax3() const {
        return gp_Ax3(origin.pnt(), gp_Dir(z_axis.xyz()), gp_Dir(x_axis.xyz()));
    }

    // World position of plane coordinates (a, b, c)
    Vec3 point_at(double a, double b, double c = 0.0) const {
        return origin + x_axis * a + y_axis * b + z_axis * c;
    }

    // Plane coordinates of a world position
    Vec3 to_local(const Vec3& p) const {
        Vec3 d = p - origin;
        return {d.dot(x_axis), d.dot(y_axis), d.dot(z_axis)};
    }

    bool is_valid() const {
        constexpr double eps = 1e-9;
        return origin.is_finite() &&
               std::abs(x_axis.length() - 1.0) < eps &&
               std::abs(y_axis.length() - 1.0) < eps &&
               std::abs(z_axis.length() - 1.0) < eps &&
               std::abs(x_axis.dot(y_axis)) < eps;
    }
};

}  // namespace envelopekit

#endif // ENVELOPEKIT_MATH_PLANE_HPP
