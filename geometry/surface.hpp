#ifndef ENVELOPEKIT_GEOMETRY_SURFACE_HPP
#define ENVELOPEKIT_GEOMETRY_SURFACE_HPP

#include "interval.hpp"
#include <math/vec3.hpp>
#include <math/plane.hpp>
#include <Geom_Surface.hxx>
#include <TopoDS_Face.hxx>
#include <array>
#include <memory>
#include <optional>
#include <string>

namespace envelopekit {

class Surface;

// Surfaces are immutable and shared
using SurfacePtr = std::shared_ptr<const Surface>;

// Bounded parametric surface addressed by (u, v), backed by an
// OpenCASCADE Geom_Surface.
class Surface {
public:
    // Throws GeometryConstructionError when `geometry` is null or unbounded
    explicit Surface(Handle(Geom_Surface) geometry);

    // S(u, v) = origin + x_axis * u + y_axis * v over the given ranges
    static SurfacePtr plane(const Plane& plane, const Interval& u_domain, const Interval& v_domain);

    // Cylinder about the base plane's z axis.
    // u: angle in radians from the plane's x axis, v: height along z.
    static SurfacePtr cylinder(const Plane& base, double radius,
                               const Interval& angle, const Interval& height);

    // Four-corner patch over [0,1] x [0,1]:
    // a = S(0,0), b = S(1,0), c = S(1,1), d = S(0,1). Corners are not checked.
    static SurfacePtr bilinear(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d);

    // Underlying surface of a face, bounded by the face's parameter range
    static SurfacePtr of_face(const TopoDS_Face& face);

    // Parameter range along direction 0 (U) or 1 (V)
    Interval domain(int direction) const {
        return direction == 0 ? u_domain_ : v_domain_;
    }

    Vec3 point_at(double u, double v) const;

    // Unit normal, zero where the surface is singular
    Vec3 normal_at(double u, double v) const;

    // Local frame at (u, v): origin on the surface, x along dS/du, z along
    // the normal. Empty when the derivatives vanish or are parallel, rather
    // than a degenerate frame.
    std::optional<Plane> frame_at(double u, double v) const;

    // plane, cylinder, bilinear, bspline or surface
    std::string type_name() const;

    // Coordinate system of a plane or cylinder
    std::optional<Plane> placement() const;

    std::optional<double> radius() const;

    // S at (umin, vmin), (umax, vmin), (umax, vmax), (umin, vmax)
    std::array<Vec3, 4> corners() const;

    const Handle(Geom_Surface)& handle() const { return geometry_; }

private:
    Handle(Geom_Surface) geometry_;
    Interval u_domain_;
    Interval v_domain_;
};

}  // namespace envelopekit

#endif // ENVELOPEKIT_GEOMETRY_SURFACE_HPP
