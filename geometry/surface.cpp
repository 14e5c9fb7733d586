#include "surface.hpp"
#include <common/errors.hpp>
#include <spdlog/fmt/fmt.h>
#include <BRepTools.hxx>
#include <BRep_Tool.hxx>
#include <GeomLProp_SLProps.hxx>
#include <Geom_BSplineSurface.hxx>
#include <Geom_BezierSurface.hxx>
#include <Geom_CylindricalSurface.hxx>
#include <Geom_ElementarySurface.hxx>
#include <Geom_Plane.hxx>
#include <Geom_RectangularTrimmedSurface.hxx>
#include <Precision.hxx>
#include <TColgp_Array2OfPnt.hxx>
#include <numbers>
#include <utility>

namespace envelopekit {

namespace {

void require_increasing(const Interval& range, const char* what) {
    if (!(range.length() > 0.0)) {
        throw InputValidationError(fmt::format("{} must be increasing, got [{}, {}].",
                                               what, range.min, range.max));
    }
}

// Strips the rectangular trim so the analytic type shows through
Handle(Geom_Surface) basis_of(const Handle(Geom_Surface)& surface) {
    Handle(Geom_RectangularTrimmedSurface) trimmed =
        Handle(Geom_RectangularTrimmedSurface)::DownCast(surface);
    return trimmed.IsNull() ? surface : trimmed->BasisSurface();
}

SurfacePtr trimmed(const Handle(Geom_Surface)& basis, const Interval& u, const Interval& v) {
    Handle(Geom_Surface) bounded = new Geom_RectangularTrimmedSurface(basis, u.min, u.max, v.min, v.max);
    return std::make_shared<const Surface>(bounded);
}

}  // namespace

Surface::Surface(Handle(Geom_Surface) geometry)
    : geometry_(std::move(geometry)) {
    if (geometry_.IsNull()) {
        throw GeometryConstructionError("Surface has no geometry.", "surface");
    }

    Standard_Real u1, u2, v1, v2;
    geometry_->Bounds(u1, u2, v1, v2);
    if (Precision::IsInfinite(u1) || Precision::IsInfinite(u2) ||
        Precision::IsInfinite(v1) || Precision::IsInfinite(v2)) {
        throw GeometryConstructionError("Surface must be bounded.", "surface");
    }
    u_domain_ = Interval{u1, u2};
    v_domain_ = Interval{v1, v2};
}

SurfacePtr Surface::plane(const Plane& plane, const Interval& u_domain, const Interval& v_domain) {
    require_increasing(u_domain, "Plane U domain");
    require_increasing(v_domain, "Plane V domain");
    return trimmed(new Geom_Plane(plane.ax3()), u_domain, v_domain);
}

SurfacePtr Surface::cylinder(const Plane& base, double radius,
                             const Interval& angle, const Interval& height) {
    if (!(radius > 0.0)) {
        throw InputValidationError("Cylinder radius must be > 0.");
    }
    require_increasing(angle, "Cylinder angle");
    require_increasing(height, "Cylinder height");
    if (angle.length() > 2.0 * std::numbers::pi + Precision::Angular()) {
        throw InputValidationError("Cylinder angle must not exceed a full turn.");
    }
    return trimmed(new Geom_CylindricalSurface(base.ax3(), radius), angle, height);
}

SurfacePtr Surface::bilinear(const Vec3& a, const Vec3& b, const Vec3& c, const Vec3& d) {
    // Pole(u, v)
    TColgp_Array2OfPnt poles(1, 2, 1, 2);
    poles.SetValue(1, 1, a.pnt());
    poles.SetValue(2, 1, b.pnt());
    poles.SetValue(2, 2, c.pnt());
    poles.SetValue(1, 2, d.pnt());
    Handle(Geom_Surface) patch = new Geom_BezierSurface(poles);
    return std::make_shared<const Surface>(patch);
}

SurfacePtr Surface::of_face(const TopoDS_Face& face) {
    Handle(Geom_Surface) basis = BRep_Tool::Surface(face);
    if (basis.IsNull()) {
        throw GeometryConstructionError("Face has no underlying surface.", "face");
    }
    Standard_Real u1, u2, v1, v2;
    BRepTools::UVBounds(face, u1, u2, v1, v2);
    return trimmed(basis, Interval{u1, u2}, Interval{v1, v2});
}

Vec3 Surface::point_at(double u, double v) const {
    return Vec3::from(geometry_->Value(u, v));
}

Vec3 Surface::normal_at(double u, double v) const {
    GeomLProp_SLProps props(geometry_, u, v, 1, Precision::Confusion());
    if (!props.IsNormalDefined()) {
        return vec3::zero();
    }
    return Vec3::from(props.Normal().XYZ());
}

std::optional<Plane> Surface::frame_at(double u, double v) const {
    GeomLProp_SLProps props(geometry_, u, v, 1, Precision::Confusion());
    if (!props.IsNormalDefined()) {
        return std::nullopt;
    }

    Vec3 origin = Vec3::from(props.Value());
    Vec3 du = Vec3::from(props.D1U());
    Vec3 dv = Vec3::from(props.D1V());
    if (!origin.is_finite() || !du.is_finite() || !dv.is_finite()) {
        return std::nullopt;
    }
    return Plane(origin, du, dv);
}

std::string Surface::type_name() const {
    Handle(Geom_Surface) basis = basis_of(geometry_);
    if (basis->IsKind(STANDARD_TYPE(Geom_Plane))) {
        return "plane";
    }
    if (basis->IsKind(STANDARD_TYPE(Geom_CylindricalSurface))) {
        return "cylinder";
    }
    Handle(Geom_BezierSurface) bezier = Handle(Geom_BezierSurface)::DownCast(basis);
    if (!bezier.IsNull() && bezier->UDegree() == 1 && bezier->VDegree() == 1) {
        return "bilinear";
    }
    if (basis->IsKind(STANDARD_TYPE(Geom_BSplineSurface))) {
        return "bspline";
    }
    return "surface";
}

std::optional<Plane> Surface::placement() const {
    Handle(Geom_ElementarySurface) elementary =
        Handle(Geom_ElementarySurface)::DownCast(basis_of(geometry_));
    if (elementary.IsNull()) {
        return std::nullopt;
    }
    return Plane::from(elementary->Position());
}

std::optional<double> Surface::radius() const {
    Handle(Geom_CylindricalSurface) cylinder =
        Handle(Geom_CylindricalSurface)::DownCast(basis_of(geometry_));
    if (cylinder.IsNull()) {
        return std::nullopt;
    }
    return cylinder->Radius();
}

std::array<Vec3, 4> Surface::corners() const {
    return {
        point_at(u_domain_.min, v_domain_.min),
        point_at(u_domain_.max, v_domain_.min),
        point_at(u_domain_.max, v_domain_.max),
        point_at(u_domain_.min, v_domain_.max)
    };
}

}  // namespace envelopekit
