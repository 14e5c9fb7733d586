#ifndef ENVELOPEKIT_GEOMETRY_KERNEL_HPP
#define ENVELOPEKIT_GEOMETRY_KERNEL_HPP

#include "surface.hpp"
#include "curve.hpp"
#include "brep.hpp"
#include "bounding_box.hpp"
#include <TopoDS_Shape.hxx>
#include <TopoDS_Wire.hxx>
#include <optional>
#include <vector>

namespace envelopekit {

// Distance below which points coincide
constexpr double kModelTolerance = 1e-6;

// Bilinear patch through four corners (a, b, c, d counter-clockwise).
// Null when a corner is not finite or all four corners lie on one line.
SurfacePtr create_from_corner_points(const Vec3& a, const Vec3& b,
                                     const Vec3& c, const Vec3& d,
                                     double tolerance = kModelTolerance);

// Polygonal wire through the curve's points, closed when the curve is.
// Null for fewer than two distinct points or a closed curve under three.
TopoDS_Wire make_wire(const Curve& curve);

// Wire vertices in traversal order
std::vector<Vec3> wire_points(const TopoDS_Wire& wire);

// Projects the curve along `direction` (both senses) onto every face of the
// brep. Gaps up to `tolerance` are closed on the receiving face. A closed
// curve only yields closed wires, so a curve running off a face yields
// nothing for that face.
std::vector<TopoDS_Wire> project_to_brep(const Curve& curve, const Brep& brep,
                                         const Vec3& direction, double tolerance);

// Splits a face with the given wires lying on it. Yields every resulting
// face, or the face alone when the cutters do not split it.
Brep split_face(const BrepFace& face, const std::vector<TopoDS_Wire>& cutters, double tolerance);

// Solid swept by the planar face the closed profile bounds.
// Empty for open or non-planar profiles and a zero direction.
std::optional<Brep> extrude(const Curve& profile, const Vec3& direction);

// brep minus cutter. Empty when the operation fails or removes nothing.
std::optional<Brep> boolean_difference(const Brep& brep, const Brep& cutter, double tolerance);

// Area enclosed by a closed planar curve; zero for open or non-planar curves
double area(const Curve& curve);

// Surface area over the full domain
double area(const Surface& surface);

double area(const BrepFace& face);
double area(const Brep& brep);

// Standard (non-ruled) loft through the sections in order, as an open
// shell with one face per section segment. Sections must share point
// count and closedness; vertex i of each section connects to vertex i of
// the next. Empty on mismatched sections or when the loft fails.
std::optional<Brep> loft(const std::vector<Curve>& sections);

BoundingBox bounding_box(const TopoDS_Shape& shape);

}  // namespace envelopekit

#endif // ENVELOPEKIT_GEOMETRY_KERNEL_HPP
