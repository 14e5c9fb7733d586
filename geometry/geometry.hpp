#ifndef ENVELOPEKIT_GEOMETRY_HPP
#define ENVELOPEKIT_GEOMETRY_HPP

// Geometry layer public API
// Curves, parametric surfaces, boundary representations and the kernel
// operations the generators build on.

#include <math/vec3.hpp>
#include <math/plane.hpp>
#include <math/transform.hpp>
#include "interval.hpp"
#include "bounding_box.hpp"
#include "curve.hpp"
#include "surface.hpp"
#include "brep.hpp"
#include "kernel.hpp"

#include <string>
#include <variant>

namespace envelopekit {

// Any geometry a host can hand to a generator. std::monostate is "nothing".
using Geometry = std::variant<
    std::monostate,
    SurfacePtr,
    BrepFace,
    Brep,
    Curve,
    Vec3
>;

// Short name of the held alternative, for messages
std::string geometry_type_name(const Geometry& geometry);

// Canonical parametric surface of a surface-like input:
//   SurfacePtr -> itself
//   BrepFace   -> its underlying surface
//   Brep       -> the first face's underlying surface
// Throws InputValidationError for nothing, a null surface or a brep without
// faces, and UnsupportedInputError for curves and points.
SurfacePtr coerce_surface(const Geometry& geometry);

}  // namespace envelopekit

#endif // ENVELOPEKIT_GEOMETRY_HPP
