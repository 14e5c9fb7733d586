#ifndef ENVELOPEKIT_GEOMETRY_BREP_HPP
#define ENVELOPEKIT_GEOMETRY_BREP_HPP

#include "surface.hpp"
#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>
#include <TopoDS_Wire.hxx>
#include <cstddef>
#include <vector>

namespace envelopekit {

// A trimmed region of an underlying surface
class BrepFace {
public:
    BrepFace() = default;
    BrepFace(SurfacePtr surface, TopoDS_Face face);

    // Untrimmed face over the whole surface domain.
    // Throws GeometryConstructionError when no face can be built on it.
    static BrepFace from_surface(const SurfacePtr& surface);

    static BrepFace from_shape(const TopoDS_Face& face);

    const SurfacePtr& surface() const { return surface_; }
    const TopoDS_Face& shape() const { return face_; }
    bool is_null() const { return face_.IsNull(); }

    TopoDS_Wire outer_wire() const;

    // Every wire but the outer one
    std::vector<TopoDS_Wire> holes() const;
    size_t hole_count() const { return holes().size(); }

private:
    SurfacePtr surface_;
    TopoDS_Face face_;
};

// Boundary representation: a face, shell, solid or compound of those
class Brep {
public:
    Brep() = default;
    explicit Brep(TopoDS_Shape shape);

    // Compound of the given faces, in order
    static Brep from_faces(const std::vector<BrepFace>& faces);

    const TopoDS_Shape& shape() const { return shape_; }

    // Faces in topological order
    std::vector<BrepFace> faces() const;
    size_t face_count() const;
    bool empty() const { return face_count() == 0; }

private:
    TopoDS_Shape shape_;
};

// Single untrimmed face over the whole surface; empty for a null surface
Brep to_brep(const SurfacePtr& surface);

}  // namespace envelopekit

#endif // ENVELOPEKIT_GEOMETRY_BREP_HPP
