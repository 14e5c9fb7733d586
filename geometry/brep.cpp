#include "brep.hpp"
#include <common/errors.hpp>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepTools.hxx>
#include <BRep_Builder.hxx>
#include <Precision.hxx>
#include <TopExp_Explorer.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Compound.hxx>
#include <utility>

namespace envelopekit {

BrepFace::BrepFace(SurfacePtr surface, TopoDS_Face face)
    : surface_(std::move(surface)), face_(std::move(face)) {}

BrepFace BrepFace::from_surface(const SurfacePtr& surface) {
    if (!surface) {
        return BrepFace();
    }
    BRepBuilderAPI_MakeFace maker(surface->handle(), Precision::Confusion());
    if (!maker.IsDone()) {
        throw GeometryConstructionError(
            "Cannot build a face on the " + surface->type_name() + " surface.",
            surface->type_name());
    }
    return BrepFace(surface, maker.Face());
}

BrepFace BrepFace::from_shape(const TopoDS_Face& face) {
    return BrepFace(Surface::of_face(face), face);
}

TopoDS_Wire BrepFace::outer_wire() const {
    return face_.IsNull() ? TopoDS_Wire() : BRepTools::OuterWire(face_);
}

std::vector<TopoDS_Wire> BrepFace::holes() const {
    std::vector<TopoDS_Wire> wires;
    if (face_.IsNull()) {
        return wires;
    }
    TopoDS_Wire outer = BRepTools::OuterWire(face_);
    for (TopExp_Explorer it(face_, TopAbs_WIRE); it.More(); it.Next()) {
        const TopoDS_Wire& wire = TopoDS::Wire(it.Current());
        if (!wire.IsSame(outer)) {
            wires.push_back(wire);
        }
    }
    return wires;
}

Brep::Brep(TopoDS_Shape shape)
    : shape_(std::move(shape)) {}

Brep Brep::from_faces(const std::vector<BrepFace>& faces) {
    BRep_Builder builder;
    TopoDS_Compound compound;
    builder.MakeCompound(compound);
    for (const auto& face : faces) {
        if (!face.is_null()) {
            builder.Add(compound, face.shape());
        }
    }
    return Brep(compound);
}

std::vector<BrepFace> Brep::faces() const {
    std::vector<BrepFace> result;
    if (shape_.IsNull()) {
        return result;
    }
    for (TopExp_Explorer it(shape_, TopAbs_FACE); it.More(); it.Next()) {
        result.push_back(BrepFace::from_shape(TopoDS::Face(it.Current())));
    }
    return result;
}

size_t Brep::face_count() const {
    size_t count = 0;
    if (shape_.IsNull()) {
        return count;
    }
    for (TopExp_Explorer it(shape_, TopAbs_FACE); it.More(); it.Next()) {
        ++count;
    }
    return count;
}

Brep to_brep(const SurfacePtr& surface) {
    if (!surface) {
        return Brep();
    }
    return Brep(BrepFace::from_surface(surface).shape());
}

}  // namespace envelopekit
