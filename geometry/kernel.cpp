#include "kernel.hpp"
#include <common/logging.hpp>
#include <BRepAlgoAPI_Cut.hxx>
#include <BRepAlgoAPI_Splitter.hxx>
#include <BRepBndLib.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepGProp.hxx>
#include <BRepOffsetAPI_ThruSections.hxx>
#include <BRepPrimAPI_MakePrism.hxx>
#include <BRepProj_Projection.hxx>
#include <BRepTools_WireExplorer.hxx>
#include <BRep_Tool.hxx>
#include <Bnd_Box.hxx>
#include <GProp_GProps.hxx>
#include <Precision.hxx>
#include <ShapeFix_Wire.hxx>
#include <Standard_Failure.hxx>
#include <TopExp.hxx>
#include <TopTools_ListOfShape.hxx>
#include <TopoDS_Vertex.hxx>
#include <algorithm>
#include <array>
#include <cmath>

namespace envelopekit {

namespace {

void log_failure(const char* operation, const Standard_Failure& e) {
    const char* message = e.GetMessageString();
    envelopekit::logging::get_logger()->debug("{}: {} ({})", operation,
                                              message ? message : "", e.DynamicType()->Name());
}

double shape_area(const TopoDS_Shape& shape) {
    GProp_GProps props;
    BRepGProp::SurfaceProperties(shape, props);
    return std::abs(props.Mass());
}

}  // namespace

SurfacePtr create_from_corner_points(const Vec3& a, const Vec3& b,
                                     const Vec3& c, const Vec3& d,
                                     double tolerance) {
    if (!a.is_finite() || !b.is_finite() || !c.is_finite() || !d.is_finite()) {
        return nullptr;
    }

    // Twice the area of the largest corner triangle; zero only when every
    // corner lies on one line or coincides
    const std::array<Vec3, 4> corners{a, b, c, d};
    double largest = 0.0;
    for (size_t i = 0; i < corners.size(); ++i) {
        const Vec3& p = corners[i];
        const Vec3& q = corners[(i + 1) % 4];
        const Vec3& r = corners[(i + 2) % 4];
        largest = std::max(largest, (q - p).cross(r - p).length());
    }
    if (largest <= tolerance * tolerance) {
        return nullptr;
    }

    return Surface::bilinear(a, b, c, d);
}

TopoDS_Wire make_wire(const Curve& curve) {
    if (curve.point_count() < 2 || (curve.is_closed() && curve.point_count() < 3)) {
        return TopoDS_Wire();
    }

    // Consecutive coincident points are skipped
    BRepBuilderAPI_MakePolygon polygon;
    for (const auto& p : curve.points()) {
        polygon.Add(p.pnt());
    }
    if (curve.is_closed()) {
        polygon.Close();
    }
    if (!polygon.IsDone()) {
        return TopoDS_Wire();
    }
    return polygon.Wire();
}

std::vector<Vec3> wire_points(const TopoDS_Wire& wire) {
    std::vector<Vec3> points;
    if (wire.IsNull()) {
        return points;
    }
    for (BRepTools_WireExplorer it(wire); it.More(); it.Next()) {
        points.push_back(Vec3::from(BRep_Tool::Pnt(it.CurrentVertex())));
    }

    if (!BRep_Tool::IsClosed(wire)) {
        TopoDS_Vertex first, last;
        TopExp::Vertices(wire, first, last);
        if (!last.IsNull()) {
            points.push_back(Vec3::from(BRep_Tool::Pnt(last)));
        }
    }
    return points;
}

std::vector<TopoDS_Wire> project_to_brep(const Curve& curve, const Brep& brep,
                                         const Vec3& direction, double tolerance) {
    std::vector<TopoDS_Wire> projected;
    if (brep.empty() || !(direction.length() > 0.0) || !direction.is_finite()) {
        return projected;
    }

    try {
        TopoDS_Wire wire = make_wire(curve);
        if (wire.IsNull()) {
            return projected;
        }

        gp_Dir along(direction.xyz());
        for (const auto& face : brep.faces()) {
            BRepProj_Projection projection(wire, face.shape(), along);
            if (!projection.IsDone()) {
                continue;
            }

            for (projection.Init(); projection.More(); projection.Next()) {
                // Reorders the section edges, closes small gaps and adds
                // the parameter-space curves the split needs
                ShapeFix_Wire fixer(projection.Current(), face.shape(), tolerance);
                fixer.Perform();
                TopoDS_Wire fixed = fixer.Wire();
                if (fixed.IsNull()) {
                    continue;
                }
                if (curve.is_closed() && !BRep_Tool::IsClosed(fixed)) {
                    envelopekit::logging::get_logger()->trace(
                        "project_to_brep: projection leaves the face, skipping");
                    continue;
                }
                projected.push_back(fixed);
            }
        }
    } catch (const Standard_Failure& e) {
        log_failure("project_to_brep", e);
        projected.clear();
    }
    return projected;
}

Brep split_face(const BrepFace& face, const std::vector<TopoDS_Wire>& cutters, double tolerance) {
    Brep unsplit(face.shape());
    if (face.is_null() || cutters.empty()) {
        return unsplit;
    }

    try {
        TopTools_ListOfShape arguments;
        arguments.Append(face.shape());
        TopTools_ListOfShape tools;
        for (const auto& cutter : cutters) {
            tools.Append(cutter);
        }

        BRepAlgoAPI_Splitter splitter;
        splitter.SetArguments(arguments);
        splitter.SetTools(tools);
        splitter.SetFuzzyValue(tolerance);
        splitter.Build();
        if (splitter.HasErrors()) {
            envelopekit::logging::get_logger()->debug("split_face: splitter reported errors");
            return unsplit;
        }

        Brep split(splitter.Shape());
        if (split.face_count() < 2) {
            return unsplit;
        }
        return split;
    } catch (const Standard_Failure& e) {
        log_failure("split_face", e);
        return unsplit;
    }
}

std::optional<Brep> extrude(const Curve& profile, const Vec3& direction) {
    if (!profile.is_closed() || !(direction.length() > 0.0) || !direction.is_finite()) {
        return std::nullopt;
    }

    try {
        TopoDS_Wire wire = make_wire(profile);
        if (wire.IsNull()) {
            return std::nullopt;
        }
        BRepBuilderAPI_MakeFace base(wire, Standard_True);
        if (!base.IsDone()) {
            return std::nullopt;
        }
        BRepPrimAPI_MakePrism prism(base.Face(), direction.vec());
        if (!prism.IsDone()) {
            return std::nullopt;
        }
        return Brep(prism.Shape());
    } catch (const Standard_Failure& e) {
        log_failure("extrude", e);
        return std::nullopt;
    }
}

std::optional<Brep> boolean_difference(const Brep& brep, const Brep& cutter, double tolerance) {
    if (brep.empty() || cutter.shape().IsNull()) {
        return std::nullopt;
    }

    try {
        TopTools_ListOfShape arguments;
        arguments.Append(brep.shape());
        TopTools_ListOfShape tools;
        tools.Append(cutter.shape());

        BRepAlgoAPI_Cut cut;
        cut.SetArguments(arguments);
        cut.SetTools(tools);
        cut.SetFuzzyValue(tolerance);
        cut.Build();
        if (cut.HasErrors()) {
            envelopekit::logging::get_logger()->debug("boolean_difference: cut reported errors");
            return std::nullopt;
        }

        Brep result(cut.Shape());
        if (result.empty()) {
            return std::nullopt;
        }
        // The cutter missed
        if (std::abs(area(result) - area(brep)) <= tolerance * tolerance) {
            return std::nullopt;
        }
        return result;
    } catch (const Standard_Failure& e) {
        log_failure("boolean_difference", e);
        return std::nullopt;
    }
}

double area(const Curve& curve) {
    if (!curve.is_closed()) {
        return 0.0;
    }
    try {
        TopoDS_Wire wire = make_wire(curve);
        if (wire.IsNull()) {
            return 0.0;
        }
        BRepBuilderAPI_MakeFace face(wire, Standard_True);
        return face.IsDone() ? shape_area(face.Face()) : 0.0;
    } catch (const Standard_Failure& e) {
        log_failure("area", e);
        return 0.0;
    }
}

double area(const Surface& surface) {
    try {
        BRepBuilderAPI_MakeFace face(surface.handle(), Precision::Confusion());
        return face.IsDone() ? shape_area(face.Face()) : 0.0;
    } catch (const Standard_Failure& e) {
        log_failure("area", e);
        return 0.0;
    }
}

double area(const BrepFace& face) {
    return face.is_null() ? 0.0 : shape_area(face.shape());
}

double area(const Brep& brep) {
    return brep.shape().IsNull() ? 0.0 : shape_area(brep.shape());
}

std::optional<Brep> loft(const std::vector<Curve>& sections) {
    if (sections.size() < 2) {
        return std::nullopt;
    }

    size_t n = sections.front().point_count();
    bool closed = sections.front().is_closed();
    for (const auto& section : sections) {
        if (section.point_count() != n || section.is_closed() != closed) {
            return std::nullopt;
        }
    }

    try {
        BRepOffsetAPI_ThruSections thru(Standard_False, Standard_False);
        // Keep vertex i on vertex i; the wires are built alike
        thru.CheckCompatibility(Standard_False);
        for (const auto& section : sections) {
            TopoDS_Wire wire = make_wire(section);
            if (wire.IsNull()) {
                return std::nullopt;
            }
            thru.AddWire(wire);
        }

        thru.Build();
        if (!thru.IsDone()) {
            return std::nullopt;
        }

        Brep result(thru.Shape());
        if (result.empty()) {
            return std::nullopt;
        }
        return result;
    } catch (const Standard_Failure& e) {
        log_failure("loft", e);
        return std::nullopt;
    }
}

BoundingBox bounding_box(const TopoDS_Shape& shape) {
    BoundingBox box;
    if (shape.IsNull()) {
        return box;
    }

    Bnd_Box bounds;
    BRepBndLib::AddOptimal(shape, bounds, Standard_False, Standard_False);
    if (bounds.IsVoid()) {
        return box;
    }

    Standard_Real xmin, ymin, zmin, xmax, ymax, zmax;
    bounds.Get(xmin, ymin, zmin, xmax, ymax, zmax);
    box.include(Vec3(xmin, ymin, zmin));
    box.include(Vec3(xmax, ymax, zmax));
    return box;
}

}  // namespace envelopekit
