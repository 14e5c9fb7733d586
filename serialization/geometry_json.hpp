#ifndef ENVELOPEKIT_SERIALIZATION_GEOMETRY_JSON_HPP
#define ENVELOPEKIT_SERIALIZATION_GEOMETRY_JSON_HPP

#include <nlohmann/json.hpp>
#include <geometry/geometry.hpp>
#include <common/errors.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace envelopekit {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    if (!j.is_array() || j.size() != 3) {
        throw InputValidationError("Point must be an array of 3 numbers: " + j.dump());
    }
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
    v.z = j[2].get<double>();
}

// Plane serialization (axes are re-orthonormalized on load)
inline void to_json(nlohmann::json& j, const Plane& plane) {
    j = {
        {"origin", plane.origin},
        {"x_axis", plane.x_axis},
        {"y_axis", plane.y_axis}
    };
}

inline void from_json(const nlohmann::json& j, Plane& plane) {
    Vec3 origin = j.value("origin", vec3::zero());
    Vec3 x_axis = j.value("x_axis", vec3::unit_x());
    Vec3 y_axis = j.value("y_axis", vec3::unit_y());
    plane = Plane(origin, x_axis, y_axis);
    if (!plane.is_valid()) {
        throw InputValidationError("Plane axes must be non-zero and not parallel: " + j.dump());
    }
}

// Interval serialization
inline void to_json(nlohmann::json& j, const Interval& interval) {
    j = nlohmann::json::array({interval.min, interval.max});
}

inline void from_json(const nlohmann::json& j, Interval& interval) {
    if (!j.is_array() || j.size() != 2) {
        throw InputValidationError("Interval must be [min, max]: " + j.dump());
    }
    interval.min = j[0].get<double>();
    interval.max = j[1].get<double>();
}

// Curves are written as explicit polylines
inline void to_json(nlohmann::json& j, const Curve& curve) {
    j = {
        {"type", "polyline"},
        {"closed", curve.is_closed()},
        {"points", curve.points()}
    };
}

// Curve from a shape description:
//   {"type": "polyline", "points": [...], "closed": bool}
//   {"type": "rectangle", "width": w, "height": h, "plane": {...}}
//   {"type": "circle", "radius": r, "segments": n, "plane": {...}}
//   {"type": "polygon", "radius": r, "sides": n, "plane": {...}}
inline Curve curve_from_json(const nlohmann::json& j) {
    std::string type = j.value("type", "");
    Plane plane = j.value("plane", Plane::world_xy());

    if (type == "polyline") {
        auto points = j.at("points").get<std::vector<Vec3>>();
        if (j.contains("closed")) {
            return Curve(std::move(points), j["closed"].get<bool>());
        }
        return Curve::polyline(points);
    }
    if (type == "rectangle") {
        return Curve::rectangle(plane, j.at("width").get<double>(), j.at("height").get<double>());
    }
    if (type == "circle") {
        return Curve::circle(plane, j.at("radius").get<double>(), j.value("segments", 64));
    }
    if (type == "polygon") {
        return Curve::regular_polygon(plane, j.at("radius").get<double>(), j.at("sides").get<int>());
    }
    throw InputValidationError("Unknown curve type: '" + type + "'");
}

inline bool is_curve_type(const std::string& type) {
    return type == "polyline" || type == "rectangle" || type == "circle" || type == "polygon";
}

// Surface serialization. Planes and cylinders keep their placement; any
// other surface is written as its domain and the points at its four
// domain corners, exact for bilinear patches.
inline nlohmann::json surface_to_json(const SurfacePtr& surface) {
    if (!surface) {
        return nullptr;
    }
    std::string type = surface->type_name();
    nlohmann::json j;
    j["type"] = type;
    if (type == "plane") {
        j["plane"] = surface->placement().value();
        j["u_domain"] = surface->domain(0);
        j["v_domain"] = surface->domain(1);
    } else if (type == "cylinder") {
        j["plane"] = surface->placement().value();
        j["radius"] = surface->radius().value();
        j["angle"] = surface->domain(0);
        j["height"] = surface->domain(1);
    } else if (type == "bilinear") {
        j["corners"] = surface->corners();
    } else {
        j["u_domain"] = surface->domain(0);
        j["v_domain"] = surface->domain(1);
        j["corners"] = surface->corners();
    }
    return j;
}

//   {"type": "plane", "plane": {...}, "u_domain": [a, b], "v_domain": [c, d]}
//   {"type": "bilinear", "corners": [a, b, c, d]}
//   {"type": "cylinder", "plane": {...}, "radius": r, "angle": [a, b], "height": [c, d]}
inline SurfacePtr surface_from_json(const nlohmann::json& j) {
    std::string type = j.value("type", "");
    if (type == "plane") {
        return Surface::plane(j.value("plane", Plane::world_xy()),
                              j.at("u_domain").get<Interval>(),
                              j.at("v_domain").get<Interval>());
    }
    if (type == "bilinear") {
        auto corners = j.at("corners").get<std::vector<Vec3>>();
        if (corners.size() != 4) {
            throw InputValidationError("Bilinear surface needs exactly 4 corners");
        }
        return Surface::bilinear(corners[0], corners[1], corners[2], corners[3]);
    }
    if (type == "cylinder") {
        return Surface::cylinder(j.value("plane", Plane::world_xy()),
                                 j.at("radius").get<double>(),
                                 j.at("angle").get<Interval>(),
                                 j.at("height").get<Interval>());
    }
    throw InputValidationError("Unknown surface type: '" + type + "'");
}

// Trim loops are written as their wire vertices
inline nlohmann::json face_to_json(const BrepFace& face) {
    nlohmann::json j;
    j["surface"] = surface_to_json(face.surface());
    j["outer_loop"] = wire_points(face.outer_wire());
    nlohmann::json holes = nlohmann::json::array();
    for (const auto& hole : face.holes()) {
        holes.push_back(wire_points(hole));
    }
    j["inner_loops"] = holes;
    j["area"] = area(face);
    return j;
}

inline nlohmann::json brep_to_json(const Brep& brep) {
    nlohmann::json faces = nlohmann::json::array();
    for (const auto& face : brep.faces()) {
        faces.push_back(face_to_json(face));
    }
    return {{"type", "brep"}, {"faces", faces}};
}

// Geometry variant serialization
inline nlohmann::json geometry_to_json(const Geometry& geometry) {
    return std::visit([](auto&& arg) -> nlohmann::json {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, SurfacePtr>) {
            return surface_to_json(arg);
        } else if constexpr (std::is_same_v<T, BrepFace>) {
            nlohmann::json j = face_to_json(arg);
            j["type"] = "face";
            return j;
        } else if constexpr (std::is_same_v<T, Brep>) {
            return brep_to_json(arg);
        } else {
            return nlohmann::json(arg);
        }
    }, geometry);
}

// Geometry from JSON: null, a point [x, y, z], a curve, a surface,
// {"type": "face", "surface": {...}} or {"type": "brep", "faces": [...]}
// where each face is a surface description.
inline Geometry geometry_from_json(const nlohmann::json& j) {
    if (j.is_null()) {
        return std::monostate{};
    }
    if (j.is_array()) {
        return j.get<Vec3>();
    }

    std::string type = j.value("type", "");
    if (type == "brep") {
        std::vector<BrepFace> faces;
        for (const auto& face : j.value("faces", nlohmann::json::array())) {
            faces.push_back(BrepFace::from_surface(surface_from_json(face)));
        }
        return Brep::from_faces(faces);
    }
    if (type == "face") {
        return BrepFace::from_surface(surface_from_json(j.at("surface")));
    }
    if (is_curve_type(type)) {
        return curve_from_json(j);
    }
    return surface_from_json(j);
}

}  // namespace envelopekit

#endif // ENVELOPEKIT_SERIALIZATION_GEOMETRY_JSON_HPP
