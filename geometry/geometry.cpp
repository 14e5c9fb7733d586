#include "geometry.hpp"
#include <common/errors.hpp>
#include <type_traits>
#include <vector>

namespace envelopekit {

std::string geometry_type_name(const Geometry& geometry) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "nothing";
        } else if constexpr (std::is_same_v<T, SurfacePtr>) {
            return arg ? arg->type_name() + " surface" : "null surface";
        } else if constexpr (std::is_same_v<T, BrepFace>) {
            return "brep face";
        } else if constexpr (std::is_same_v<T, Brep>) {
            return "brep";
        } else if constexpr (std::is_same_v<T, Curve>) {
            return "curve";
        } else {
            return "point";
        }
    }, geometry);
}

SurfacePtr coerce_surface(const Geometry& geometry) {
    return std::visit([&geometry](auto&& arg) -> SurfacePtr {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            throw InputValidationError("No surface provided.");
        } else if constexpr (std::is_same_v<T, SurfacePtr>) {
            if (!arg) {
                throw InputValidationError("No surface provided.");
            }
            return arg;
        } else if constexpr (std::is_same_v<T, BrepFace>) {
            if (arg.is_null() || !arg.surface()) {
                throw InputValidationError("Brep face has no underlying surface.");
            }
            return arg.surface();
        } else if constexpr (std::is_same_v<T, Brep>) {
            std::vector<BrepFace> faces = arg.faces();
            if (faces.empty()) {
                throw InputValidationError("Brep has no faces.");
            }
            return faces.front().surface();
        } else {
            throw UnsupportedInputError("Unsupported input type: " + geometry_type_name(geometry) +
                                        ". Expected a surface, brep face or brep.");
        }
    }, geometry);
}

}  // namespace envelopekit
