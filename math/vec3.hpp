#ifndef ENVELOPEKIT_MATH_VEC3_HPP
#define ENVELOPEKIT_MATH_VEC3_HPP

#include <gp_Pnt.hxx>
#include <gp_Vec.hxx>
#include <gp_XYZ.hxx>
#include <cmath>

namespace envelopekit {

// Model-space point or displacement. Converts to OpenCASCADE's gp types at
// the kernel boundary; everything above the kernel works in Vec3.
struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    static Vec3 from(const gp_XYZ& xyz) { return {xyz.X(), xyz.Y(), xyz.Z()}; }
    static Vec3 from(const gp_Pnt& p) { return from(p.XYZ()); }
    static Vec3 from(const gp_Vec& v) { return from(v.XYZ()); }

    gp_XYZ xyz() const { return gp_XYZ(x, y, z); }
    gp_Pnt pnt() const { return gp_Pnt(x, y, z); }
    gp_Vec vec() const { return gp_Vec(x, y, z); }

    constexpr Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    constexpr Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    constexpr Vec3 operator-() const { return {-x, -y, -z}; }
    constexpr Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }
    constexpr Vec3 operator/(double s) const { return {x / s, y / s, z / s}; }

    constexpr Vec3& operator+=(const Vec3& o) {
        x += o.x;
        y += o.y;
        z += o.z;
        return *this;
    }

    constexpr double dot(const Vec3& o) const { return x * o.x + y * o.y + z * o.z; }

    constexpr Vec3 cross(const Vec3& o) const {
        return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }

    double length() const { return std::sqrt(dot(*this)); }

    // Zero stays zero
    Vec3 normalized() const {
        double len = length();
        return len > 0.0 ? *this / len : Vec3{};
    }

    double distance_to(const Vec3& o) const { return (*this - o).length(); }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    // Exact, componentwise
    constexpr bool operator==(const Vec3& o) const = default;
};

namespace vec3 {
    constexpr Vec3 zero() { return {0.0, 0.0, 0.0}; }
    constexpr Vec3 unit_x() { return {1.0, 0.0, 0.0}; }
    constexpr Vec3 unit_y() { return {0.0, 1.0, 0.0}; }
    constexpr Vec3 unit_z() { return {0.0, 0.0, 1.0}; }
}

}  // namespace envelopekit

#endif // ENVELOPEKIT_MATH_VEC3_HPP
