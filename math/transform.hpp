#ifndef ENVELOPEKIT_MATH_TRANSFORM_HPP
#define ENVELOPEKIT_MATH_TRANSFORM_HPP

#include <math/vec3.hpp>
#include <math/plane.hpp>
#include <array>

namespace envelopekit {

// 4x4 affine transform acting on column vectors.
// Composition follows matrix order: (a * b).apply(p) == a.apply(b.apply(p)),
// so the right-hand operand is applied first.
class Transform {
public:
    // Identity
    Transform();

    static Transform identity() { return Transform(); }

    static Transform translation(const Vec3& offset);

    // Right-handed rotation about `axis` through `center`
    static Transform rotation(double angle_radians, const Vec3& axis, const Vec3& center);

    // Non-uniform scale along the plane's axes, fixed at the plane origin
    static Transform scale(const Plane& plane, double sx, double sy, double sz);

    // Maps plane coordinates in `from` onto the same coordinates in `to`
    static Transform plane_to_plane(const Plane& from, const Plane& to);

    Transform operator*(const Transform& rhs) const;

    Vec3 apply(const Vec3& point) const;
    Vec3 apply_vector(const Vec3& vector) const;

    bool is_identity() const;

    double operator()(size_t row, size_t col) const { return m_[row][col]; }

private:
    using Matrix = std::array<std::array<double, 4>, 4>;

    // Linear part `l` (3x3) plus translation `t`
    static Transform from_linear(const std::array<std::array<double, 3>, 3>& l, const Vec3& t);

    Matrix m_;
};

}  // namespace envelopekit

#endif // ENVELOPEKIT_MATH_TRANSFORM_HPP
