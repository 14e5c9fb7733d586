#include "transform.hpp"
#include <cmath>

namespace envelopekit {

namespace {

using Mat3 = std::array<std::array<double, 3>, 3>;

// Columns are the plane's axes
Mat3 basis(const Plane& plane) {
    return {{
        {plane.x_axis.x, plane.y_axis.x, plane.z_axis.x},
        {plane.x_axis.y, plane.y_axis.y, plane.z_axis.y},
        {plane.x_axis.z, plane.y_axis.z, plane.z_axis.z}
    }};
}

Mat3 transpose(const Mat3& a) {
    Mat3 r{};
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            r[i][j] = a[j][i];
        }
    }
    return r;
}

Mat3 multiply(const Mat3& a, const Mat3& b) {
    Mat3 r{};
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            double sum = 0.0;
            for (size_t k = 0; k < 3; ++k) {
                sum += a[i][k] * b[k][j];
            }
            r[i][j] = sum;
        }
    }
    return r;
}

Vec3 multiply(const Mat3& a, const Vec3& v) {
    return {
        a[0][0] * v.x + a[0][1] * v.y + a[0][2] * v.z,
        a[1][0] * v.x + a[1][1] * v.y + a[1][2] * v.z,
        a[2][0] * v.x + a[2][1] * v.y + a[2][2] * v.z
    };
}

}  // namespace

Transform::Transform() {
    for (size_t i = 0; i < 4; ++i) {
        for (size_t j = 0; j < 4; ++j) {
            m_[i][j] = (i == j) ? 1.0 : 0.0;
        }
    }
}

Transform Transform::from_linear(const Mat3& l, const Vec3& t) {
    Transform xf;
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            xf.m_[i][j] = l[i][j];
        }
        xf.m_[i][3] = t[i];
    }
    return xf;
}

Transform Transform::translation(const Vec3& offset) {
    Transform xf;
    xf.m_[0][3] = offset.x;
    xf.m_[1][3] = offset.y;
    xf.m_[2][3] = offset.z;
    return xf;
}

Transform Transform::rotation(double angle_radians, const Vec3& axis, const Vec3& center) {
    Vec3 k = axis.normalized();
    double c = std::cos(angle_radians);
    double s = std::sin(angle_radians);
    double t = 1.0 - c;

    // Rodrigues: c*I + s*[k]x + (1-c)*k*k^T
    Mat3 r = {{
        {c + t * k.x * k.x,       t * k.x * k.y - s * k.z, t * k.x * k.z + s * k.y},
        {t * k.x * k.y + s * k.z, c + t * k.y * k.y,       t * k.y * k.z - s * k.x},
        {t * k.x * k.z - s * k.y, t * k.y * k.z + s * k.x, c + t * k.z * k.z}
    }};

    return from_linear(r, center - multiply(r, center));
}

Transform Transform::scale(const Plane& plane, double sx, double sy, double sz) {
    Mat3 b = basis(plane);
    Mat3 d = {{{sx, 0.0, 0.0}, {0.0, sy, 0.0}, {0.0, 0.0, sz}}};
    Mat3 l = multiply(multiply(b, d), transpose(b));
    return from_linear(l, plane.origin - multiply(l, plane.origin));
}

Transform Transform::plane_to_plane(const Plane& from, const Plane& to) {
    Mat3 l = multiply(basis(to), transpose(basis(from)));
    return from_linear(l, to.origin - multiply(l, from.origin));
}

Transform Transform::operator*(const Transform& rhs) const {
    Transform r;
    for (size_t i = 0; i < 4; ++i) {
        for (size_t j = 0; j < 4; ++j) {
            double sum = 0.0;
            for (size_t k = 0; k < 4; ++k) {
                sum += m_[i][k] * rhs.m_[k][j];
            }
            r.m_[i][j] = sum;
        }
    }
    return r;
}

Vec3 Transform::apply(const Vec3& p) const {
    return {
        m_[0][0] * p.x + m_[0][1] * p.y + m_[0][2] * p.z + m_[0][3],
        m_[1][0] * p.x + m_[1][1] * p.y + m_[1][2] * p.z + m_[1][3],
        m_[2][0] * p.x + m_[2][1] * p.y + m_[2][2] * p.z + m_[2][3]
    };
}

Vec3 Transform::apply_vector(const Vec3& v) const {
    return {
        m_[0][0] * v.x + m_[0][1] * v.y + m_[0][2] * v.z,
        m_[1][0] * v.x + m_[1][1] * v.y + m_[1][2] * v.z,
        m_[2][0] * v.x + m_[2][1] * v.y + m_[2][2] * v.z
    };
}

bool Transform::is_identity() const {
    for (size_t i = 0; i < 4; ++i) {
        for (size_t j = 0; j < 4; ++j) {
            if (m_[i][j] != ((i == j) ? 1.0 : 0.0)) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace envelopekit
