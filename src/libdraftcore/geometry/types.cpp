// =====================================================================
//  src/libdraftcore/geometry/types.cpp — Basic geometry types
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/geometry/types.h>

#include <QtMath>

#include <cmath>

namespace draftcore {
namespace geometry {

// =====================================================================
//  Vec3 Implementation
// =====================================================================

Vec3 Vec3::cross(const Vec3& other) const
{
    return Vec3(y * other.z - z * other.y,
                z * other.x - x * other.z,
                x * other.y - y * other.x);
}

double Vec3::length() const
{
    return std::sqrt(x * x + y * y + z * z);
}

Vec3 Vec3::normalized(double length) const
{
    const double len = this->length();
    if (len == 0.0) {
        return Vec3();
    }
    return *this * (length / len);
}

Vec3 Vec3::orthogonal(bool counterClockwise) const
{
    if (counterClockwise) {
        return Vec3(-y, x, z);
    }
    return Vec3(y, -x, z);
}

double Vec3::angleDeg() const
{
    return qRadiansToDegrees(std::atan2(y, x));
}

bool Vec3::isClose(const Vec3& other, double tolerance) const
{
    return qAbs(x - other.x) <= tolerance
        && qAbs(y - other.y) <= tolerance
        && qAbs(z - other.z) <= tolerance;
}

}  // namespace geometry
}  // namespace draftcore
