// =====================================================================
//  src/libdraftcore/draftcore/geometry/types.h — Basic geometry types
// =====================================================================
//
//  Lightweight value types used by the entity factory before any
//  coordinate-system transform is applied.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_GEOMETRY_TYPES_H
#define DRAFTCORE_GEOMETRY_TYPES_H

#include "../core.h"

#include <QVector>

#include <gp_Pnt.hxx>

namespace draftcore {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Default tolerance for geometric comparisons (in drawing units)
constexpr double DEFAULT_TOLERANCE = 1e-9;

// =====================================================================
//  3D Vector
// =====================================================================

/// Immutable 3D point/vector with standard arithmetic
struct DRAFTCORE_EXPORT Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vec3() = default;
    Vec3(double x_, double y_, double z_ = 0.0) : x(x_), y(y_), z(z_) {}

    Vec3 operator+(const Vec3& other) const { return Vec3(x + other.x, y + other.y, z + other.z); }
    Vec3 operator-(const Vec3& other) const { return Vec3(x - other.x, y - other.y, z - other.z); }
    Vec3 operator-() const { return Vec3(-x, -y, -z); }
    Vec3 operator*(double factor) const { return Vec3(x * factor, y * factor, z * factor); }
    Vec3 operator/(double divisor) const { return Vec3(x / divisor, y / divisor, z / divisor); }

    /// Exact component-wise equality
    bool operator==(const Vec3& other) const { return x == other.x && y == other.y && z == other.z; }
    bool operator!=(const Vec3& other) const { return !(*this == other); }

    double dot(const Vec3& other) const { return x * other.x + y * other.y + z * other.z; }
    Vec3 cross(const Vec3& other) const;

    double length() const;
    double distanceTo(const Vec3& other) const { return (other - *this).length(); }

    /// Vector in the same direction with the given length.
    /// A zero vector stays zero.
    Vec3 normalized(double length = 1.0) const;

    /// Vector rotated by 90 degrees in the xy-plane, counter-clockwise
    /// by default.  The z component is kept.
    Vec3 orthogonal(bool counterClockwise = true) const;

    /// Angle of the xy-projection from the x-axis, in degrees (-180, 180]
    double angleDeg() const;

    /// Component-wise comparison within tolerance
    bool isClose(const Vec3& other, double tolerance = DEFAULT_TOLERANCE) const;

    /// Convert to an OCCT point
    gp_Pnt toPnt() const { return gp_Pnt(x, y, z); }

    /// Convert from an OCCT point
    static Vec3 fromPnt(const gp_Pnt& p) { return Vec3(p.X(), p.Y(), p.Z()); }
};

/// Scale a vector from the left
inline Vec3 operator*(double factor, const Vec3& v) { return v * factor; }

}  // namespace geometry
}  // namespace draftcore

#endif  // DRAFTCORE_GEOMETRY_TYPES_H
