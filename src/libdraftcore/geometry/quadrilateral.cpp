// =====================================================================
//  src/libdraftcore/geometry/quadrilateral.cpp — Quad vertices
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/geometry/quadrilateral.h>

namespace draftcore {
namespace geometry {

Result<Quadrilateral> normalizeQuadrilateral(const QVector<Vec3>& points)
{
    if (points.size() != 3 && points.size() != 4) {
        return Result<Quadrilateral>::fail(
            Error::value(QStringLiteral("points"), QStringLiteral("expected 3 or 4 points")));
    }

    Quadrilateral quad;
    for (int i = 0; i < 3; ++i) {
        quad[i] = points[i];
    }
    quad[3] = points.size() == 4 ? points[3] : points[2];
    return Result<Quadrilateral>::ok(quad);
}

}  // namespace geometry
}  // namespace draftcore
