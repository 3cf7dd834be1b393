// =====================================================================
//  src/libdraftcore/draftcore/geometry/quadrilateral.h — Quad vertices
// =====================================================================
//
//  SOLID, TRACE and 3DFACE entities always store four vertices.  A
//  triangle is stored as a quadrilateral whose last vertex repeats the
//  third one.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_GEOMETRY_QUADRILATERAL_H
#define DRAFTCORE_GEOMETRY_QUADRILATERAL_H

#include "../core.h"
#include "../errors.h"
#include "types.h"

#include <array>

namespace draftcore {
namespace geometry {

using Quadrilateral = std::array<Vec3, 4>;

/// Expand 3 or 4 points into exactly four ordered vertices.
/// [A,B,C] becomes [A,B,C,C]; [A,B,C,D] is returned unchanged.
/// Any other count fails with a ValueError on "points".
DRAFTCORE_EXPORT Result<Quadrilateral> normalizeQuadrilateral(const QVector<Vec3>& points);

}  // namespace geometry
}  // namespace draftcore

#endif  // DRAFTCORE_GEOMETRY_QUADRILATERAL_H
