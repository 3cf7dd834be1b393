// =====================================================================
//  src/libdraftcore/draftcore/dxf/types.h — DXF versions and entity kinds
// =====================================================================
//
//  Format versions are ordered by release, so the usual relational
//  operators on DxfVersion compare releases.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_DXF_TYPES_H
#define DRAFTCORE_DXF_TYPES_H

#include "../core.h"

#include <QString>

#include <optional>

namespace draftcore {
namespace dxf {

// =====================================================================
//  Format Versions
// =====================================================================

/// DXF release, oldest first
enum class DxfVersion {
    R12,     ///< AC1009
    R2000,   ///< AC1015
    R2004,   ///< AC1018
    R2007,   ///< AC1021
    R2010,   ///< AC1024
    R2013,   ///< AC1027
    R2018    ///< AC1032
};

/// Release name, e.g. "R2000"
DRAFTCORE_EXPORT QString versionName(DxfVersion version);

/// $ACADVER header string, e.g. "AC1015"
DRAFTCORE_EXPORT QString acadVersion(DxfVersion version);

/// Parse a release name ("R2000") or $ACADVER string ("AC1015")
/// @return Version, or nullopt if the name is not recognized
DRAFTCORE_EXPORT std::optional<DxfVersion> versionFromString(const QString& name);

// =====================================================================
//  Entity Kinds
// =====================================================================

/// Handle allocated by the entity database (hex string)
using EntityHandle = QString;

/// Graphical entity kinds the factory can issue
enum class EntityType {
    Point,
    Line,
    Circle,
    Arc,
    Ellipse,
    Solid,
    Trace,
    Face3d,
    Text,
    Insert,
    Attrib,
    Polyline,
    Shape,
    LWPolyline,
    MText,
    Ray,
    XLine,
    Spline,
    Body,
    Region,
    Solid3d,
    Surface,
    ExtrudedSurface,
    LoftedSurface,
    RevolvedSurface,
    SweptSurface,
    Hatch,
    Mesh,
    Image,
    PdfUnderlay,
    DwfUnderlay,
    DgnUnderlay,
    Dimension
};

/// DXF type string of an entity kind, e.g. "3DFACE"
DRAFTCORE_EXPORT QString dxfTypeName(EntityType type);

}  // namespace dxf
}  // namespace draftcore

#endif  // DRAFTCORE_DXF_TYPES_H
