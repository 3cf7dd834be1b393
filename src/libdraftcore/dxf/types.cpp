// =====================================================================
//  src/libdraftcore/dxf/types.cpp — DXF versions and entity kinds
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/dxf/types.h>

namespace draftcore {
namespace dxf {

namespace {

struct VersionNames {
    DxfVersion version;
    const char* release;
    const char* acad;
};

const VersionNames VERSION_NAMES[] = {
    { DxfVersion::R12,   "R12",   "AC1009" },
    { DxfVersion::R2000, "R2000", "AC1015" },
    { DxfVersion::R2004, "R2004", "AC1018" },
    { DxfVersion::R2007, "R2007", "AC1021" },
    { DxfVersion::R2010, "R2010", "AC1024" },
    { DxfVersion::R2013, "R2013", "AC1027" },
    { DxfVersion::R2018, "R2018", "AC1032" },
};

}  // namespace

QString versionName(DxfVersion version)
{
    for (const VersionNames& names : VERSION_NAMES) {
        if (names.version == version) {
            return QString::fromLatin1(names.release);
        }
    }
    return QString();
}

QString acadVersion(DxfVersion version)
{
    for (const VersionNames& names : VERSION_NAMES) {
        if (names.version == version) {
            return QString::fromLatin1(names.acad);
        }
    }
    return QString();
}

std::optional<DxfVersion> versionFromString(const QString& name)
{
    const QString key = name.trimmed().toUpper();
    for (const VersionNames& names : VERSION_NAMES) {
        if (key == QLatin1String(names.release) || key == QLatin1String(names.acad)) {
            return names.version;
        }
    }
    return std::nullopt;
}

QString dxfTypeName(EntityType type)
{
    switch (type) {
    case EntityType::Point:           return QStringLiteral("POINT");
    case EntityType::Line:            return QStringLiteral("LINE");
    case EntityType::Circle:          return QStringLiteral("CIRCLE");
    case EntityType::Arc:             return QStringLiteral("ARC");
    case EntityType::Ellipse:         return QStringLiteral("ELLIPSE");
    case EntityType::Solid:           return QStringLiteral("SOLID");
    case EntityType::Trace:           return QStringLiteral("TRACE");
    case EntityType::Face3d:          return QStringLiteral("3DFACE");
    case EntityType::Text:            return QStringLiteral("TEXT");
    case EntityType::Insert:          return QStringLiteral("INSERT");
    case EntityType::Attrib:          return QStringLiteral("ATTRIB");
    case EntityType::Polyline:        return QStringLiteral("POLYLINE");
    case EntityType::Shape:           return QStringLiteral("SHAPE");
    case EntityType::LWPolyline:      return QStringLiteral("LWPOLYLINE");
    case EntityType::MText:           return QStringLiteral("MTEXT");
    case EntityType::Ray:             return QStringLiteral("RAY");
    case EntityType::XLine:           return QStringLiteral("XLINE");
    case EntityType::Spline:          return QStringLiteral("SPLINE");
    case EntityType::Body:            return QStringLiteral("BODY");
    case EntityType::Region:          return QStringLiteral("REGION");
    case EntityType::Solid3d:         return QStringLiteral("3DSOLID");
    case EntityType::Surface:         return QStringLiteral("SURFACE");
    case EntityType::ExtrudedSurface: return QStringLiteral("EXTRUDEDSURFACE");
    case EntityType::LoftedSurface:   return QStringLiteral("LOFTEDSURFACE");
    case EntityType::RevolvedSurface: return QStringLiteral("REVOLVEDSURFACE");
    case EntityType::SweptSurface:    return QStringLiteral("SWEPTSURFACE");
    case EntityType::Hatch:           return QStringLiteral("HATCH");
    case EntityType::Mesh:            return QStringLiteral("MESH");
    case EntityType::Image:           return QStringLiteral("IMAGE");
    case EntityType::PdfUnderlay:     return QStringLiteral("PDFUNDERLAY");
    case EntityType::DwfUnderlay:     return QStringLiteral("DWFUNDERLAY");
    case EntityType::DgnUnderlay:     return QStringLiteral("DGNUNDERLAY");
    case EntityType::Dimension:       return QStringLiteral("DIMENSION");
    }
    return QString();
}

}  // namespace dxf
}  // namespace draftcore
