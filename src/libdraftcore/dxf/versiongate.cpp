// =====================================================================
//  src/libdraftcore/dxf/versiongate.cpp — Minimum DXF versions
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/dxf/versiongate.h>

#include <QMap>

namespace draftcore {
namespace dxf {

namespace {

// Kinds missing from the table are R12 entities.
const QMap<EntityType, DxfVersion>& minimumVersions()
{
    static const QMap<EntityType, DxfVersion> table = {
        { EntityType::Ellipse,         DxfVersion::R2000 },
        { EntityType::LWPolyline,      DxfVersion::R2000 },
        { EntityType::MText,           DxfVersion::R2000 },
        { EntityType::Ray,             DxfVersion::R2000 },
        { EntityType::XLine,           DxfVersion::R2000 },
        { EntityType::Spline,          DxfVersion::R2000 },
        { EntityType::Body,            DxfVersion::R2000 },
        { EntityType::Region,          DxfVersion::R2000 },
        { EntityType::Solid3d,         DxfVersion::R2000 },
        { EntityType::Hatch,           DxfVersion::R2000 },
        { EntityType::Mesh,            DxfVersion::R2000 },
        { EntityType::Image,           DxfVersion::R2000 },
        { EntityType::PdfUnderlay,     DxfVersion::R2000 },
        { EntityType::DwfUnderlay,     DxfVersion::R2000 },
        { EntityType::DgnUnderlay,     DxfVersion::R2000 },
        { EntityType::Surface,         DxfVersion::R2007 },
        { EntityType::ExtrudedSurface, DxfVersion::R2007 },
        { EntityType::LoftedSurface,   DxfVersion::R2007 },
        { EntityType::RevolvedSurface, DxfVersion::R2007 },
        { EntityType::SweptSurface,    DxfVersion::R2007 },
    };
    return table;
}

}  // namespace

DxfVersion minimumVersion(EntityType type)
{
    return minimumVersions().value(type, DxfVersion::R12);
}

bool isSupported(EntityType type, DxfVersion active)
{
    return active >= minimumVersion(type);
}

Error requireVersion(EntityType type, DxfVersion active)
{
    const DxfVersion required = minimumVersion(type);
    if (active < required) {
        return Error::version(dxfTypeName(type), required, active);
    }
    return Error();
}

}  // namespace dxf
}  // namespace draftcore
