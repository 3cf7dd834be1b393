// =====================================================================
//  src/libdraftcore/draftcore/config.h — Factory configuration
// =====================================================================
//
//  Settings of an entity factory: the active DXF version and the
//  defaults used when a request leaves them open.  Stored as a small
//  JSON file:
//
//    {
//      "dxf_version": "R2000",
//      "dimstyle": "EZDXF",
//      "spline": { "degree": 3, "method": "distance", "power": 0.5 },
//      "hatch_color": 7
//    }
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_CONFIG_H
#define DRAFTCORE_CONFIG_H

#include "core.h"
#include "dxf/types.h"
#include "geometry/bspline.h"

#include <QJsonObject>
#include <QString>

namespace draftcore {

struct DRAFTCORE_EXPORT FactoryConfig {
    dxf::DxfVersion dxfVersion = dxf::DxfVersion::R2000;
    QString dimstyle = QStringLiteral("EZDXF");
    geometry::FitOptions fit;
    int hatchColor = 7;

    QJsonObject toJson() const;

    /// Read settings from JSON.  Missing keys keep their current
    /// values; unknown version or method names fail.
    bool fromJson(const QJsonObject& json, QString* errorMsg = nullptr);

    /// Load from a JSON file.  Returns true on success.
    bool load(const QString& path, QString* errorMsg = nullptr);

    /// Save to a JSON file.  Returns true on success.
    bool save(const QString& path, QString* errorMsg = nullptr) const;
};

}  // namespace draftcore

#endif  // DRAFTCORE_CONFIG_H
