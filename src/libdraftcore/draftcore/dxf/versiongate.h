// =====================================================================
//  src/libdraftcore/draftcore/dxf/versiongate.h — Minimum DXF versions
// =====================================================================
//
//  One lookup table maps every entity kind to the oldest DXF version
//  that can store it.  The factory consults it once per request,
//  before any attribute is computed.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_DXF_VERSIONGATE_H
#define DRAFTCORE_DXF_VERSIONGATE_H

#include "../core.h"
#include "../errors.h"
#include "types.h"

namespace draftcore {
namespace dxf {

/// Oldest DXF version supporting the entity kind
DRAFTCORE_EXPORT DxfVersion minimumVersion(EntityType type);

/// True if the entity kind can be stored in the given version
DRAFTCORE_EXPORT bool isSupported(EntityType type, DxfVersion active);

/// Check an entity kind against the active version.
/// Returns an Error with code None when the kind is allowed.
DRAFTCORE_EXPORT Error requireVersion(EntityType type, DxfVersion active);

}  // namespace dxf
}  // namespace draftcore

#endif  // DRAFTCORE_DXF_VERSIONGATE_H
