// =====================================================================
//  src/libdraftcore/draftcore/dxf/autoblock.h — Auto-filled block refs
// =====================================================================
//
//  An auto block reference wraps a reference to a named block into a
//  new anonymous block, with one ATTRIB per ATTDEF of the named block
//  filled from a tag -> value map.  The result is inserted through a
//  reference to the anonymous block.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_DXF_AUTOBLOCK_H
#define DRAFTCORE_DXF_AUTOBLOCK_H

#include "../core.h"
#include "attributes.h"

#include <QMap>
#include <QString>
#include <QVector>

namespace draftcore {
namespace dxf {

/// What the composer needs to know about the referenced block
struct BlockDefinition {
    QString name;
    Vec3 basePoint;
    QVector<AttributeSet> attributeDefinitions;   ///< ATTDEF attribute sets
};

/// One INSERT with the ATTRIBs that follow it
struct BlockReferenceRequest {
    QString blockName;
    AttributeSet insertAttributes;      ///< INSERT entity attributes
    QVector<AttributeSet> attribs;      ///< ATTRIB entity attributes
};

struct AutoBlockRequest {
    QString anonymousBlock;             ///< Name of the wrapping block
    BlockReferenceRequest inner;        ///< Lives in the anonymous block
    BlockReferenceRequest outer;        ///< Lives in the target layout
};

/// Compose the entities of an auto block reference.
/// ATTDEF prompt, handle and owner are never copied.  Missing tags
/// get an empty text.  Attribute positions are relative to the block
/// base point.
DRAFTCORE_EXPORT AutoBlockRequest composeAutoBlockRef(const BlockDefinition& block,
                                                      const QString& anonymousBlock,
                                                      const Vec3& insert,
                                                      const QMap<QString, QString>& values,
                                                      const AttributeSet& overrides = AttributeSet());

}  // namespace dxf
}  // namespace draftcore

#endif  // DRAFTCORE_DXF_AUTOBLOCK_H
