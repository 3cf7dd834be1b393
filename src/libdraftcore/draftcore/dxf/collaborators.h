// =====================================================================
//  src/libdraftcore/draftcore/dxf/collaborators.h — External services
// =====================================================================
//
//  The entity factory computes attribute sets; storing entities,
//  managing blocks, rendering dimension geometry and drawing arrow
//  symbols belong to the document that owns the factory.  These
//  interfaces are what the factory needs from that document.
//
//  Exceptions thrown by implementations are not caught by the
//  factory.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_DXF_COLLABORATORS_H
#define DRAFTCORE_DXF_COLLABORATORS_H

#include "../core.h"
#include "attributes.h"
#include "types.h"

#include <QString>
#include <QVector>

namespace draftcore {
namespace dxf {

class DimStyleOverride;

/// Entity storage of one layout or block
class DRAFTCORE_EXPORT EntityDatabase {
public:
    virtual ~EntityDatabase() = default;

    /// Store a new entity and return its unique handle
    virtual EntityHandle createEntity(const QString& dxfType, const AttributeSet& attribs) = 0;

    /// Set (replace) the given attributes of an existing entity
    virtual void updateEntity(const EntityHandle& handle, const AttributeSet& attribs) = 0;

    /// DXF type of an existing entity, empty if the handle is unknown
    virtual QString entityType(const EntityHandle& handle) const = 0;

    /// Attributes of an existing entity, empty if the handle is unknown
    virtual AttributeSet entityAttributes(const EntityHandle& handle) const = 0;

    /// Create the IMAGEDEF_REACTOR object linking an IMAGE to its
    /// definition and return its handle
    virtual EntityHandle addImageDefReactor(const EntityHandle& imageHandle) = 0;

    /// Register `reactor` in the reactor list of `owner`
    virtual void appendReactor(const EntityHandle& owner, const EntityHandle& reactor) = 0;
};

/// Block definitions
class DRAFTCORE_EXPORT BlockTable {
public:
    virtual ~BlockTable() = default;

    virtual bool hasBlock(const QString& name) const = 0;

    /// Base point of a block, origin if unknown
    virtual Vec3 basePoint(const QString& name) const = 0;

    /// ATTDEF placeholders declared in a block, in definition order
    virtual QVector<AttributeSet> attributeDefinitions(const QString& name) const = 0;

    /// Create a new anonymous block ("*U<n>") and return its name
    virtual QString newAnonymousBlock() = 0;

    /// Entity space of a block
    virtual EntityDatabase& database(const QString& name) = 0;
};

/// Turns a dimension style override into block geometry
class DRAFTCORE_EXPORT DimensionRenderer {
public:
    virtual ~DimensionRenderer() = default;

    /// Render the dimension.  With `discard` set the geometry block is
    /// not kept in the document.
    virtual void render(const DimStyleOverride& style, bool discard) = 0;
};

/// Arrow symbol library
class DRAFTCORE_EXPORT ArrowLibrary {
public:
    virtual ~ArrowLibrary() = default;

    /// Draw an arrow as plain entities into `database`.
    /// Returns the connection point of the dimension line.
    virtual Vec3 renderArrow(EntityDatabase& database, const QString& name,
                             const Vec3& insert, double size, double rotation,
                             const AttributeSet& attribs) = 0;

    /// Insert an arrow as block reference into `database`.
    /// Returns the connection point of the dimension line.
    virtual Vec3 insertArrow(EntityDatabase& database, const QString& name,
                             const Vec3& insert, double size, double rotation,
                             const AttributeSet& attribs) = 0;
};

}  // namespace dxf
}  // namespace draftcore

#endif  // DRAFTCORE_DXF_COLLABORATORS_H
