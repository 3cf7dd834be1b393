// =====================================================================
//  src/libdraftcore/draftcore/document.h — In-memory document
// =====================================================================
//
//  A MemoryDocument stores entities, blocks and objects in memory and
//  implements the collaborator interfaces of the entity factory.  The
//  document itself is the model space; every block has its own entity
//  space.  Handles are upper-case hex numbers starting at "30".
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_DOCUMENT_H
#define DRAFTCORE_DOCUMENT_H

#include "core.h"
#include "dxf/attributes.h"
#include "dxf/collaborators.h"

#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <map>
#include <memory>

namespace draftcore {

/// One stored entity or object
struct StoredEntity {
    dxf::EntityHandle handle;
    QString dxfType;
    QString space;                  ///< Layout or block name
    dxf::AttributeSet attribs;
    QStringList reactors;           ///< Handles of reactor objects
};

class DRAFTCORE_EXPORT MemoryDocument : public dxf::EntityDatabase, public dxf::BlockTable {
public:
    static const QString MODEL_SPACE;
    static const QString OBJECTS;

    MemoryDocument();
    ~MemoryDocument() override;

    MemoryDocument(const MemoryDocument&) = delete;
    MemoryDocument& operator=(const MemoryDocument&) = delete;

    // ---- State ------------------------------------------------------

    /// True if anything was created or changed since the last reset.
    bool isModified() const;

    void setModified(bool modified = true);

    /// Remove all entities and blocks.  Handles restart at "30".
    void clear();

    // ---- Entities ---------------------------------------------------

    /// Stored entity, or nullptr if the handle is unknown
    const StoredEntity* entity(const dxf::EntityHandle& handle) const;

    /// Handles of a layout or block, in creation order
    QVector<dxf::EntityHandle> entitiesIn(const QString& space) const;

    int entityCount() const { return int(m_entities.size()); }

    // ---- Definitions ------------------------------------------------

    /// Define a block.  Does nothing if it already exists.
    void addBlock(const QString& name, const dxf::Vec3& basePoint = dxf::Vec3());

    /// Add an ATTDEF to a block
    dxf::EntityHandle addAttributeDefinition(const QString& block, const QString& tag,
                                             const dxf::Vec3& insert,
                                             const QString& prompt = QString(),
                                             const dxf::AttributeSet& attribs = dxf::AttributeSet());

    /// Add an IMAGEDEF object with the image size in pixels
    dxf::EntityHandle addImageDef(const QString& filename, double widthPixels, double heightPixels);

    /// Add an underlay definition object ("PDFDEFINITION",
    /// "DWFDEFINITION" or "DGNDEFINITION")
    dxf::EntityHandle addUnderlayDef(const QString& dxfType, const QString& filename);

    // ---- dxf::EntityDatabase (model space) ----------------------------

    dxf::EntityHandle createEntity(const QString& dxfType, const dxf::AttributeSet& attribs) override;
    void updateEntity(const dxf::EntityHandle& handle, const dxf::AttributeSet& attribs) override;
    QString entityType(const dxf::EntityHandle& handle) const override;
    dxf::AttributeSet entityAttributes(const dxf::EntityHandle& handle) const override;
    dxf::EntityHandle addImageDefReactor(const dxf::EntityHandle& imageHandle) override;
    void appendReactor(const dxf::EntityHandle& owner, const dxf::EntityHandle& reactor) override;

    // ---- dxf::BlockTable ----------------------------------------------

    bool hasBlock(const QString& name) const override;
    dxf::Vec3 basePoint(const QString& name) const override;
    QVector<dxf::AttributeSet> attributeDefinitions(const QString& name) const override;
    QString newAnonymousBlock() override;

    /// Entity space of a block; the model space for MODEL_SPACE.
    /// Unknown names create an empty block.
    dxf::EntityDatabase& database(const QString& name) override;

private:
    class BlockSpace;

    dxf::EntityHandle store(const QString& space, const QString& dxfType,
                            const dxf::AttributeSet& attribs);
    StoredEntity& existing(const dxf::EntityHandle& handle);

    QMap<dxf::EntityHandle, StoredEntity> m_entities;
    QMap<QString, QVector<dxf::EntityHandle>> m_order;
    std::map<QString, std::unique_ptr<BlockSpace>> m_blocks;
    int m_nextHandle = 0x30;
    int m_anonymousCount = 0;
    bool m_modified = false;
};

}  // namespace draftcore

#endif  // DRAFTCORE_DOCUMENT_H
