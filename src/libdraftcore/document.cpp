// =====================================================================
//  src/libdraftcore/document.cpp — In-memory document
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/document.h>

#include <stdexcept>

namespace draftcore {

using dxf::AttributeSet;
using dxf::EntityHandle;
using dxf::Vec3;

const QString MemoryDocument::MODEL_SPACE = QStringLiteral("*Model_Space");
const QString MemoryDocument::OBJECTS = QStringLiteral("*Objects");

// ---- Block entity space ---------------------------------------------

class MemoryDocument::BlockSpace : public dxf::EntityDatabase {
public:
    BlockSpace(MemoryDocument& doc, QString name, const Vec3& basePoint)
        : m_doc(doc), m_name(std::move(name)), m_basePoint(basePoint) {}

    const Vec3& basePoint() const { return m_basePoint; }

    EntityHandle createEntity(const QString& dxfType, const AttributeSet& attribs) override
    {
        return m_doc.store(m_name, dxfType, attribs);
    }

    void updateEntity(const EntityHandle& handle, const AttributeSet& attribs) override
    {
        m_doc.updateEntity(handle, attribs);
    }

    QString entityType(const EntityHandle& handle) const override
    {
        return m_doc.entityType(handle);
    }

    AttributeSet entityAttributes(const EntityHandle& handle) const override
    {
        return m_doc.entityAttributes(handle);
    }

    EntityHandle addImageDefReactor(const EntityHandle& imageHandle) override
    {
        return m_doc.addImageDefReactor(imageHandle);
    }

    void appendReactor(const EntityHandle& owner, const EntityHandle& reactor) override
    {
        m_doc.appendReactor(owner, reactor);
    }

private:
    MemoryDocument& m_doc;
    QString m_name;
    Vec3 m_basePoint;
};

// ---- Construction ---------------------------------------------------

MemoryDocument::MemoryDocument() = default;
MemoryDocument::~MemoryDocument() = default;

bool MemoryDocument::isModified() const { return m_modified; }
void MemoryDocument::setModified(bool modified) { m_modified = modified; }

void MemoryDocument::clear()
{
    m_entities.clear();
    m_order.clear();
    m_blocks.clear();
    m_nextHandle = 0x30;
    m_anonymousCount = 0;
    m_modified = true;
}

// ---- Entities -------------------------------------------------------

EntityHandle MemoryDocument::store(const QString& space, const QString& dxfType,
                                   const AttributeSet& attribs)
{
    StoredEntity entity;
    entity.handle = QString::number(m_nextHandle++, 16).toUpper();
    entity.dxfType = dxfType;
    entity.space = space;
    entity.attribs = attribs;

    m_order[space].append(entity.handle);
    m_entities.insert(entity.handle, entity);
    m_modified = true;
    return entity.handle;
}

StoredEntity& MemoryDocument::existing(const EntityHandle& handle)
{
    auto it = m_entities.find(handle);
    if (it == m_entities.end()) {
        throw std::invalid_argument("unknown entity handle " + handle.toStdString());
    }
    return it.value();
}

const StoredEntity* MemoryDocument::entity(const EntityHandle& handle) const
{
    auto it = m_entities.constFind(handle);
    return it == m_entities.constEnd() ? nullptr : &it.value();
}

QVector<EntityHandle> MemoryDocument::entitiesIn(const QString& space) const
{
    return m_order.value(space);
}

EntityHandle MemoryDocument::createEntity(const QString& dxfType, const AttributeSet& attribs)
{
    return store(MODEL_SPACE, dxfType, attribs);
}

void MemoryDocument::updateEntity(const EntityHandle& handle, const AttributeSet& attribs)
{
    StoredEntity& target = existing(handle);
    for (auto it = attribs.values().cbegin(); it != attribs.values().cend(); ++it) {
        target.attribs.set(it.key(), it.value());
    }
    m_modified = true;
}

QString MemoryDocument::entityType(const EntityHandle& handle) const
{
    const StoredEntity* e = entity(handle);
    return e ? e->dxfType : QString();
}

AttributeSet MemoryDocument::entityAttributes(const EntityHandle& handle) const
{
    const StoredEntity* e = entity(handle);
    return e ? e->attribs : AttributeSet();
}

EntityHandle MemoryDocument::addImageDefReactor(const EntityHandle& imageHandle)
{
    AttributeSet attribs;
    attribs.set(QStringLiteral("image_handle"), imageHandle);
    return store(OBJECTS, QStringLiteral("IMAGEDEF_REACTOR"), attribs);
}

void MemoryDocument::appendReactor(const EntityHandle& owner, const EntityHandle& reactor)
{
    existing(owner).reactors.append(reactor);
    m_modified = true;
}

// ---- Definitions ----------------------------------------------------

void MemoryDocument::addBlock(const QString& name, const Vec3& basePoint)
{
    if (m_blocks.count(name)) {
        return;
    }
    m_blocks.emplace(name, std::make_unique<BlockSpace>(*this, name, basePoint));
    m_modified = true;
}

EntityHandle MemoryDocument::addAttributeDefinition(const QString& block, const QString& tag,
                                                    const Vec3& insert, const QString& prompt,
                                                    const AttributeSet& attribs)
{
    addBlock(block);

    AttributeSet attdef = attribs;
    attdef.set(QStringLiteral("tag"), tag);
    attdef.set(QStringLiteral("insert"), insert);
    attdef.set(QStringLiteral("owner"), block);
    if (!prompt.isEmpty()) {
        attdef.set(QStringLiteral("prompt"), prompt);
    }

    const EntityHandle handle = store(block, QStringLiteral("ATTDEF"), attdef);
    existing(handle).attribs.set(QStringLiteral("handle"), handle);
    return handle;
}

EntityHandle MemoryDocument::addImageDef(const QString& filename, double widthPixels,
                                         double heightPixels)
{
    AttributeSet attribs;
    attribs.set(QStringLiteral("filename"), filename);
    attribs.set(QStringLiteral("image_size"), Vec3(widthPixels, heightPixels, 0.0));
    return store(OBJECTS, QStringLiteral("IMAGEDEF"), attribs);
}

EntityHandle MemoryDocument::addUnderlayDef(const QString& dxfType, const QString& filename)
{
    AttributeSet attribs;
    attribs.set(QStringLiteral("filename"), filename);
    return store(OBJECTS, dxfType, attribs);
}

// ---- Block table ----------------------------------------------------

bool MemoryDocument::hasBlock(const QString& name) const
{
    return m_blocks.count(name) > 0;
}

Vec3 MemoryDocument::basePoint(const QString& name) const
{
    auto it = m_blocks.find(name);
    return it == m_blocks.end() ? Vec3() : it->second->basePoint();
}

QVector<AttributeSet> MemoryDocument::attributeDefinitions(const QString& name) const
{
    QVector<AttributeSet> attdefs;
    for (const EntityHandle& handle : m_order.value(name)) {
        const StoredEntity* e = entity(handle);
        if (e && e->dxfType == QLatin1String("ATTDEF")) {
            attdefs.append(e->attribs);
        }
    }
    return attdefs;
}

QString MemoryDocument::newAnonymousBlock()
{
    QString name;
    do {
        name = QStringLiteral("*U%1").arg(++m_anonymousCount);
    } while (hasBlock(name));
    addBlock(name);
    return name;
}

dxf::EntityDatabase& MemoryDocument::database(const QString& name)
{
    if (name == MODEL_SPACE) {
        return *this;
    }
    addBlock(name);
    return *m_blocks.at(name);
}

}  // namespace draftcore
