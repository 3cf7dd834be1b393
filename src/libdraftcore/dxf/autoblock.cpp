// =====================================================================
//  src/libdraftcore/dxf/autoblock.cpp — Auto-filled block refs
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/dxf/autoblock.h>

namespace draftcore {
namespace dxf {

AutoBlockRequest composeAutoBlockRef(const BlockDefinition& block,
                                     const QString& anonymousBlock,
                                     const Vec3& insert,
                                     const QMap<QString, QString>& values,
                                     const AttributeSet& overrides)
{
    AutoBlockRequest request;
    request.anonymousBlock = anonymousBlock;

    // Reference to the named block at the origin of the anonymous block
    request.inner.blockName = block.name;
    request.inner.insertAttributes = defaultAttributes(EntityType::Insert);
    request.inner.insertAttributes.set(QStringLiteral("name"), block.name);
    request.inner.insertAttributes.set(QStringLiteral("insert"), Vec3());

    for (const AttributeSet& attdef : block.attributeDefinitions) {
        AttributeSet attrib = attdef;
        attrib.remove(QStringLiteral("prompt"));
        attrib.remove(QStringLiteral("handle"));
        attrib.remove(QStringLiteral("owner"));

        const QString tag = attrib.get<QString>(QStringLiteral("tag"));
        const Vec3 position = attrib.get<Vec3>(QStringLiteral("insert"));
        attrib.set(QStringLiteral("tag"), tag);
        attrib.set(QStringLiteral("text"), values.value(tag));
        attrib.set(QStringLiteral("insert"), position - block.basePoint);
        request.inner.attribs.append(assemble(defaultAttributes(EntityType::Attrib), attrib));
    }
    if (!request.inner.attribs.isEmpty()) {
        request.inner.insertAttributes.set(QStringLiteral("attribs_follow"), 1);
    }

    // Reference to the anonymous block in the target layout
    request.outer.blockName = anonymousBlock;
    request.outer.insertAttributes = assemble(defaultAttributes(EntityType::Insert), overrides);
    request.outer.insertAttributes.set(QStringLiteral("name"), anonymousBlock);
    request.outer.insertAttributes.set(QStringLiteral("insert"), insert);
    return request;
}

}  // namespace dxf
}  // namespace draftcore
