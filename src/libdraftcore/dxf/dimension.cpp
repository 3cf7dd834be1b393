// =====================================================================
//  src/libdraftcore/dxf/dimension.cpp — Dimension requests
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/dxf/dimension.h>

#include "../logging.h"

#include <QSet>

namespace draftcore {
namespace dxf {

namespace {

void applyLocationOverrides(AttributeSet& overrides, const Vec3& location,
                            bool leader, bool relative)
{
    overrides.set(QStringLiteral("dimtmove"), leader ? 1 : 2);
    overrides.set(QStringLiteral("user_location"), location);
    overrides.set(QStringLiteral("relative_user_location"), relative);
}

}  // namespace

int dimensionTypeFlags(DimensionKind kind)
{
    return int(kind) | DIM_BLOCK_EXCLUSIVE;
}

// =====================================================================
//  DimensionRequest
// =====================================================================

AttributeSet DimensionRequest::toAttributes() const
{
    AttributeSet attribs = assemble(defaultAttributes(EntityType::Dimension), entityAttributes);
    attribs.set(QStringLiteral("dimtype"), dimensionTypeFlags(kind));

    if (!linear) {
        if (!entityAttributes.contains(QStringLiteral("dimstyle"))) {
            attribs.set(QStringLiteral("dimstyle"), dimstyle);
        }
        return attribs;
    }

    const LinearGeometry& g = *linear;
    attribs.set(QStringLiteral("dimstyle"), dimstyle);
    attribs.set(QStringLiteral("defpoint"), g.base);
    attribs.set(QStringLiteral("text"), text);
    attribs.set(QStringLiteral("defpoint2"), g.p1);
    attribs.set(QStringLiteral("defpoint3"), g.p2);
    attribs.set(QStringLiteral("angle"), g.angle);
    if (g.textRotation) {
        attribs.set(QStringLiteral("text_rotation"), *g.textRotation);
    }
    if (g.location) {
        attribs.set(QStringLiteral("text_midpoint"), *g.location);
        attribs.orFlags(QStringLiteral("dimtype"), DIM_USER_LOCATION_OVERRIDE);
    }
    return attribs;
}

// =====================================================================
//  Resolvers
// =====================================================================

DimensionRequest resolveLinear(const LinearGeometry& geometry, const QString& text,
                               const QString& dimstyle, const AttributeSet& styleOverrides,
                               const AttributeSet& entityAttributes)
{
    DimensionRequest request;
    request.kind = DimensionKind::Linear;
    request.text = text;
    request.dimstyle = dimstyle;
    request.linear = geometry;
    request.styleOverrides = styleOverrides;
    request.entityAttributes = entityAttributes;
    if (geometry.location) {
        applyLocationOverrides(request.styleOverrides, *geometry.location, geometry.leader, false);
    }
    return request;
}

Result<DimensionRequest> resolveAligned(const Vec3& p1, const Vec3& p2, double distance,
                                        const QString& text, const QString& dimstyle,
                                        const AttributeSet& styleOverrides,
                                        const AttributeSet& entityAttributes)
{
    const Vec3 direction = p2 - p1;
    if (direction.length() <= geometry::DEFAULT_TOLERANCE) {
        return Result<DimensionRequest>::fail(Error::value(
            QStringLiteral("points"), QStringLiteral("measurement points coincide")));
    }

    LinearGeometry g;
    g.base = direction.orthogonal().normalized(distance);
    g.p1 = p1;
    g.p2 = p2;
    g.angle = direction.angleDeg();
    return Result<DimensionRequest>::ok(
        resolveLinear(g, text, dimstyle, styleOverrides, entityAttributes));
}

DimensionRequest resolveKind(DimensionKind kind, const QString& dimstyle,
                             const AttributeSet& styleOverrides,
                             const AttributeSet& entityAttributes)
{
    DimensionRequest request;
    request.kind = kind;
    request.dimstyle = dimstyle;
    request.styleOverrides = styleOverrides;
    request.entityAttributes = entityAttributes;
    return request;
}

QString arrow1Name(const AttributeSet& styleOverrides)
{
    if (styleOverrides.get<double>(QStringLiteral("dimtsz"), 0.0) > 0.0) {
        return QStringLiteral("ARCHTICK");
    }
    const bool separate = styleOverrides.get<bool>(QStringLiteral("dimsah"), false)
                       || styleOverrides.get<int>(QStringLiteral("dimsah"), 0) != 0;
    const QString key = separate ? QStringLiteral("dimblk1") : QStringLiteral("dimblk");
    return styleOverrides.get<QString>(key);
}

bool isOriginZeroArrow(const QString& name)
{
    static const QSet<QString> originZero = {
        QStringLiteral("ARCHTICK"),
        QStringLiteral("OBLIQUE"),
        QStringLiteral("DOTSMALL"),
        QStringLiteral("SMALL"),
        QStringLiteral("INTEGRAL"),
        QStringLiteral("NONE"),
    };
    QString key = name.trimmed().toUpper();
    if (key.startsWith(QLatin1Char('_'))) {
        key.remove(0, 1);
    }
    return originZero.contains(key);
}

Result<QVector<DimensionRequest>> resolveMultiPointLinear(
    const Vec3& base, const QVector<Vec3>& points, double angle,
    bool avoidDoubleRendering, const QString& dimstyle,
    const AttributeSet& styleOverrides, const AttributeSet& entityAttributes)
{
    if (points.size() < 2) {
        return Result<QVector<DimensionRequest>>::fail(Error::value(
            QStringLiteral("points"), QStringLiteral("at least 2 points required")));
    }

    bool suppressArrow1 = false;
    QVector<DimensionRequest> requests;
    for (int i = 0; i + 1 < points.size(); ++i) {
        AttributeSet overrides = styleOverrides;
        if (avoidDoubleRendering && i > 0) {
            overrides.set(QStringLiteral("dimse1"), 1);
            if (suppressArrow1) {
                overrides.set(QStringLiteral("dimsah"), 1);
                overrides.set(QStringLiteral("dimblk1"), QStringLiteral("NONE"));
            }
        }

        LinearGeometry g;
        g.base = base;
        g.p1 = points[i];
        g.p2 = points[i + 1];
        g.angle = angle;
        requests.append(resolveLinear(g, QStringLiteral("<>"), dimstyle, overrides, entityAttributes));

        if (i == 0) {
            suppressArrow1 = isOriginZeroArrow(arrow1Name(overrides));
        }
    }

    qCDebug(lcDimension) << "Multi-point linear dimension:" << requests.size() << "segments";
    return Result<QVector<DimensionRequest>>::ok(requests);
}

// =====================================================================
//  DimStyleOverride
// =====================================================================

DimStyleOverride::DimStyleOverride(EntityHandle handle, DimensionRequest request,
                                   EntityDatabase* database)
    : m_handle(std::move(handle))
    , m_request(std::move(request))
    , m_database(database)
{
}

void DimStyleOverride::set(const QString& key, AttributeValue value)
{
    m_request.styleOverrides.set(key, std::move(value));
}

void DimStyleOverride::setLocation(const Vec3& location, bool leader, bool relative)
{
    if (m_request.linear) {
        m_request.linear->location = location;
        m_request.linear->leader = leader;
    }
    applyLocationOverrides(m_request.styleOverrides, location, leader, relative);

    if (m_database) {
        AttributeSet update;
        const int dimtype = m_database->entityAttributes(m_handle).flags(QStringLiteral("dimtype"));
        update.set(QStringLiteral("dimtype"), dimtype | DIM_USER_LOCATION_OVERRIDE);
        update.set(QStringLiteral("text_midpoint"), location);
        m_database->updateEntity(m_handle, update);
    }
}

void DimStyleOverride::render(DimensionRenderer& renderer, bool discard) const
{
    qCDebug(lcDimension) << "Rendering dimension" << m_handle << (discard ? "(discarded)" : "");
    renderer.render(*this, discard);
}

}  // namespace dxf
}  // namespace draftcore
