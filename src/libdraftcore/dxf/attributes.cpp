// =====================================================================
//  src/libdraftcore/dxf/attributes.cpp — Entity attribute sets
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/dxf/attributes.h>

#include <QtMath>

namespace draftcore {
namespace dxf {

// =====================================================================
//  AttributeSet
// =====================================================================

AttributeSet::AttributeSet(std::initializer_list<std::pair<QString, AttributeValue>> values)
{
    for (const auto& entry : values) {
        m_values.insert(entry.first, entry.second);
    }
}

void AttributeSet::set(const QString& key, AttributeValue value)
{
    m_values.insert(key, std::move(value));
}

void AttributeSet::setDefault(const QString& key, AttributeValue value)
{
    if (!m_values.contains(key)) {
        m_values.insert(key, std::move(value));
    }
}

std::optional<AttributeValue> AttributeSet::value(const QString& key) const
{
    auto it = m_values.constFind(key);
    if (it == m_values.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

template <>
double AttributeSet::get<double>(const QString& key, const double& fallback) const
{
    auto it = m_values.constFind(key);
    if (it == m_values.constEnd()) {
        return fallback;
    }
    if (const double* d = std::get_if<double>(&it.value())) {
        return *d;
    }
    if (const int* i = std::get_if<int>(&it.value())) {
        return double(*i);
    }
    return fallback;
}

bool AttributeSet::remove(const QString& key)
{
    return m_values.remove(key) > 0;
}

std::optional<AttributeValue> AttributeSet::take(const QString& key)
{
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    AttributeValue taken = it.value();
    m_values.erase(it);
    return taken;
}

void AttributeSet::orFlags(const QString& key, int bits)
{
    m_values.insert(key, flags(key) | bits);
}

// =====================================================================
//  Assembler
// =====================================================================

AttributeSet assemble(const AttributeSet& defaults, const AttributeSet& overrides,
                      const QStringList& orMergedKeys)
{
    AttributeSet result = defaults;
    for (auto it = overrides.values().cbegin(); it != overrides.values().cend(); ++it) {
        const QString& key = it.key();
        const int* bits = std::get_if<int>(&it.value());
        if (bits && orMergedKeys.contains(key)) {
            result.orFlags(key, *bits);
        } else {
            result.set(key, it.value());
        }
    }
    return result;
}

namespace {

const QString LAYER = QStringLiteral("layer");

const QMap<EntityType, AttributeSet>& templates()
{
    static const QMap<EntityType, AttributeSet> table = {
        { EntityType::Point, {
            { QStringLiteral("location"), Vec3() } } },
        { EntityType::Line, {
            { QStringLiteral("start"), Vec3() },
            { QStringLiteral("end"), Vec3() } } },
        { EntityType::Circle, {
            { QStringLiteral("center"), Vec3() },
            { QStringLiteral("radius"), 1.0 } } },
        { EntityType::Arc, {
            { QStringLiteral("center"), Vec3() },
            { QStringLiteral("radius"), 1.0 },
            { QStringLiteral("start_angle"), 0.0 },
            { QStringLiteral("end_angle"), 360.0 } } },
        { EntityType::Ellipse, {
            { QStringLiteral("center"), Vec3() },
            { QStringLiteral("major_axis"), Vec3(1.0, 0.0, 0.0) },
            { QStringLiteral("ratio"), 1.0 },
            { QStringLiteral("start_param"), 0.0 },
            { QStringLiteral("end_param"), 2.0 * M_PI } } },
        { EntityType::Text, {
            { QStringLiteral("insert"), Vec3() },
            { QStringLiteral("height"), 2.5 },
            { QStringLiteral("style"), QStringLiteral("Standard") } } },
        { EntityType::MText, {
            { QStringLiteral("insert"), Vec3() },
            { QStringLiteral("char_height"), 2.5 },
            { QStringLiteral("style"), QStringLiteral("Standard") } } },
        { EntityType::Attrib, {
            { QStringLiteral("insert"), Vec3() },
            { QStringLiteral("height"), 2.5 },
            { QStringLiteral("style"), QStringLiteral("Standard") } } },
        { EntityType::Insert, {
            { QStringLiteral("insert"), Vec3() },
            { QStringLiteral("xscale"), 1.0 },
            { QStringLiteral("yscale"), 1.0 },
            { QStringLiteral("zscale"), 1.0 },
            { QStringLiteral("rotation"), 0.0 } } },
        { EntityType::Shape, {
            { QStringLiteral("insert"), Vec3() },
            { QStringLiteral("size"), 1.0 } } },
        { EntityType::Polyline, {
            { QStringLiteral("flags"), 0 } } },
        { EntityType::LWPolyline, {
            { QStringLiteral("flags"), 0 },
            { QStringLiteral("const_width"), 0.0 } } },
        { EntityType::Ray, {
            { QStringLiteral("start"), Vec3() },
            { QStringLiteral("unit_vector"), Vec3(1.0, 0.0, 0.0) } } },
        { EntityType::XLine, {
            { QStringLiteral("start"), Vec3() },
            { QStringLiteral("unit_vector"), Vec3(1.0, 0.0, 0.0) } } },
        { EntityType::Spline, {
            { QStringLiteral("degree"), 3 },
            { QStringLiteral("flags"), 0 } } },
        { EntityType::Hatch, {
            { QStringLiteral("color"), 7 },
            { QStringLiteral("solid_fill"), 1 },
            { QStringLiteral("pattern_name"), QStringLiteral("SOLID") } } },
        { EntityType::Image, {
            { QStringLiteral("insert"), Vec3() },
            { QStringLiteral("flags"), 3 } } },
        { EntityType::Dimension, {
            { QStringLiteral("dimstyle"), QStringLiteral("Standard") },
            { QStringLiteral("text"), QStringLiteral("<>") } } },
    };
    return table;
}

}  // namespace

AttributeSet defaultAttributes(EntityType type)
{
    AttributeSet attribs = templates().value(type);
    attribs.setDefault(LAYER, QStringLiteral("0"));
    return attribs;
}

// =====================================================================
//  LWPOLYLINE vertices
// =====================================================================

Result<QVector<LWPolylineVertex>> lwpolylineVertices(const QVector<QVector<double>>& points,
                                                     const QString& format)
{
    // Expand 'v' into x and y, reject anything else
    QString fields;
    for (QChar c : format.toLower()) {
        if (c == QLatin1Char('v')) {
            fields += QStringLiteral("xy");
        } else if (QStringLiteral("xyseb").contains(c)) {
            fields += c;
        } else {
            return Result<QVector<LWPolylineVertex>>::fail(Error::value(
                QStringLiteral("format"),
                QStringLiteral("unknown vertex field '%1' in '%2'").arg(c).arg(format)));
        }
    }

    QVector<LWPolylineVertex> vertices;
    vertices.reserve(points.size());
    for (const QVector<double>& values : points) {
        LWPolylineVertex vertex;
        const int count = qMin(int(values.size()), int(fields.size()));
        for (int i = 0; i < count; ++i) {
            switch (fields[i].toLatin1()) {
            case 'x': vertex.x = values[i]; break;
            case 'y': vertex.y = values[i]; break;
            case 's': vertex.startWidth = values[i]; break;
            case 'e': vertex.endWidth = values[i]; break;
            case 'b': vertex.bulge = values[i]; break;
            default: break;
            }
        }
        vertices.append(vertex);
    }
    return Result<QVector<LWPolylineVertex>>::ok(vertices);
}

}  // namespace dxf
}  // namespace draftcore
