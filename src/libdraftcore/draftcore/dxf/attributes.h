// =====================================================================
//  src/libdraftcore/draftcore/dxf/attributes.h — Entity attribute sets
// =====================================================================
//
//  An AttributeSet maps DXF attribute names ("center", "radius",
//  "flags", ...) to typed values.  The assembler merges caller
//  overrides over per-kind defaults; flag attributes can be merged by
//  bitwise OR so bits set by the factory survive caller flags.
//
//  Default templates are immutable.  defaultAttributes() always
//  returns a fresh copy.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_DXF_ATTRIBUTES_H
#define DRAFTCORE_DXF_ATTRIBUTES_H

#include "../core.h"
#include "../errors.h"
#include "../geometry/types.h"
#include "types.h"

#include <QFlags>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <initializer_list>
#include <optional>
#include <utility>
#include <variant>

namespace draftcore {
namespace dxf {

using geometry::Vec3;

// =====================================================================
//  Flag bitmasks
// =====================================================================

/// POLYLINE "flags" bits
enum class PolylineFlag {
    Closed           = 0x01,
    MClosed          = 0x01,   ///< Polymesh closed in M direction
    CurveFit         = 0x02,
    SplineFit        = 0x04,
    Polyline3d       = 0x08,
    Polymesh         = 0x10,
    MeshClosedN      = 0x20,   ///< Polymesh closed in N direction
    Polyface         = 0x40,
    GenerateLinetype = 0x80
};
Q_DECLARE_FLAGS(PolylineFlags, PolylineFlag)
Q_DECLARE_OPERATORS_FOR_FLAGS(PolylineFlags)

/// SPLINE "flags" bits
enum class SplineFlag {
    Closed   = 0x01,
    Periodic = 0x02,
    Rational = 0x04,
    Planar   = 0x08,
    Linear   = 0x10
};
Q_DECLARE_FLAGS(SplineFlags, SplineFlag)
Q_DECLARE_OPERATORS_FOR_FLAGS(SplineFlags)

// =====================================================================
//  Attribute values
// =====================================================================

/// One LWPOLYLINE vertex (x, y, start width, end width, bulge)
struct LWPolylineVertex {
    double x = 0.0;
    double y = 0.0;
    double startWidth = 0.0;
    double endWidth = 0.0;
    double bulge = 0.0;

    bool operator==(const LWPolylineVertex& o) const
    {
        return x == o.x && y == o.y && startWidth == o.startWidth
            && endWidth == o.endWidth && bulge == o.bulge;
    }
    bool operator!=(const LWPolylineVertex& o) const { return !(*this == o); }
};

using AttributeValue = std::variant<bool,
                                    int,
                                    double,
                                    QString,
                                    Vec3,
                                    QVector<Vec3>,
                                    QVector<double>,
                                    QVector<LWPolylineVertex>,
                                    QStringList>;

// =====================================================================
//  AttributeSet
// =====================================================================

class DRAFTCORE_EXPORT AttributeSet {
public:
    AttributeSet() = default;
    AttributeSet(std::initializer_list<std::pair<QString, AttributeValue>> values);

    /// Set or replace an attribute
    void set(const QString& key, AttributeValue value);

    /// Set an attribute only if it is not present yet
    void setDefault(const QString& key, AttributeValue value);

    bool contains(const QString& key) const { return m_values.contains(key); }
    std::optional<AttributeValue> value(const QString& key) const;

    /// Typed access.  Returns the fallback if the key is missing or
    /// holds another type.  get<double> also accepts int values.
    template <typename T>
    T get(const QString& key, const T& fallback = T()) const
    {
        auto it = m_values.constFind(key);
        if (it == m_values.constEnd()) {
            return fallback;
        }
        if (const T* v = std::get_if<T>(&it.value())) {
            return *v;
        }
        return fallback;
    }

    /// Remove an attribute, returns true if it was present
    bool remove(const QString& key);

    /// Remove and return an attribute
    std::optional<AttributeValue> take(const QString& key);

    /// OR bits into an integer attribute (missing counts as 0)
    void orFlags(const QString& key, int bits);

    /// Integer flag attribute, 0 if missing
    int flags(const QString& key) const { return get<int>(key, 0); }

    QStringList keys() const { return m_values.keys(); }
    int size() const { return int(m_values.size()); }
    bool isEmpty() const { return m_values.isEmpty(); }

    const QMap<QString, AttributeValue>& values() const { return m_values; }

    bool operator==(const AttributeSet& other) const { return m_values == other.m_values; }
    bool operator!=(const AttributeSet& other) const { return !(*this == other); }

private:
    QMap<QString, AttributeValue> m_values;
};

template <>
DRAFTCORE_EXPORT double AttributeSet::get<double>(const QString& key, const double& fallback) const;

// =====================================================================
//  Assembler
// =====================================================================

/// Merge overrides over defaults into a new set.  Overrides win on
/// key collision, except for `orMergedKeys` whose integer values are
/// combined by bitwise OR.  Neither input is modified.
DRAFTCORE_EXPORT AttributeSet assemble(const AttributeSet& defaults,
                                       const AttributeSet& overrides,
                                       const QStringList& orMergedKeys = QStringList());

/// Fresh copy of the default attributes for an entity kind
DRAFTCORE_EXPORT AttributeSet defaultAttributes(EntityType type);

/// Build LWPOLYLINE vertices from per-point value tuples.
/// `format` names the value order: x, y, s (start width), e (end
/// width), b (bulge), v (x and y).  Missing values default to 0.
DRAFTCORE_EXPORT Result<QVector<LWPolylineVertex>> lwpolylineVertices(
    const QVector<QVector<double>>& points,
    const QString& format = QStringLiteral("xyseb"));

}  // namespace dxf
}  // namespace draftcore

#endif  // DRAFTCORE_DXF_ATTRIBUTES_H
