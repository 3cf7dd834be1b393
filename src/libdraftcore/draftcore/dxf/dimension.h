// =====================================================================
//  src/libdraftcore/draftcore/dxf/dimension.h — Dimension requests
// =====================================================================
//
//  Derives the attributes of a DIMENSION entity from measurement
//  points.  Aligned dimensions are linear dimensions with a computed
//  angle and base point.  Angular, diameter, radius, 3-point angular
//  and ordinate dimensions only carry their type flag here; their
//  geometry is produced by the renderer.
//
//  Nothing is drawn by this module.  A DimStyleOverride bundles the
//  created entity with its style overrides and is handed to a
//  DimensionRenderer on an explicit render() call.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_DXF_DIMENSION_H
#define DRAFTCORE_DXF_DIMENSION_H

#include "../core.h"
#include "../errors.h"
#include "attributes.h"
#include "collaborators.h"

#include <QString>
#include <QVector>

#include <optional>

namespace draftcore {
namespace dxf {

/// DIMENSION "dimtype" values
enum class DimensionKind {
    Linear    = 0,
    Aligned   = 1,
    Angular   = 2,
    Diameter  = 3,
    Radius    = 4,
    Angular3P = 5,
    Ordinate  = 6
};

constexpr int DIM_BLOCK_EXCLUSIVE = 32;
constexpr int DIM_USER_LOCATION_OVERRIDE = 128;

/// "dimtype" attribute for a kind, including DIM_BLOCK_EXCLUSIVE
DRAFTCORE_EXPORT int dimensionTypeFlags(DimensionKind kind);

/// Geometry of a linear (rotated) dimension
struct LinearGeometry {
    Vec3 base;                          ///< Location of the dimension line
    Vec3 p1;                            ///< Measurement point 1
    Vec3 p2;                            ///< Measurement point 2
    double angle = 0.0;                 ///< Dimension line angle in degrees
    std::optional<double> textRotation; ///< Absolute text angle
    std::optional<Vec3> location;       ///< User text location
    bool leader = false;                ///< Leader to a user text location
};

struct DRAFTCORE_EXPORT DimensionRequest {
    DimensionKind kind = DimensionKind::Linear;
    QString text = QStringLiteral("<>");
    QString dimstyle = QStringLiteral("EZDXF");
    std::optional<LinearGeometry> linear;
    AttributeSet styleOverrides;        ///< DIMSTYLE variable overrides
    AttributeSet entityAttributes;      ///< Caller DIMENSION attributes

    /// Attribute set of the DIMENSION entity.  Computed attributes
    /// (type flag, style and geometry) replace caller attributes.
    AttributeSet toAttributes() const;
};

/// Linear dimension from a base point and two measurement points.
/// A text rotation, when given, overrides any implied text angle.
DRAFTCORE_EXPORT DimensionRequest resolveLinear(const LinearGeometry& geometry,
                                                const QString& text,
                                                const QString& dimstyle,
                                                const AttributeSet& styleOverrides = AttributeSet(),
                                                const AttributeSet& entityAttributes = AttributeSet());

/// Linear dimension aligned with p1 -> p2.  The base point is the
/// perpendicular of the measurement direction scaled to `distance`;
/// a negative distance puts the dimension line on the other side.
/// Coincident points fail with a ValueError on "points".
DRAFTCORE_EXPORT Result<DimensionRequest> resolveAligned(const Vec3& p1, const Vec3& p2,
                                                         double distance,
                                                         const QString& text,
                                                         const QString& dimstyle,
                                                         const AttributeSet& styleOverrides = AttributeSet(),
                                                         const AttributeSet& entityAttributes = AttributeSet());

/// Dimension of a kind without derived geometry
DRAFTCORE_EXPORT DimensionRequest resolveKind(DimensionKind kind,
                                              const QString& dimstyle,
                                              const AttributeSet& styleOverrides = AttributeSet(),
                                              const AttributeSet& entityAttributes = AttributeSet());

/// Name of the first arrow block implied by style overrides.
/// Ticks count as "ARCHTICK", the closed filled arrow is "".
DRAFTCORE_EXPORT QString arrow1Name(const AttributeSet& styleOverrides);

/// True for arrows whose tip sits on the extension line origin
DRAFTCORE_EXPORT bool isOriginZeroArrow(const QString& name);

/// Chain of linear dimensions sharing one base line, one per pair of
/// consecutive points.  With `avoidDoubleRendering` every dimension
/// after the first suppresses its first extension line, and also its
/// first arrow if that arrow starts at the extension line origin.
/// Fewer than 2 points fail with a ValueError on "points".
DRAFTCORE_EXPORT Result<QVector<DimensionRequest>> resolveMultiPointLinear(
    const Vec3& base,
    const QVector<Vec3>& points,
    double angle,
    bool avoidDoubleRendering,
    const QString& dimstyle,
    const AttributeSet& styleOverrides = AttributeSet(),
    const AttributeSet& entityAttributes = AttributeSet());

// =====================================================================
//  DimStyleOverride
// =====================================================================

/// A created DIMENSION entity together with its style overrides
class DRAFTCORE_EXPORT DimStyleOverride {
public:
    DimStyleOverride() = default;
    DimStyleOverride(EntityHandle handle, DimensionRequest request,
                     EntityDatabase* database = nullptr);

    const EntityHandle& handle() const { return m_handle; }
    const DimensionRequest& request() const { return m_request; }
    const AttributeSet& overrides() const { return m_request.styleOverrides; }

    /// Set a DIMSTYLE variable override
    void set(const QString& key, AttributeValue value);

    /// Place the dimension text at a user location.  Updates the
    /// DIMENSION entity if the override is bound to a database.
    void setLocation(const Vec3& location, bool leader = false, bool relative = false);

    /// Render through `renderer`
    void render(DimensionRenderer& renderer, bool discard = false) const;

private:
    EntityHandle m_handle;
    DimensionRequest m_request;
    EntityDatabase* m_database = nullptr;
};

}  // namespace dxf
}  // namespace draftcore

#endif  // DRAFTCORE_DXF_DIMENSION_H
