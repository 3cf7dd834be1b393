// =====================================================================
//  src/libdraftcore/draftcore/dxf/factory.h — Entity factory
// =====================================================================
//
//  Builds DXF entities from geometric intent and hands their
//  attributes to an EntityDatabase.  Every request runs through the
//  same steps:
//
//    1. version gate     entity kind allowed by the active DXF version
//    2. assembler        caller attributes merged over kind defaults
//    3. engine           quad normalizer, spline frames, dimensions
//    4. database         one createEntity() call per entity
//
//  Validation failures are returned before anything is created.
//  Caller attribute sets are never modified.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_DXF_FACTORY_H
#define DRAFTCORE_DXF_FACTORY_H

#include "../config.h"
#include "../core.h"
#include "../errors.h"
#include "../geometry/bspline.h"
#include "attributes.h"
#include "collaborators.h"
#include "dimension.h"

#include <QMap>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace draftcore {
namespace dxf {

class DRAFTCORE_EXPORT EntityFactory {
public:
    /// Create a factory that stores entities in `database`.
    /// `blocks` is required for auto block references only.
    explicit EntityFactory(EntityDatabase& database,
                           BlockTable* blocks = nullptr,
                           FactoryConfig config = FactoryConfig());

    const FactoryConfig& config() const { return m_config; }
    void setConfig(const FactoryConfig& config) { m_config = config; }

    DxfVersion dxfVersion() const { return m_config.dxfVersion; }

    /// Renderer used by multi-point linear dimensions
    void setDimensionRenderer(DimensionRenderer* renderer) { m_renderer = renderer; }

    /// Arrow library used by addArrow() and addArrowBlockRef()
    void setArrowLibrary(ArrowLibrary* arrows) { m_arrows = arrows; }

    // ---- Basic entities ---------------------------------------------

    Result<EntityHandle> addPoint(const Vec3& location, const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addLine(const Vec3& start, const Vec3& end,
                                 const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addCircle(const Vec3& center, double radius,
                                   const AttributeSet& attribs = AttributeSet());

    /// Arc from start to end angle (degrees).  Clockwise arcs are
    /// stored counter-clockwise with swapped angles.
    Result<EntityHandle> addArc(const Vec3& center, double radius,
                                double startAngle, double endAngle,
                                bool counterClockwise = true,
                                const AttributeSet& attribs = AttributeSet());

    /// Ellipse (R2000+).  The ratio of minor to major axis must not
    /// exceed 1.
    Result<EntityHandle> addEllipse(const Vec3& center,
                                    const Vec3& majorAxis = Vec3(1.0, 0.0, 0.0),
                                    double ratio = 1.0,
                                    double startParam = 0.0,
                                    double endParam = 6.283185307179586,
                                    const AttributeSet& attribs = AttributeSet());

    // ---- Quadrilaterals ---------------------------------------------

    /// SOLID from 3 or 4 points; vertex slots vtx0..vtx3 are computed
    Result<EntityHandle> addSolid(const QVector<Vec3>& points,
                                  const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addTrace(const QVector<Vec3>& points,
                                  const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> add3dFace(const QVector<Vec3>& points,
                                   const AttributeSet& attribs = AttributeSet());

    // ---- Text and blocks --------------------------------------------

    Result<EntityHandle> addText(const QString& text, const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addMText(const QString& text, const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addShape(const QString& name, const Vec3& insert, double size = 1.0,
                                  const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addAttrib(const QString& tag, const QString& text, const Vec3& insert,
                                   const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addBlockRef(const QString& name, const Vec3& insert,
                                     const AttributeSet& attribs = AttributeSet());

    /// Reference to block `name` wrapped in a new anonymous block,
    /// with one ATTRIB per ATTDEF filled from `values` (tag -> text).
    /// Returns the handle of the INSERT of the anonymous block.
    Result<EntityHandle> addAutoBlockRef(const QString& name, const Vec3& insert,
                                         const QMap<QString, QString>& values,
                                         const AttributeSet& attribs = AttributeSet());

    // ---- Polylines --------------------------------------------------

    /// 2D POLYLINE.  A boolean "closed" attribute is consumed and
    /// sets the closed flag.
    Result<EntityHandle> addPolyline2d(const QVector<Vec3>& points,
                                       const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addPolyline3d(const QVector<Vec3>& points,
                                       const AttributeSet& attribs = AttributeSet());

    /// M x N polygon mesh, sizes clamped to at least 2.  Boolean
    /// "m_close" and "n_close" attributes are consumed.
    Result<EntityHandle> addPolymesh(int mCount = 3, int nCount = 3,
                                     const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addPolyface(const AttributeSet& attribs = AttributeSet());

    /// LWPOLYLINE (R2000+).  Each point is a value tuple ordered by
    /// `format` (see lwpolylineVertices()).
    Result<EntityHandle> addLWPolyline(const QVector<QVector<double>>& points,
                                       const QString& format = QStringLiteral("xyseb"),
                                       const AttributeSet& attribs = AttributeSet());

    Result<EntityHandle> addRay(const Vec3& start, const Vec3& unitVector,
                                const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addXLine(const Vec3& start, const Vec3& unitVector,
                                  const AttributeSet& attribs = AttributeSet());

    // ---- Splines (R2000+) -------------------------------------------

    /// SPLINE defined by fit points only; the CAD application computes
    /// the curve.  Empty fit points create an empty spline.
    Result<EntityHandle> addSpline(const QVector<Vec3>& fitPoints = QVector<Vec3>(),
                                   int degree = 3,
                                   const AttributeSet& attribs = AttributeSet());

    /// Open spline interpolating the fit points.  Options default to
    /// the configured degree, method and power.
    Result<EntityHandle> addSplineControlFrame(const QVector<Vec3>& fitPoints,
                                               std::optional<geometry::FitOptions> options = std::nullopt,
                                               const AttributeSet& attribs = AttributeSet());

    /// Closed periodic spline interpolating the fit points
    Result<EntityHandle> addClosedSplineControlFrame(const QVector<Vec3>& fitPoints,
                                                     std::optional<geometry::FitOptions> options = std::nullopt,
                                                     const AttributeSet& attribs = AttributeSet());

    /// Open spline approximating the fit points with `count` control
    /// points
    Result<EntityHandle> addSplineApprox(const QVector<Vec3>& fitPoints, int count,
                                         std::optional<geometry::FitOptions> options = std::nullopt,
                                         const AttributeSet& attribs = AttributeSet());

    /// Open uniform spline.  Non-empty `knots` replace the computed
    /// knot vector and must hold control points + degree + 1 values.
    Result<EntityHandle> addOpenSpline(const QVector<Vec3>& controlPoints, int degree = 3,
                                       const QVector<double>& knots = QVector<double>(),
                                       const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addClosedSpline(const QVector<Vec3>& controlPoints, int degree = 3,
                                         const QVector<double>& knots = QVector<double>(),
                                         const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addRationalSpline(const QVector<Vec3>& controlPoints,
                                           const QVector<double>& weights, int degree = 3,
                                           const QVector<double>& knots = QVector<double>(),
                                           const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addClosedRationalSpline(const QVector<Vec3>& controlPoints,
                                                 const QVector<double>& weights, int degree = 3,
                                                 const QVector<double>& knots = QVector<double>(),
                                                 const AttributeSet& attribs = AttributeSet());

    // ---- ACIS entities ----------------------------------------------
    // The ACIS text lines are stored as-is under "acis_data".

    Result<EntityHandle> addBody(const QStringList& acisData = QStringList(),
                                 const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addRegion(const QStringList& acisData = QStringList(),
                                   const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> add3dSolid(const QStringList& acisData = QStringList(),
                                    const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addSurface(const QStringList& acisData = QStringList(),
                                    const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addExtrudedSurface(const QStringList& acisData = QStringList(),
                                            const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addLoftedSurface(const QStringList& acisData = QStringList(),
                                          const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addRevolvedSurface(const QStringList& acisData = QStringList(),
                                            const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addSweptSurface(const QStringList& acisData = QStringList(),
                                         const AttributeSet& attribs = AttributeSet());

    // ---- Hatch, mesh, raster ----------------------------------------

    /// Solid filled HATCH, color defaults to the configured one
    Result<EntityHandle> addHatch(std::optional<int> color = std::nullopt,
                                  const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addMesh(const AttributeSet& attribs = AttributeSet());

    /// IMAGE of an existing IMAGEDEF, scaled to `sizeInUnits` and
    /// rotated by `rotation` degrees.  An IMAGEDEF_REACTOR links image
    /// and definition.
    Result<EntityHandle> addImage(const EntityHandle& imageDef, const Vec3& insert,
                                  const QSizeF& sizeInUnits, double rotation = 0.0,
                                  const AttributeSet& attribs = AttributeSet());

    /// PDF, DWF or DGN underlay, the type follows the definition
    Result<EntityHandle> addUnderlay(const EntityHandle& underlayDef,
                                     const Vec3& insert = Vec3(),
                                     const Vec3& scale = Vec3(1.0, 1.0, 1.0),
                                     double rotation = 0.0,
                                     const AttributeSet& attribs = AttributeSet());
    Result<EntityHandle> addUnderlay(const EntityHandle& underlayDef, const Vec3& insert,
                                     double uniformScale, double rotation = 0.0,
                                     const AttributeSet& attribs = AttributeSet());

    // ---- Dimensions -------------------------------------------------
    // An empty dimstyle selects the configured default style.

    /// Horizontal, vertical or rotated linear dimension.  Render the
    /// result explicitly.
    Result<DimStyleOverride> addLinearDim(const LinearGeometry& geometry,
                                          const QString& text = QStringLiteral("<>"),
                                          const QString& dimstyle = QString(),
                                          const AttributeSet& overrides = AttributeSet(),
                                          const AttributeSet& attribs = AttributeSet());

    /// Linear dimension parallel to p1 -> p2, `distance` away
    Result<DimStyleOverride> addAlignedDim(const Vec3& p1, const Vec3& p2, double distance,
                                           const QString& text = QStringLiteral("<>"),
                                           const QString& dimstyle = QString(),
                                           const AttributeSet& overrides = AttributeSet(),
                                           const AttributeSet& attribs = AttributeSet());

    /// Chain of linear dimensions along `points`, rendered at once.
    /// Needs a dimension renderer.
    Result<QVector<EntityHandle>> addMultiPointLinearDim(const Vec3& base,
                                                         const QVector<Vec3>& points,
                                                         double angle = 0.0,
                                                         bool avoidDoubleRendering = true,
                                                         const QString& dimstyle = QString(),
                                                         const AttributeSet& overrides = AttributeSet(),
                                                         const AttributeSet& attribs = AttributeSet(),
                                                         bool discard = false);

    Result<DimStyleOverride> addAngularDim(const AttributeSet& overrides = AttributeSet(),
                                           const AttributeSet& attribs = AttributeSet());
    Result<DimStyleOverride> addDiameterDim(const AttributeSet& overrides = AttributeSet(),
                                            const AttributeSet& attribs = AttributeSet());
    Result<DimStyleOverride> addRadiusDim(const AttributeSet& overrides = AttributeSet(),
                                          const AttributeSet& attribs = AttributeSet());
    Result<DimStyleOverride> addAngular3PDim(const AttributeSet& overrides = AttributeSet(),
                                             const AttributeSet& attribs = AttributeSet());
    Result<DimStyleOverride> addOrdinateDim(const AttributeSet& overrides = AttributeSet(),
                                            const AttributeSet& attribs = AttributeSet());

    // ---- Arrows -----------------------------------------------------

    /// Draw an arrow symbol; returns the dimension line connection point
    Result<Vec3> addArrow(const QString& name, const Vec3& insert, double size = 1.0,
                          double rotation = 0.0, const AttributeSet& attribs = AttributeSet());

    /// Insert an arrow symbol block; returns the connection point
    Result<Vec3> addArrowBlockRef(const QString& name, const Vec3& insert, double size = 1.0,
                                  double rotation = 0.0, const AttributeSet& attribs = AttributeSet());

private:
    Error checkVersion(EntityType type) const;
    Result<EntityHandle> create(EntityType type, const AttributeSet& attribs);
    Result<EntityHandle> addQuadrilateral(EntityType type, const QVector<Vec3>& points,
                                          const AttributeSet& attribs);
    Result<EntityHandle> addAcisEntity(EntityType type, const QStringList& acisData,
                                       const AttributeSet& attribs);
    Result<EntityHandle> addSplineFrame(const geometry::ControlFrame& frame,
                                        const QVector<double>& knots,
                                        const AttributeSet& attribs);
    Result<DimStyleOverride> addDimension(const DimensionRequest& request);
    Result<DimStyleOverride> addDimensionKind(DimensionKind kind, const AttributeSet& overrides,
                                              const AttributeSet& attribs);
    QString dimstyleOrDefault(const QString& dimstyle) const;

    EntityDatabase& m_database;
    BlockTable* m_blocks = nullptr;
    DimensionRenderer* m_renderer = nullptr;
    ArrowLibrary* m_arrows = nullptr;
    FactoryConfig m_config;
};

}  // namespace dxf
}  // namespace draftcore

#endif  // DRAFTCORE_DXF_FACTORY_H
