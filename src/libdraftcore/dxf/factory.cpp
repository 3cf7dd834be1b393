// =====================================================================
//  src/libdraftcore/dxf/factory.cpp — Entity factory
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/dxf/factory.h>

#include <draftcore/dxf/autoblock.h>
#include <draftcore/dxf/versiongate.h>
#include <draftcore/geometry/quadrilateral.h>

#include "../logging.h"

#include <QtMath>

#include <cmath>

namespace draftcore {
namespace dxf {

namespace {

const QString FLAGS = QStringLiteral("flags");

template <typename T>
Result<T> rejected(const Error& error)
{
    qCWarning(lcFactory) << "Rejected:" << error.toString();
    return Result<T>::fail(error);
}

/// Remove a boolean attribute and return its value
bool takeBool(AttributeSet& attribs, const QString& key)
{
    auto value = attribs.take(key);
    if (!value) {
        return false;
    }
    if (const bool* b = std::get_if<bool>(&*value)) {
        return *b;
    }
    if (const int* i = std::get_if<int>(&*value)) {
        return *i != 0;
    }
    return false;
}

double round6(double value)
{
    return std::round(value * 1e6) / 1e6;
}

Vec3 pixelVector(double unitsPerPixel, double angleRad)
{
    return Vec3(round6(std::cos(angleRad) * unitsPerPixel),
                round6(std::sin(angleRad) * unitsPerPixel),
                0.0);
}

std::optional<EntityType> underlayType(const QString& definitionType)
{
    if (definitionType == QLatin1String("PDFDEFINITION")) return EntityType::PdfUnderlay;
    if (definitionType == QLatin1String("DWFDEFINITION")) return EntityType::DwfUnderlay;
    if (definitionType == QLatin1String("DGNDEFINITION")) return EntityType::DgnUnderlay;
    return std::nullopt;
}

}  // namespace

EntityFactory::EntityFactory(EntityDatabase& database, BlockTable* blocks, FactoryConfig config)
    : m_database(database)
    , m_blocks(blocks)
    , m_config(std::move(config))
{
}

// =====================================================================
//  Internals
// =====================================================================

Error EntityFactory::checkVersion(EntityType type) const
{
    return requireVersion(type, m_config.dxfVersion);
}

Result<EntityHandle> EntityFactory::create(EntityType type, const AttributeSet& attribs)
{
    const QString dxfType = dxfTypeName(type);
    const EntityHandle handle = m_database.createEntity(dxfType, attribs);
    qCDebug(lcFactory) << "Created" << dxfType << handle;
    return Result<EntityHandle>::ok(handle);
}

QString EntityFactory::dimstyleOrDefault(const QString& dimstyle) const
{
    return dimstyle.isEmpty() ? m_config.dimstyle : dimstyle;
}

// =====================================================================
//  Basic entities
// =====================================================================

Result<EntityHandle> EntityFactory::addPoint(const Vec3& location, const AttributeSet& attribs)
{
    AttributeSet a = assemble(defaultAttributes(EntityType::Point), attribs);
    a.set(QStringLiteral("location"), location);
    return create(EntityType::Point, a);
}

Result<EntityHandle> EntityFactory::addLine(const Vec3& start, const Vec3& end,
                                            const AttributeSet& attribs)
{
    AttributeSet a = assemble(defaultAttributes(EntityType::Line), attribs);
    a.set(QStringLiteral("start"), start);
    a.set(QStringLiteral("end"), end);
    return create(EntityType::Line, a);
}

Result<EntityHandle> EntityFactory::addCircle(const Vec3& center, double radius,
                                              const AttributeSet& attribs)
{
    AttributeSet a = assemble(defaultAttributes(EntityType::Circle), attribs);
    a.set(QStringLiteral("center"), center);
    a.set(QStringLiteral("radius"), radius);
    return create(EntityType::Circle, a);
}

Result<EntityHandle> EntityFactory::addArc(const Vec3& center, double radius,
                                           double startAngle, double endAngle,
                                           bool counterClockwise, const AttributeSet& attribs)
{
    AttributeSet a = assemble(defaultAttributes(EntityType::Arc), attribs);
    a.set(QStringLiteral("center"), center);
    a.set(QStringLiteral("radius"), radius);
    a.set(QStringLiteral("start_angle"), counterClockwise ? startAngle : endAngle);
    a.set(QStringLiteral("end_angle"), counterClockwise ? endAngle : startAngle);
    return create(EntityType::Arc, a);
}

Result<EntityHandle> EntityFactory::addEllipse(const Vec3& center, const Vec3& majorAxis,
                                               double ratio, double startParam, double endParam,
                                               const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Ellipse);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    if (!(ratio > 0.0 && ratio <= 1.0)) {
        return rejected<EntityHandle>(
            Error::value(QStringLiteral("ratio"), QStringLiteral("must be in (0, 1]")));
    }

    AttributeSet a = assemble(defaultAttributes(EntityType::Ellipse), attribs);
    a.set(QStringLiteral("center"), center);
    a.set(QStringLiteral("major_axis"), majorAxis);
    a.set(QStringLiteral("ratio"), ratio);
    a.set(QStringLiteral("start_param"), startParam);
    a.set(QStringLiteral("end_param"), endParam);
    return create(EntityType::Ellipse, a);
}

// =====================================================================
//  Quadrilaterals
// =====================================================================

Result<EntityHandle> EntityFactory::addQuadrilateral(EntityType type, const QVector<Vec3>& points,
                                                     const AttributeSet& attribs)
{
    auto quad = geometry::normalizeQuadrilateral(points);
    if (!quad.success) {
        return rejected<EntityHandle>(quad.error);
    }

    AttributeSet a = assemble(defaultAttributes(type), attribs);
    for (int i = 0; i < 4; ++i) {
        a.set(QStringLiteral("vtx%1").arg(i), quad.value[i]);
    }
    return create(type, a);
}

Result<EntityHandle> EntityFactory::addSolid(const QVector<Vec3>& points, const AttributeSet& attribs)
{
    return addQuadrilateral(EntityType::Solid, points, attribs);
}

Result<EntityHandle> EntityFactory::addTrace(const QVector<Vec3>& points, const AttributeSet& attribs)
{
    return addQuadrilateral(EntityType::Trace, points, attribs);
}

Result<EntityHandle> EntityFactory::add3dFace(const QVector<Vec3>& points, const AttributeSet& attribs)
{
    return addQuadrilateral(EntityType::Face3d, points, attribs);
}

// =====================================================================
//  Text and blocks
// =====================================================================

Result<EntityHandle> EntityFactory::addText(const QString& text, const AttributeSet& attribs)
{
    AttributeSet a = assemble(defaultAttributes(EntityType::Text), attribs);
    a.set(QStringLiteral("text"), text);
    return create(EntityType::Text, a);
}

Result<EntityHandle> EntityFactory::addMText(const QString& text, const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::MText);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    AttributeSet a = assemble(defaultAttributes(EntityType::MText), attribs);
    a.set(QStringLiteral("text"), text);
    return create(EntityType::MText, a);
}

Result<EntityHandle> EntityFactory::addShape(const QString& name, const Vec3& insert, double size,
                                             const AttributeSet& attribs)
{
    AttributeSet a = assemble(defaultAttributes(EntityType::Shape), attribs);
    a.set(QStringLiteral("name"), name);
    a.set(QStringLiteral("insert"), insert);
    a.set(QStringLiteral("size"), size);
    return create(EntityType::Shape, a);
}

Result<EntityHandle> EntityFactory::addAttrib(const QString& tag, const QString& text,
                                              const Vec3& insert, const AttributeSet& attribs)
{
    AttributeSet a = assemble(defaultAttributes(EntityType::Attrib), attribs);
    a.set(QStringLiteral("tag"), tag);
    a.set(QStringLiteral("text"), text);
    a.set(QStringLiteral("insert"), insert);
    return create(EntityType::Attrib, a);
}

Result<EntityHandle> EntityFactory::addBlockRef(const QString& name, const Vec3& insert,
                                                const AttributeSet& attribs)
{
    AttributeSet a = assemble(defaultAttributes(EntityType::Insert), attribs);
    a.set(QStringLiteral("name"), name);
    a.set(QStringLiteral("insert"), insert);
    return create(EntityType::Insert, a);
}

Result<EntityHandle> EntityFactory::addAutoBlockRef(const QString& name, const Vec3& insert,
                                                    const QMap<QString, QString>& values,
                                                    const AttributeSet& attribs)
{
    if (!m_blocks) {
        return rejected<EntityHandle>(
            Error::value(QStringLiteral("blocks"), QStringLiteral("no block table available")));
    }
    if (!m_blocks->hasBlock(name)) {
        return rejected<EntityHandle>(
            Error::value(QStringLiteral("name"), QStringLiteral("unknown block '%1'").arg(name)));
    }

    BlockDefinition block;
    block.name = name;
    block.basePoint = m_blocks->basePoint(name);
    block.attributeDefinitions = m_blocks->attributeDefinitions(name);

    const QString anonymous = m_blocks->newAnonymousBlock();
    const AutoBlockRequest request = composeAutoBlockRef(block, anonymous, insert, values, attribs);

    EntityDatabase& space = m_blocks->database(anonymous);
    const QString insertType = dxfTypeName(EntityType::Insert);
    const EntityHandle inner = space.createEntity(insertType, request.inner.insertAttributes);
    for (AttributeSet attrib : request.inner.attribs) {
        attrib.set(QStringLiteral("owner"), inner);
        space.createEntity(dxfTypeName(EntityType::Attrib), attrib);
    }
    qCDebug(lcFactory) << "Auto block" << anonymous << "wraps" << name
                       << "with" << request.inner.attribs.size() << "attributes";

    return create(EntityType::Insert, request.outer.insertAttributes);
}

// =====================================================================
//  Polylines
// =====================================================================

Result<EntityHandle> EntityFactory::addPolyline2d(const QVector<Vec3>& points,
                                                  const AttributeSet& attribs)
{
    AttributeSet overrides = attribs;
    const bool closed = takeBool(overrides, QStringLiteral("closed"));

    AttributeSet a = assemble(defaultAttributes(EntityType::Polyline), overrides, { FLAGS });
    if (closed) {
        a.orFlags(FLAGS, int(PolylineFlag::Closed));
    }
    a.set(QStringLiteral("vertices"), points);
    return create(EntityType::Polyline, a);
}

Result<EntityHandle> EntityFactory::addPolyline3d(const QVector<Vec3>& points,
                                                  const AttributeSet& attribs)
{
    AttributeSet overrides = attribs;
    overrides.orFlags(FLAGS, int(PolylineFlag::Polyline3d));
    return addPolyline2d(points, overrides);
}

Result<EntityHandle> EntityFactory::addPolymesh(int mCount, int nCount, const AttributeSet& attribs)
{
    AttributeSet overrides = attribs;
    const bool mClose = takeBool(overrides, QStringLiteral("m_close"));
    const bool nClose = takeBool(overrides, QStringLiteral("n_close"));
    const int m = qMax(2, mCount);
    const int n = qMax(2, nCount);

    AttributeSet a = assemble(defaultAttributes(EntityType::Polyline), overrides, { FLAGS });
    PolylineFlags flags = PolylineFlag::Polymesh;
    if (mClose) flags |= PolylineFlag::MClosed;
    if (nClose) flags |= PolylineFlag::MeshClosedN;
    a.orFlags(FLAGS, flags.toInt());
    a.set(QStringLiteral("m_count"), m);
    a.set(QStringLiteral("n_count"), n);
    a.set(QStringLiteral("vertices"), QVector<Vec3>(m * n, Vec3()));
    return create(EntityType::Polyline, a);
}

Result<EntityHandle> EntityFactory::addPolyface(const AttributeSet& attribs)
{
    AttributeSet overrides = attribs;
    const bool mClose = takeBool(overrides, QStringLiteral("m_close"));
    const bool nClose = takeBool(overrides, QStringLiteral("n_close"));

    AttributeSet a = assemble(defaultAttributes(EntityType::Polyline), overrides, { FLAGS });
    PolylineFlags flags = PolylineFlag::Polyface;
    if (mClose) flags |= PolylineFlag::MClosed;
    if (nClose) flags |= PolylineFlag::MeshClosedN;
    a.orFlags(FLAGS, flags.toInt());
    return create(EntityType::Polyline, a);
}

Result<EntityHandle> EntityFactory::addLWPolyline(const QVector<QVector<double>>& points,
                                                  const QString& format,
                                                  const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::LWPolyline);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    auto vertices = lwpolylineVertices(points, format);
    if (!vertices.success) {
        return rejected<EntityHandle>(vertices.error);
    }

    AttributeSet overrides = attribs;
    const bool closed = takeBool(overrides, QStringLiteral("closed"));
    AttributeSet a = assemble(defaultAttributes(EntityType::LWPolyline), overrides, { FLAGS });
    if (closed) {
        a.orFlags(FLAGS, int(PolylineFlag::Closed));
    }
    a.set(QStringLiteral("points"), vertices.value);
    return create(EntityType::LWPolyline, a);
}

Result<EntityHandle> EntityFactory::addRay(const Vec3& start, const Vec3& unitVector,
                                           const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Ray);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    AttributeSet a = assemble(defaultAttributes(EntityType::Ray), attribs);
    a.set(QStringLiteral("start"), start);
    a.set(QStringLiteral("unit_vector"), unitVector);
    return create(EntityType::Ray, a);
}

Result<EntityHandle> EntityFactory::addXLine(const Vec3& start, const Vec3& unitVector,
                                             const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::XLine);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    AttributeSet a = assemble(defaultAttributes(EntityType::XLine), attribs);
    a.set(QStringLiteral("start"), start);
    a.set(QStringLiteral("unit_vector"), unitVector);
    return create(EntityType::XLine, a);
}

// =====================================================================
//  Splines
// =====================================================================

Result<EntityHandle> EntityFactory::addSpline(const QVector<Vec3>& fitPoints, int degree,
                                              const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Spline);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    AttributeSet a = assemble(defaultAttributes(EntityType::Spline), attribs, { FLAGS });
    a.remove(QStringLiteral("weights"));
    a.set(QStringLiteral("degree"), degree);
    if (!fitPoints.isEmpty()) {
        a.set(QStringLiteral("fit_points"), fitPoints);
    }
    return create(EntityType::Spline, a);
}

Result<EntityHandle> EntityFactory::addSplineFrame(const geometry::ControlFrame& frame,
                                                   const QVector<double>& knots,
                                                   const AttributeSet& attribs)
{
    geometry::ControlFrame stored = frame;
    if (!knots.isEmpty()) {
        const int expected = frame.controlPoints.size() + frame.order();
        if (knots.size() != expected) {
            return rejected<EntityHandle>(Error::value(
                QStringLiteral("knots"),
                QStringLiteral("expected %1 knot values, got %2").arg(expected).arg(knots.size())));
        }
        stored.knots = knots;
    }
    if (!stored.isValid()) {
        return rejected<EntityHandle>(Error::value(
            QStringLiteral("knots"), QStringLiteral("knot values must be non-decreasing")));
    }

    SplineFlags flags;
    if (frame.closed) flags |= SplineFlag::Closed | SplineFlag::Periodic;
    if (frame.isRational()) flags |= SplineFlag::Rational;

    AttributeSet a = assemble(defaultAttributes(EntityType::Spline), attribs, { FLAGS });
    a.orFlags(FLAGS, flags.toInt());
    a.set(QStringLiteral("degree"), frame.degree);
    a.set(QStringLiteral("control_points"), frame.controlPoints);
    a.set(QStringLiteral("knots"), stored.knots);
    if (stored.isRational()) {
        a.set(QStringLiteral("weights"), stored.weights);
    } else {
        a.remove(QStringLiteral("weights"));
    }
    return create(EntityType::Spline, a);
}

Result<EntityHandle> EntityFactory::addSplineControlFrame(const QVector<Vec3>& fitPoints,
                                                          std::optional<geometry::FitOptions> options,
                                                          const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Spline);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    auto frame = geometry::buildOpen(fitPoints, options.value_or(m_config.fit));
    if (!frame.success) {
        return rejected<EntityHandle>(frame.error);
    }
    return addSplineFrame(frame.value, QVector<double>(), attribs);
}

Result<EntityHandle> EntityFactory::addClosedSplineControlFrame(const QVector<Vec3>& fitPoints,
                                                                std::optional<geometry::FitOptions> options,
                                                                const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Spline);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    auto frame = geometry::buildClosed(fitPoints, options.value_or(m_config.fit));
    if (!frame.success) {
        return rejected<EntityHandle>(frame.error);
    }
    return addSplineFrame(frame.value, QVector<double>(), attribs);
}

Result<EntityHandle> EntityFactory::addSplineApprox(const QVector<Vec3>& fitPoints, int count,
                                                    std::optional<geometry::FitOptions> options,
                                                    const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Spline);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    auto frame = geometry::approximate(fitPoints, count, options.value_or(m_config.fit));
    if (!frame.success) {
        return rejected<EntityHandle>(frame.error);
    }
    return addSplineFrame(frame.value, QVector<double>(), attribs);
}

Result<EntityHandle> EntityFactory::addOpenSpline(const QVector<Vec3>& controlPoints, int degree,
                                                  const QVector<double>& knots,
                                                  const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Spline);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    auto frame = geometry::openUniformFrame(controlPoints, degree);
    if (!frame.success) {
        return rejected<EntityHandle>(frame.error);
    }
    return addSplineFrame(frame.value, knots, attribs);
}

Result<EntityHandle> EntityFactory::addClosedSpline(const QVector<Vec3>& controlPoints, int degree,
                                                    const QVector<double>& knots,
                                                    const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Spline);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    auto frame = geometry::closedUniformFrame(controlPoints, degree);
    if (!frame.success) {
        return rejected<EntityHandle>(frame.error);
    }
    return addSplineFrame(frame.value, knots, attribs);
}

Result<EntityHandle> EntityFactory::addRationalSpline(const QVector<Vec3>& controlPoints,
                                                      const QVector<double>& weights, int degree,
                                                      const QVector<double>& knots,
                                                      const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Spline);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    auto frame = geometry::buildOpenRational(controlPoints, weights, degree);
    if (!frame.success) {
        return rejected<EntityHandle>(frame.error);
    }
    return addSplineFrame(frame.value, knots, attribs);
}

Result<EntityHandle> EntityFactory::addClosedRationalSpline(const QVector<Vec3>& controlPoints,
                                                            const QVector<double>& weights, int degree,
                                                            const QVector<double>& knots,
                                                            const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Spline);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    auto frame = geometry::buildClosedRational(controlPoints, weights, degree);
    if (!frame.success) {
        return rejected<EntityHandle>(frame.error);
    }
    return addSplineFrame(frame.value, knots, attribs);
}

// =====================================================================
//  ACIS entities
// =====================================================================

Result<EntityHandle> EntityFactory::addAcisEntity(EntityType type, const QStringList& acisData,
                                                  const AttributeSet& attribs)
{
    const Error gate = checkVersion(type);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    AttributeSet a = assemble(defaultAttributes(type), attribs);
    if (!acisData.isEmpty()) {
        a.set(QStringLiteral("acis_data"), acisData);
    }
    return create(type, a);
}

Result<EntityHandle> EntityFactory::addBody(const QStringList& acisData, const AttributeSet& attribs)
{
    return addAcisEntity(EntityType::Body, acisData, attribs);
}

Result<EntityHandle> EntityFactory::addRegion(const QStringList& acisData, const AttributeSet& attribs)
{
    return addAcisEntity(EntityType::Region, acisData, attribs);
}

Result<EntityHandle> EntityFactory::add3dSolid(const QStringList& acisData, const AttributeSet& attribs)
{
    return addAcisEntity(EntityType::Solid3d, acisData, attribs);
}

Result<EntityHandle> EntityFactory::addSurface(const QStringList& acisData, const AttributeSet& attribs)
{
    return addAcisEntity(EntityType::Surface, acisData, attribs);
}

Result<EntityHandle> EntityFactory::addExtrudedSurface(const QStringList& acisData,
                                                       const AttributeSet& attribs)
{
    return addAcisEntity(EntityType::ExtrudedSurface, acisData, attribs);
}

Result<EntityHandle> EntityFactory::addLoftedSurface(const QStringList& acisData,
                                                     const AttributeSet& attribs)
{
    return addAcisEntity(EntityType::LoftedSurface, acisData, attribs);
}

Result<EntityHandle> EntityFactory::addRevolvedSurface(const QStringList& acisData,
                                                       const AttributeSet& attribs)
{
    return addAcisEntity(EntityType::RevolvedSurface, acisData, attribs);
}

Result<EntityHandle> EntityFactory::addSweptSurface(const QStringList& acisData,
                                                    const AttributeSet& attribs)
{
    return addAcisEntity(EntityType::SweptSurface, acisData, attribs);
}

// =====================================================================
//  Hatch, mesh, raster
// =====================================================================

Result<EntityHandle> EntityFactory::addHatch(std::optional<int> color, const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Hatch);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    AttributeSet a = assemble(defaultAttributes(EntityType::Hatch), attribs);
    a.set(QStringLiteral("solid_fill"), 1);
    a.set(QStringLiteral("color"), color.value_or(m_config.hatchColor));
    a.set(QStringLiteral("pattern_name"), QStringLiteral("SOLID"));
    return create(EntityType::Hatch, a);
}

Result<EntityHandle> EntityFactory::addMesh(const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Mesh);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    return create(EntityType::Mesh, assemble(defaultAttributes(EntityType::Mesh), attribs));
}

Result<EntityHandle> EntityFactory::addImage(const EntityHandle& imageDef, const Vec3& insert,
                                             const QSizeF& sizeInUnits, double rotation,
                                             const AttributeSet& attribs)
{
    const Error gate = checkVersion(EntityType::Image);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    if (m_database.entityType(imageDef).isEmpty()) {
        return rejected<EntityHandle>(Error::value(
            QStringLiteral("image_def"), QStringLiteral("unknown image definition '%1'").arg(imageDef)));
    }

    const Vec3 pixels = m_database.entityAttributes(imageDef).get<Vec3>(QStringLiteral("image_size"));
    if (pixels.x <= 0.0 || pixels.y <= 0.0) {
        return rejected<EntityHandle>(Error::value(
            QStringLiteral("image_size"), QStringLiteral("image definition has no pixel size")));
    }

    const double uAngle = qDegreesToRadians(rotation);
    const double vAngle = uAngle + M_PI / 2.0;

    AttributeSet a = assemble(defaultAttributes(EntityType::Image), attribs);
    a.set(QStringLiteral("insert"), insert);
    a.set(QStringLiteral("u_pixel"), pixelVector(sizeInUnits.width() / pixels.x, uAngle));
    a.set(QStringLiteral("v_pixel"), pixelVector(sizeInUnits.height() / pixels.y, vAngle));
    a.set(QStringLiteral("image_def_handle"), imageDef);
    a.set(QStringLiteral("image_size"), pixels);

    auto image = create(EntityType::Image, a);
    const EntityHandle reactor = m_database.addImageDefReactor(image.value);

    AttributeSet link;
    link.set(QStringLiteral("image_def_reactor_handle"), reactor);
    m_database.updateEntity(image.value, link);
    m_database.appendReactor(imageDef, reactor);
    return image;
}

Result<EntityHandle> EntityFactory::addUnderlay(const EntityHandle& underlayDef, const Vec3& insert,
                                                const Vec3& scale, double rotation,
                                                const AttributeSet& attribs)
{
    // All underlay kinds share one minimum version
    const Error gate = checkVersion(EntityType::PdfUnderlay);
    if (gate.isError()) {
        return rejected<EntityHandle>(gate);
    }
    const auto type = underlayType(m_database.entityType(underlayDef));
    if (!type) {
        return rejected<EntityHandle>(Error::value(
            QStringLiteral("underlay_def"),
            QStringLiteral("unknown underlay definition '%1'").arg(underlayDef)));
    }

    AttributeSet a = assemble(defaultAttributes(*type), attribs);
    a.set(QStringLiteral("insert"), insert);
    a.set(QStringLiteral("underlay_def_handle"), underlayDef);
    a.set(QStringLiteral("rotation"), rotation);
    a.set(QStringLiteral("scale_x"), scale.x);
    a.set(QStringLiteral("scale_y"), scale.y);
    a.set(QStringLiteral("scale_z"), scale.z);

    auto underlay = create(*type, a);
    m_database.appendReactor(underlayDef, underlay.value);
    return underlay;
}

Result<EntityHandle> EntityFactory::addUnderlay(const EntityHandle& underlayDef, const Vec3& insert,
                                                double uniformScale, double rotation,
                                                const AttributeSet& attribs)
{
    return addUnderlay(underlayDef, insert, Vec3(uniformScale, uniformScale, uniformScale),
                       rotation, attribs);
}

// =====================================================================
//  Dimensions
// =====================================================================

Result<DimStyleOverride> EntityFactory::addDimension(const DimensionRequest& request)
{
    const Error gate = checkVersion(EntityType::Dimension);
    if (gate.isError()) {
        return rejected<DimStyleOverride>(gate);
    }
    auto handle = create(EntityType::Dimension, request.toAttributes());
    return Result<DimStyleOverride>::ok(DimStyleOverride(handle.value, request, &m_database));
}

Result<DimStyleOverride> EntityFactory::addLinearDim(const LinearGeometry& geometry,
                                                     const QString& text, const QString& dimstyle,
                                                     const AttributeSet& overrides,
                                                     const AttributeSet& attribs)
{
    return addDimension(resolveLinear(geometry, text, dimstyleOrDefault(dimstyle), overrides, attribs));
}

Result<DimStyleOverride> EntityFactory::addAlignedDim(const Vec3& p1, const Vec3& p2, double distance,
                                                      const QString& text, const QString& dimstyle,
                                                      const AttributeSet& overrides,
                                                      const AttributeSet& attribs)
{
    auto request = resolveAligned(p1, p2, distance, text, dimstyleOrDefault(dimstyle), overrides, attribs);
    if (!request.success) {
        return rejected<DimStyleOverride>(request.error);
    }
    return addDimension(request.value);
}

Result<QVector<EntityHandle>> EntityFactory::addMultiPointLinearDim(const Vec3& base,
                                                                    const QVector<Vec3>& points,
                                                                    double angle,
                                                                    bool avoidDoubleRendering,
                                                                    const QString& dimstyle,
                                                                    const AttributeSet& overrides,
                                                                    const AttributeSet& attribs,
                                                                    bool discard)
{
    if (!m_renderer) {
        return rejected<QVector<EntityHandle>>(
            Error::value(QStringLiteral("renderer"), QStringLiteral("no dimension renderer available")));
    }
    auto requests = resolveMultiPointLinear(base, points, angle, avoidDoubleRendering,
                                            dimstyleOrDefault(dimstyle), overrides, attribs);
    if (!requests.success) {
        return rejected<QVector<EntityHandle>>(requests.error);
    }

    QVector<EntityHandle> handles;
    for (const DimensionRequest& request : requests.value) {
        auto style = addDimension(request);
        if (!style.success) {
            return Result<QVector<EntityHandle>>::fail(style.error);
        }
        style.value.render(*m_renderer, discard);
        handles.append(style.value.handle());
    }
    return Result<QVector<EntityHandle>>::ok(handles);
}

Result<DimStyleOverride> EntityFactory::addDimensionKind(DimensionKind kind,
                                                         const AttributeSet& overrides,
                                                         const AttributeSet& attribs)
{
    return addDimension(resolveKind(kind, m_config.dimstyle, overrides, attribs));
}

Result<DimStyleOverride> EntityFactory::addAngularDim(const AttributeSet& overrides,
                                                      const AttributeSet& attribs)
{
    return addDimensionKind(DimensionKind::Angular, overrides, attribs);
}

Result<DimStyleOverride> EntityFactory::addDiameterDim(const AttributeSet& overrides,
                                                       const AttributeSet& attribs)
{
    return addDimensionKind(DimensionKind::Diameter, overrides, attribs);
}

Result<DimStyleOverride> EntityFactory::addRadiusDim(const AttributeSet& overrides,
                                                     const AttributeSet& attribs)
{
    return addDimensionKind(DimensionKind::Radius, overrides, attribs);
}

Result<DimStyleOverride> EntityFactory::addAngular3PDim(const AttributeSet& overrides,
                                                        const AttributeSet& attribs)
{
    return addDimensionKind(DimensionKind::Angular3P, overrides, attribs);
}

Result<DimStyleOverride> EntityFactory::addOrdinateDim(const AttributeSet& overrides,
                                                       const AttributeSet& attribs)
{
    return addDimensionKind(DimensionKind::Ordinate, overrides, attribs);
}

// =====================================================================
//  Arrows
// =====================================================================

Result<Vec3> EntityFactory::addArrow(const QString& name, const Vec3& insert, double size,
                                     double rotation, const AttributeSet& attribs)
{
    if (!m_arrows) {
        return rejected<Vec3>(
            Error::value(QStringLiteral("arrows"), QStringLiteral("no arrow library available")));
    }
    return Result<Vec3>::ok(m_arrows->renderArrow(m_database, name, insert, size, rotation, attribs));
}

Result<Vec3> EntityFactory::addArrowBlockRef(const QString& name, const Vec3& insert, double size,
                                             double rotation, const AttributeSet& attribs)
{
    if (!m_arrows) {
        return rejected<Vec3>(
            Error::value(QStringLiteral("arrows"), QStringLiteral("no arrow library available")));
    }
    return Result<Vec3>::ok(m_arrows->insertArrow(m_database, name, insert, size, rotation, attribs));
}

}  // namespace dxf
}  // namespace draftcore
