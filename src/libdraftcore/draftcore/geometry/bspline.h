// =====================================================================
//  src/libdraftcore/draftcore/geometry/bspline.h — B-spline control frames
// =====================================================================
//
//  Converts fit points into a B-spline control frame (degree, control
//  points, knots and optional weights) and builds uniform frames from
//  caller-supplied control points.
//
//  Three parametrizations of the fit points are available:
//
//    uniform      t_i = i / n
//    distance     chord length, t_i proportional to the summed distances
//    centripetal  chord length raised to a power (0.5 is classical)
//
//  Open frames are clamped: the first and last knot repeat degree+1
//  times.  Closed frames are periodic: the first `degree` control
//  points are repeated at the tail and the knots are unclamped, so
//  the curve closes with C(degree-1) continuity.
//
//  Basis evaluation and linear solving use OpenCASCADE (BSplCLib and
//  math_Gauss).
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_GEOMETRY_BSPLINE_H
#define DRAFTCORE_GEOMETRY_BSPLINE_H

#include "../core.h"
#include "../errors.h"
#include "types.h"

#include <QString>
#include <QVector>

#include <Geom_BSplineCurve.hxx>

namespace draftcore {
namespace geometry {

// =====================================================================
//  Parametrization
// =====================================================================

enum class ParametrizationMethod {
    Uniform,
    Distance,
    Centripetal
};

/// "uniform", "distance" or "centripetal"
DRAFTCORE_EXPORT QString methodName(ParametrizationMethod method);

/// Parse a method name.  Unknown names fail with "unknown method".
DRAFTCORE_EXPORT Result<ParametrizationMethod> methodFromString(const QString& name);

/// Options shared by all fit-point based builders
struct FitOptions {
    int degree = 3;
    ParametrizationMethod method = ParametrizationMethod::Distance;
    double power = 0.5;     ///< Exponent of the centripetal method
};

/// Parameter vector over an open fit-point sequence.
/// Same length as the points, strictly increasing, from 0 to 1.
/// Coincident consecutive points fail for the distance based methods.
DRAFTCORE_EXPORT Result<QVector<double>> parametrize(const QVector<Vec3>& points,
                                                     ParametrizationMethod method,
                                                     double power = 0.5);

/// Parameter vector over a closed fit-point sequence.
/// One value longer than the points: the last value (1.0) belongs to
/// the closing segment back to the first point.
DRAFTCORE_EXPORT Result<QVector<double>> parametrizeClosed(const QVector<Vec3>& points,
                                                           ParametrizationMethod method,
                                                           double power = 0.5);

// =====================================================================
//  Knot vectors
// =====================================================================

/// Clamped integer knots: `order` zeros, 1 .. count-order, then
/// count-order+1 repeated `order` times.  Length count + order.
DRAFTCORE_EXPORT QVector<double> openUniformKnots(int count, int order);

/// Unclamped integer knots 0, 1, ..., count+order-1
DRAFTCORE_EXPORT QVector<double> uniformKnots(int count, int order);

/// Clamped knots averaged over the parameter vector (one knot per
/// fit point plus degree+1)
DRAFTCORE_EXPORT QVector<double> averagedKnots(const QVector<double>& params, int degree);

// =====================================================================
//  Control frame
// =====================================================================

struct DRAFTCORE_EXPORT ControlFrame {
    int degree = 3;
    QVector<Vec3> controlPoints;
    QVector<double> knots;
    QVector<double> weights;        ///< Empty unless rational
    bool closed = false;

    int order() const { return degree + 1; }
    bool isRational() const { return !weights.isEmpty(); }

    /// Knot count matches control points + degree + 1, knots are
    /// non-decreasing and weights (if any) match the control points
    bool isValid() const;

    /// First parameter of the curve domain (knots[degree]), 0.0 for
    /// an invalid frame
    double domainStart() const;

    /// Last parameter of the curve domain (knots[count]), 0.0 for an
    /// invalid frame
    double domainEnd() const;

    /// OCCT curve for this frame, null if the frame is invalid
    Handle(Geom_BSplineCurve) toCurve() const;

    /// Evaluate the curve at parameter u
    Result<Vec3> pointAt(double u) const;
};

// =====================================================================
//  Frame builders
// =====================================================================

/// Global interpolation through the fit points.
/// At least 2 points; the degree is lowered to count-1 when needed.
/// Knots are averaged over the parameter vector.
DRAFTCORE_EXPORT Result<ControlFrame> buildOpen(const QVector<Vec3>& fitPoints,
                                                const FitOptions& options = FitOptions());

/// Periodic interpolation through the fit points, closing back to the
/// first point.  Requires at least degree+1 points.
DRAFTCORE_EXPORT Result<ControlFrame> buildClosed(const QVector<Vec3>& fitPoints,
                                                  const FitOptions& options = FitOptions());

/// Least-squares approximation with `count` control points.
/// The first and last fit points are interpolated exactly, the curve
/// only passes near the others.
DRAFTCORE_EXPORT Result<ControlFrame> approximate(const QVector<Vec3>& fitPoints,
                                                  int count,
                                                  const FitOptions& options = FitOptions());

/// Clamped frame over the given control points
DRAFTCORE_EXPORT Result<ControlFrame> openUniformFrame(const QVector<Vec3>& controlPoints,
                                                       int degree = 3);

/// Periodic frame over the given control points
DRAFTCORE_EXPORT Result<ControlFrame> closedUniformFrame(const QVector<Vec3>& controlPoints,
                                                         int degree = 3);

/// Clamped rational frame; one weight per control point
DRAFTCORE_EXPORT Result<ControlFrame> buildOpenRational(const QVector<Vec3>& controlPoints,
                                                        const QVector<double>& weights,
                                                        int degree = 3);

/// Periodic rational frame; one weight per control point
DRAFTCORE_EXPORT Result<ControlFrame> buildClosedRational(const QVector<Vec3>& controlPoints,
                                                          const QVector<double>& weights,
                                                          int degree = 3);

}  // namespace geometry
}  // namespace draftcore

#endif  // DRAFTCORE_GEOMETRY_BSPLINE_H
