// =====================================================================
//  src/libdraftcore/geometry/bspline.cpp — B-spline control frames
// =====================================================================
//
//  Interpolation follows the global interpolation scheme of Piegl and
//  Tiller (The NURBS Book, 9.2.1); approximation is the least-squares
//  fit of section 9.4.1 with fixed end points.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/geometry/bspline.h>

#include "../logging.h"

#include <BSplCLib.hxx>
#include <Standard_Failure.hxx>
#include <TColStd_Array1OfInteger.hxx>
#include <TColStd_Array1OfReal.hxx>
#include <TColgp_Array1OfPnt.hxx>
#include <math_Gauss.hxx>
#include <math_Matrix.hxx>
#include <math_Vector.hxx>

#include <QtMath>

#include <cmath>

namespace draftcore {
namespace geometry {

namespace {

const QString FIT_POINTS = QStringLiteral("fit_points");

Error insufficient(const QString& field, const QString& what)
{
    return Error::value(field, QStringLiteral("insufficient %1").arg(what));
}

// ---- OCCT helpers ---------------------------------------------------

TColStd_Array1OfReal toFlatKnots(const QVector<double>& knots)
{
    TColStd_Array1OfReal flat(1, knots.size());
    for (int i = 0; i < knots.size(); ++i) {
        flat.SetValue(i + 1, knots[i]);
    }
    return flat;
}

/// Non-zero basis functions at u.  `first` receives the 0-based index
/// of the basis function stored in basis(1, 1).
bool evalBasis(const TColStd_Array1OfReal& flatKnots, int order, double u,
               int& first, math_Matrix& basis)
{
    Standard_Integer firstNonZero = 0;
    const Standard_Integer rc =
        BSplCLib::EvalBsplineBasis(0, order, flatKnots, u, firstNonZero, basis);
    if (rc != 0) {
        return false;
    }
    first = firstNonZero - 1;
    return true;
}

/// Solve A X = B for the three coordinate columns of B
Result<QVector<Vec3>> solveCoordinates(const math_Matrix& a,
                                       const QVector<Vec3>& rhs)
{
    const int n = rhs.size();
    math_Gauss gauss(a);
    if (!gauss.IsDone()) {
        return Result<QVector<Vec3>>::fail(
            Error::value(FIT_POINTS, QStringLiteral("singular interpolation matrix")));
    }

    math_Vector bx(1, n), by(1, n), bz(1, n);
    for (int i = 0; i < n; ++i) {
        bx(i + 1) = rhs[i].x;
        by(i + 1) = rhs[i].y;
        bz(i + 1) = rhs[i].z;
    }

    math_Vector sx(1, n), sy(1, n), sz(1, n);
    gauss.Solve(bx, sx);
    gauss.Solve(by, sy);
    gauss.Solve(bz, sz);

    QVector<Vec3> solution;
    solution.reserve(n);
    for (int i = 1; i <= n; ++i) {
        solution.append(Vec3(sx(i), sy(i), sz(i)));
    }
    return Result<QVector<Vec3>>::ok(solution);
}

/// Cumulative, normalized segment lengths.  Point i+1 of `points`
/// follows point i; the sequence is closed when `closed` is set.
Result<QVector<double>> cumulative(const QVector<Vec3>& points, bool closed,
                                   ParametrizationMethod method, double power)
{
    const int count = points.size();
    const int segments = closed ? count : count - 1;

    QVector<double> params;
    params.reserve(segments + 1);
    params.append(0.0);

    double total = 0.0;
    for (int i = 0; i < segments; ++i) {
        double step = 1.0;
        if (method != ParametrizationMethod::Uniform) {
            const double dist = points[i].distanceTo(points[(i + 1) % count]);
            if (dist <= DEFAULT_TOLERANCE) {
                return Result<QVector<double>>::fail(Error::value(
                    FIT_POINTS,
                    QStringLiteral("coincident points at index %1").arg((i + 1) % count)));
            }
            step = method == ParametrizationMethod::Centripetal ? std::pow(dist, power) : dist;
        }
        total += step;
        params.append(total);
    }

    for (double& t : params) {
        t /= total;
    }
    params.last() = 1.0;
    return Result<QVector<double>>::ok(params);
}

QVector<Vec3> wrapTail(const QVector<Vec3>& points, int count)
{
    QVector<Vec3> wrapped = points;
    for (int i = 0; i < count; ++i) {
        wrapped.append(points[i % points.size()]);
    }
    return wrapped;
}

QVector<double> wrapTail(const QVector<double>& values, int count)
{
    QVector<double> wrapped = values;
    for (int i = 0; i < count; ++i) {
        wrapped.append(values[i % values.size()]);
    }
    return wrapped;
}

Error checkControlPoints(const QVector<Vec3>& controlPoints, int degree)
{
    if (degree < 1) {
        return Error::value(QStringLiteral("degree"), QStringLiteral("must be at least 1"));
    }
    if (controlPoints.size() < degree + 1) {
        return insufficient(QStringLiteral("control_points"), QStringLiteral("control points"));
    }
    return Error();
}

Error checkWeights(const QVector<Vec3>& controlPoints, const QVector<double>& weights)
{
    if (weights.size() != controlPoints.size()) {
        return Error::value(QStringLiteral("weights"),
                            QStringLiteral("expected %1 weights, got %2")
                                .arg(controlPoints.size()).arg(weights.size()));
    }
    for (double w : weights) {
        if (w <= 0.0) {
            return Error::value(QStringLiteral("weights"), QStringLiteral("weights must be positive"));
        }
    }
    return Error();
}

}  // namespace

// =====================================================================
//  Parametrization
// =====================================================================

QString methodName(ParametrizationMethod method)
{
    switch (method) {
    case ParametrizationMethod::Uniform:     return QStringLiteral("uniform");
    case ParametrizationMethod::Distance:    return QStringLiteral("distance");
    case ParametrizationMethod::Centripetal: return QStringLiteral("centripetal");
    }
    return QString();
}

Result<ParametrizationMethod> methodFromString(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("uniform")) {
        return Result<ParametrizationMethod>::ok(ParametrizationMethod::Uniform);
    }
    if (key == QLatin1String("distance")) {
        return Result<ParametrizationMethod>::ok(ParametrizationMethod::Distance);
    }
    if (key == QLatin1String("centripetal")) {
        return Result<ParametrizationMethod>::ok(ParametrizationMethod::Centripetal);
    }
    return Result<ParametrizationMethod>::fail(
        Error::value(QStringLiteral("method"), QStringLiteral("unknown method")));
}

Result<QVector<double>> parametrize(const QVector<Vec3>& points,
                                    ParametrizationMethod method, double power)
{
    if (points.size() < 2) {
        return Result<QVector<double>>::fail(insufficient(FIT_POINTS, QStringLiteral("fit points")));
    }
    return cumulative(points, false, method, power);
}

Result<QVector<double>> parametrizeClosed(const QVector<Vec3>& points,
                                          ParametrizationMethod method, double power)
{
    if (points.size() < 2) {
        return Result<QVector<double>>::fail(insufficient(FIT_POINTS, QStringLiteral("fit points")));
    }
    return cumulative(points, true, method, power);
}

// =====================================================================
//  Knot vectors
// =====================================================================

QVector<double> openUniformKnots(int count, int order)
{
    QVector<double> knots;
    knots.reserve(count + order);
    for (int i = 0; i < order; ++i) {
        knots.append(0.0);
    }
    for (int i = 1; i <= count - order; ++i) {
        knots.append(double(i));
    }
    const double last = double(count - order + 1);
    for (int i = 0; i < order; ++i) {
        knots.append(last);
    }
    return knots;
}

QVector<double> uniformKnots(int count, int order)
{
    QVector<double> knots;
    knots.reserve(count + order);
    for (int i = 0; i < count + order; ++i) {
        knots.append(double(i));
    }
    return knots;
}

QVector<double> averagedKnots(const QVector<double>& params, int degree)
{
    const int n = params.size();
    QVector<double> knots;
    knots.reserve(n + degree + 1);
    for (int i = 0; i <= degree; ++i) {
        knots.append(0.0);
    }
    for (int j = 1; j < n - degree; ++j) {
        double sum = 0.0;
        for (int i = j; i < j + degree; ++i) {
            sum += params[i];
        }
        knots.append(sum / degree);
    }
    for (int i = 0; i <= degree; ++i) {
        knots.append(1.0);
    }
    return knots;
}

// =====================================================================
//  ControlFrame
// =====================================================================

bool ControlFrame::isValid() const
{
    if (degree < 1 || controlPoints.size() < degree + 1) {
        return false;
    }
    if (knots.size() != controlPoints.size() + order()) {
        return false;
    }
    if (!weights.isEmpty() && weights.size() != controlPoints.size()) {
        return false;
    }
    for (int i = 1; i < knots.size(); ++i) {
        if (knots[i] < knots[i - 1]) {
            return false;
        }
    }
    return true;
}

double ControlFrame::domainStart() const
{
    return isValid() ? knots[degree] : 0.0;
}

double ControlFrame::domainEnd() const
{
    return isValid() ? knots[controlPoints.size()] : 0.0;
}

Handle(Geom_BSplineCurve) ControlFrame::toCurve() const
{
    if (!isValid()) {
        return Handle(Geom_BSplineCurve)();
    }

    const TColStd_Array1OfReal flat = toFlatKnots(knots);
    const Standard_Integer distinct = BSplCLib::KnotsLength(flat);
    TColStd_Array1OfReal occKnots(1, distinct);
    TColStd_Array1OfInteger mults(1, distinct);
    BSplCLib::Knots(flat, occKnots, mults);

    TColgp_Array1OfPnt poles(1, controlPoints.size());
    for (int i = 0; i < controlPoints.size(); ++i) {
        poles.SetValue(i + 1, controlPoints[i].toPnt());
    }

    try {
        if (isRational()) {
            TColStd_Array1OfReal occWeights(1, weights.size());
            for (int i = 0; i < weights.size(); ++i) {
                occWeights.SetValue(i + 1, weights[i]);
            }
            return new Geom_BSplineCurve(poles, occWeights, occKnots, mults, degree);
        }
        return new Geom_BSplineCurve(poles, occKnots, mults, degree);
    } catch (const Standard_Failure& failure) {
        qCWarning(lcSpline) << "Cannot build OCCT curve:" << failure.GetMessageString();
        return Handle(Geom_BSplineCurve)();
    }
}

Result<Vec3> ControlFrame::pointAt(double u) const
{
    Handle(Geom_BSplineCurve) curve = toCurve();
    if (curve.IsNull()) {
        return Result<Vec3>::fail(
            Error::value(QStringLiteral("knots"), QStringLiteral("invalid control frame")));
    }
    return Result<Vec3>::ok(Vec3::fromPnt(curve->Value(u)));
}

// =====================================================================
//  Interpolation
// =====================================================================

Result<ControlFrame> buildOpen(const QVector<Vec3>& fitPoints, const FitOptions& options)
{
    const int n = fitPoints.size();
    if (n < 2) {
        return Result<ControlFrame>::fail(insufficient(FIT_POINTS, QStringLiteral("fit points")));
    }
    if (options.degree < 1) {
        return Result<ControlFrame>::fail(
            Error::value(QStringLiteral("degree"), QStringLiteral("must be at least 1")));
    }

    auto params = parametrize(fitPoints, options.method, options.power);
    if (!params.success) {
        return Result<ControlFrame>::fail(params.error);
    }

    const int degree = qMin(options.degree, n - 1);
    ControlFrame frame;
    frame.degree = degree;
    frame.knots = averagedKnots(params.value, degree);

    try {
        const TColStd_Array1OfReal flat = toFlatKnots(frame.knots);
        math_Matrix a(1, n, 1, n, 0.0);
        math_Matrix basis(1, 1, 1, degree + 1);
        for (int row = 0; row < n; ++row) {
            int first = 0;
            if (!evalBasis(flat, degree + 1, params.value[row], first, basis)) {
                return Result<ControlFrame>::fail(
                    Error::value(FIT_POINTS, QStringLiteral("basis evaluation failed")));
            }
            for (int k = 0; k <= degree; ++k) {
                a(row + 1, first + k + 1) = basis(1, k + 1);
            }
        }

        auto solved = solveCoordinates(a, fitPoints);
        if (!solved.success) {
            return Result<ControlFrame>::fail(solved.error);
        }
        frame.controlPoints = solved.value;
    } catch (const Standard_Failure& failure) {
        return Result<ControlFrame>::fail(
            Error::value(FIT_POINTS, QString::fromLatin1(failure.GetMessageString())));
    }

    qCDebug(lcSpline) << "Open interpolation:" << n << "fit points, degree" << degree
                      << methodName(options.method);
    return Result<ControlFrame>::ok(frame);
}

Result<ControlFrame> buildClosed(const QVector<Vec3>& fitPoints, const FitOptions& options)
{
    const int n = fitPoints.size();
    const int p = options.degree;
    if (p < 1) {
        return Result<ControlFrame>::fail(
            Error::value(QStringLiteral("degree"), QStringLiteral("must be at least 1")));
    }
    if (n < p + 1) {
        return Result<ControlFrame>::fail(insufficient(FIT_POINTS, QStringLiteral("fit points")));
    }

    auto params = parametrizeClosed(fitPoints, options.method, options.power);
    if (!params.success) {
        return Result<ControlFrame>::fail(params.error);
    }
    const QVector<double>& t = params.value;

    // Breakpoints over one period: the parameters for odd degrees,
    // their midpoints for even degrees.
    QVector<double> breaks(n);
    for (int i = 0; i < n; ++i) {
        breaks[i] = (p % 2 == 1) ? t[i] : 0.5 * (t[i] + t[i + 1]);
    }
    auto breakAt = [&](int j) {
        const int period = int(std::floor(double(j) / n));
        return breaks[j - period * n] + period;
    };

    ControlFrame frame;
    frame.degree = p;
    frame.closed = true;
    frame.knots.reserve(n + 2 * p + 1);
    for (int k = 0; k < n + 2 * p + 1; ++k) {
        frame.knots.append(breakAt(k - p));
    }

    try {
        const TColStd_Array1OfReal flat = toFlatKnots(frame.knots);
        math_Matrix a(1, n, 1, n, 0.0);
        math_Matrix basis(1, 1, 1, p + 1);
        for (int row = 0; row < n; ++row) {
            double u = t[row];
            if (u < breaks[0]) {
                u += 1.0;
            }
            int first = 0;
            if (!evalBasis(flat, p + 1, u, first, basis)) {
                return Result<ControlFrame>::fail(
                    Error::value(FIT_POINTS, QStringLiteral("basis evaluation failed")));
            }
            for (int k = 0; k <= p; ++k) {
                a(row + 1, (first + k) % n + 1) += basis(1, k + 1);
            }
        }

        auto solved = solveCoordinates(a, fitPoints);
        if (!solved.success) {
            return Result<ControlFrame>::fail(solved.error);
        }
        frame.controlPoints = wrapTail(solved.value, p);
    } catch (const Standard_Failure& failure) {
        return Result<ControlFrame>::fail(
            Error::value(FIT_POINTS, QString::fromLatin1(failure.GetMessageString())));
    }

    qCDebug(lcSpline) << "Closed interpolation:" << n << "fit points, degree" << p
                      << methodName(options.method);
    return Result<ControlFrame>::ok(frame);
}

// =====================================================================
//  Approximation
// =====================================================================

Result<ControlFrame> approximate(const QVector<Vec3>& fitPoints, int count,
                                 const FitOptions& options)
{
    const int total = fitPoints.size();
    const int p = options.degree;
    if (total < 2) {
        return Result<ControlFrame>::fail(insufficient(FIT_POINTS, QStringLiteral("fit points")));
    }
    if (p < 1) {
        return Result<ControlFrame>::fail(
            Error::value(QStringLiteral("degree"), QStringLiteral("must be at least 1")));
    }
    if (count < p + 1 || count > total) {
        return Result<ControlFrame>::fail(Error::value(
            QStringLiteral("count"),
            QStringLiteral("control point count must be in [%1, %2]").arg(p + 1).arg(total)));
    }

    auto params = parametrize(fitPoints, options.method, options.power);
    if (!params.success) {
        return Result<ControlFrame>::fail(params.error);
    }
    const QVector<double>& t = params.value;

    ControlFrame frame;
    frame.degree = p;

    // Knots spread so that every span holds at least one parameter
    const double d = double(total) / double(count - p);
    for (int i = 0; i <= p; ++i) {
        frame.knots.append(0.0);
    }
    for (int j = 1; j < count - p; ++j) {
        const int i = int(j * d);
        const double alpha = j * d - i;
        frame.knots.append((1.0 - alpha) * t[i - 1] + alpha * t[i]);
    }
    for (int i = 0; i <= p; ++i) {
        frame.knots.append(1.0);
    }

    const Vec3 first = fitPoints.first();
    const Vec3 last = fitPoints.last();
    const int inner = count - 2;        // unknown control points
    const int rows = total - 2;         // inner fit points

    if (inner == 0) {
        frame.controlPoints = { first, last };
        return Result<ControlFrame>::ok(frame);
    }

    try {
        const TColStd_Array1OfReal flat = toFlatKnots(frame.knots);
        math_Matrix n(1, rows, 1, inner, 0.0);
        math_Matrix residual(1, rows, 1, 3, 0.0);
        math_Matrix basis(1, 1, 1, p + 1);

        for (int k = 1; k <= rows; ++k) {
            int firstIndex = 0;
            if (!evalBasis(flat, p + 1, t[k], firstIndex, basis)) {
                return Result<ControlFrame>::fail(
                    Error::value(FIT_POINTS, QStringLiteral("basis evaluation failed")));
            }
            double n0 = 0.0;
            double nh = 0.0;
            for (int c = 0; c <= p; ++c) {
                const int col = firstIndex + c;
                const double value = basis(1, c + 1);
                if (col == 0) {
                    n0 = value;
                } else if (col == count - 1) {
                    nh = value;
                } else {
                    n(k, col) = value;
                }
            }
            const Vec3 r = fitPoints[k] - first * n0 - last * nh;
            residual(k, 1) = r.x;
            residual(k, 2) = r.y;
            residual(k, 3) = r.z;
        }

        // Normal equations (N^T N) P = N^T R
        const math_Matrix ntn = n.TMultiply(n);
        const math_Matrix ntr = n.TMultiply(residual);
        QVector<Vec3> rhs(inner);
        for (int i = 1; i <= inner; ++i) {
            rhs[i - 1] = Vec3(ntr(i, 1), ntr(i, 2), ntr(i, 3));
        }

        auto solved = solveCoordinates(ntn, rhs);
        if (!solved.success) {
            return Result<ControlFrame>::fail(solved.error);
        }
        frame.controlPoints.append(first);
        frame.controlPoints.append(solved.value);
        frame.controlPoints.append(last);
    } catch (const Standard_Failure& failure) {
        return Result<ControlFrame>::fail(
            Error::value(FIT_POINTS, QString::fromLatin1(failure.GetMessageString())));
    }

    qCDebug(lcSpline) << "Approximation:" << total << "fit points ->" << count
                      << "control points, degree" << p;
    return Result<ControlFrame>::ok(frame);
}

// =====================================================================
//  Frames from control points
// =====================================================================

Result<ControlFrame> openUniformFrame(const QVector<Vec3>& controlPoints, int degree)
{
    const Error error = checkControlPoints(controlPoints, degree);
    if (error.isError()) {
        return Result<ControlFrame>::fail(error);
    }
    ControlFrame frame;
    frame.degree = degree;
    frame.controlPoints = controlPoints;
    frame.knots = openUniformKnots(controlPoints.size(), degree + 1);
    return Result<ControlFrame>::ok(frame);
}

Result<ControlFrame> closedUniformFrame(const QVector<Vec3>& controlPoints, int degree)
{
    const Error error = checkControlPoints(controlPoints, degree);
    if (error.isError()) {
        return Result<ControlFrame>::fail(error);
    }
    ControlFrame frame;
    frame.degree = degree;
    frame.closed = true;
    frame.controlPoints = wrapTail(controlPoints, degree);
    frame.knots = uniformKnots(frame.controlPoints.size(), degree + 1);
    return Result<ControlFrame>::ok(frame);
}

Result<ControlFrame> buildOpenRational(const QVector<Vec3>& controlPoints,
                                       const QVector<double>& weights, int degree)
{
    const Error error = checkWeights(controlPoints, weights);
    if (error.isError()) {
        return Result<ControlFrame>::fail(error);
    }
    auto frame = openUniformFrame(controlPoints, degree);
    if (frame.success) {
        frame.value.weights = weights;
    }
    return frame;
}

Result<ControlFrame> buildClosedRational(const QVector<Vec3>& controlPoints,
                                         const QVector<double>& weights, int degree)
{
    const Error error = checkWeights(controlPoints, weights);
    if (error.isError()) {
        return Result<ControlFrame>::fail(error);
    }
    auto frame = closedUniformFrame(controlPoints, degree);
    if (frame.success) {
        frame.value.weights = wrapTail(weights, degree);
    }
    return frame;
}

}  // namespace geometry
}  // namespace draftcore
