// =====================================================================
//  tests/bspline_test.cpp — B-spline control frames
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <gtest/gtest.h>

#include <draftcore/geometry/bspline.h>

using namespace draftcore;
using namespace draftcore::geometry;

namespace {

constexpr double EPS = 1e-7;

const ParametrizationMethod ALL_METHODS[] = {
    ParametrizationMethod::Uniform,
    ParametrizationMethod::Distance,
    ParametrizationMethod::Centripetal,
};

QVector<Vec3> wave(int count)
{
    QVector<Vec3> points;
    for (int i = 0; i < count; ++i) {
        points.append(Vec3(i, (i % 2) ? 2.0 : 0.0, 0.1 * i));
    }
    return points;
}

void expectNear(const Vec3& actual, const Vec3& expected, double tolerance = EPS)
{
    EXPECT_NEAR(actual.x, expected.x, tolerance);
    EXPECT_NEAR(actual.y, expected.y, tolerance);
    EXPECT_NEAR(actual.z, expected.z, tolerance);
}

}  // namespace

// ---- Parametrization ------------------------------------------------

TEST(ParametrizationTest, StrictlyIncreasingFromZero) {
    const QVector<Vec3> points = { Vec3(0, 0), Vec3(1, 0), Vec3(1, 5), Vec3(2, 5), Vec3(10, 5) };
    for (ParametrizationMethod method : ALL_METHODS) {
        auto t = parametrize(points, method, 0.5);
        ASSERT_TRUE(t.success) << methodName(method).toStdString();
        ASSERT_EQ(t.value.size(), points.size());
        EXPECT_DOUBLE_EQ(t.value.first(), 0.0);
        EXPECT_DOUBLE_EQ(t.value.last(), 1.0);
        for (int i = 1; i < t.value.size(); ++i) {
            EXPECT_GT(t.value[i], t.value[i - 1]);
        }
    }
}

TEST(ParametrizationTest, MethodValues) {
    const QVector<Vec3> points = { Vec3(0, 0), Vec3(1, 0), Vec3(5, 0) };

    auto uniform = parametrize(points, ParametrizationMethod::Uniform);
    EXPECT_DOUBLE_EQ(uniform.value[1], 0.5);

    auto distance = parametrize(points, ParametrizationMethod::Distance);
    EXPECT_DOUBLE_EQ(distance.value[1], 0.2);

    auto centripetal = parametrize(points, ParametrizationMethod::Centripetal, 0.5);
    EXPECT_NEAR(centripetal.value[1], 1.0 / 3.0, 1e-12);
}

TEST(ParametrizationTest, ClosedAddsClosingSegment) {
    const QVector<Vec3> square = { Vec3(0, 0), Vec3(1, 0), Vec3(1, 1), Vec3(0, 1) };
    auto t = parametrizeClosed(square, ParametrizationMethod::Distance);
    ASSERT_TRUE(t.success);
    ASSERT_EQ(t.value.size(), 5);
    EXPECT_DOUBLE_EQ(t.value[2], 0.5);
    EXPECT_DOUBLE_EQ(t.value[4], 1.0);
}

TEST(ParametrizationTest, CoincidentPointsFail) {
    const QVector<Vec3> points = { Vec3(0, 0), Vec3(1, 1), Vec3(1, 1), Vec3(2, 0) };
    auto t = parametrize(points, ParametrizationMethod::Distance);
    EXPECT_FALSE(t.success);
    EXPECT_EQ(t.error.field, QStringLiteral("fit_points"));

    EXPECT_TRUE(parametrize(points, ParametrizationMethod::Uniform).success);
}

TEST(ParametrizationTest, MethodNames) {
    EXPECT_EQ(methodFromString(QStringLiteral("centripetal")).value, ParametrizationMethod::Centripetal);
    EXPECT_EQ(methodName(ParametrizationMethod::Distance), QStringLiteral("distance"));

    auto unknown = methodFromString(QStringLiteral("chord"));
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.error.message, QStringLiteral("unknown method"));
}

// ---- Knots ----------------------------------------------------------

TEST(KnotVectorTest, OpenUniform) {
    EXPECT_EQ(openUniformKnots(4, 4), QVector<double>({ 0, 0, 0, 0, 1, 1, 1, 1 }));
    EXPECT_EQ(openUniformKnots(5, 3), QVector<double>({ 0, 0, 0, 1, 2, 3, 3, 3 }));
}

TEST(KnotVectorTest, Uniform) {
    EXPECT_EQ(uniformKnots(3, 2), QVector<double>({ 0, 1, 2, 3, 4 }));
}

TEST(KnotVectorTest, Averaged) {
    const QVector<double> t = { 0.0, 0.25, 0.5, 0.75, 1.0 };
    EXPECT_EQ(averagedKnots(t, 3), QVector<double>({ 0, 0, 0, 0, 0.5, 1, 1, 1, 1 }));
}

// ---- Open interpolation ---------------------------------------------

TEST(BuildOpenTest, KnotCountInvariant) {
    for (int count = 2; count <= 8; ++count) {
        for (ParametrizationMethod method : ALL_METHODS) {
            FitOptions options;
            options.method = method;
            auto frame = buildOpen(wave(count), options);
            ASSERT_TRUE(frame.success) << count;
            EXPECT_EQ(frame.value.knots.size(),
                      frame.value.controlPoints.size() + frame.value.degree + 1);
            EXPECT_TRUE(frame.value.isValid());
            EXPECT_FALSE(frame.value.isRational());
        }
    }
}

TEST(BuildOpenTest, FourPointCubicIsClamped) {
    const QVector<Vec3> fit = { Vec3(0, 0), Vec3(1, 2), Vec3(2, 0), Vec3(3, 2) };
    auto frame = buildOpen(fit);
    ASSERT_TRUE(frame.success);

    const QVector<double>& knots = frame.value.knots;
    ASSERT_EQ(knots.size(), frame.value.controlPoints.size() + 4);
    for (int i = 1; i < 4; ++i) {
        EXPECT_EQ(knots[i], knots[0]);
        EXPECT_EQ(knots[knots.size() - 1 - i], knots.last());
    }
    expectNear(frame.value.controlPoints.first(), fit.first());
    expectNear(frame.value.controlPoints.last(), fit.last());
}

TEST(BuildOpenTest, CurvePassesThroughFitPoints) {
    const QVector<Vec3> fit = wave(6);
    auto frame = buildOpen(fit);
    ASSERT_TRUE(frame.success);

    auto t = parametrize(fit, ParametrizationMethod::Distance);
    for (int i = 0; i < fit.size(); ++i) {
        auto p = frame.value.pointAt(t.value[i]);
        ASSERT_TRUE(p.success);
        expectNear(p.value, fit[i]);
    }
}

TEST(BuildOpenTest, DegreeIsLoweredForFewPoints) {
    auto frame = buildOpen({ Vec3(0, 0), Vec3(1, 1), Vec3(2, 0) });
    ASSERT_TRUE(frame.success);
    EXPECT_EQ(frame.value.degree, 2);

    auto line = buildOpen({ Vec3(0, 0), Vec3(4, 0) });
    ASSERT_TRUE(line.success);
    EXPECT_EQ(line.value.degree, 1);
    EXPECT_EQ(line.value.knots, QVector<double>({ 0, 0, 1, 1 }));
}

TEST(BuildOpenTest, SinglePointFails) {
    auto frame = buildOpen({ Vec3(1, 1) });
    EXPECT_FALSE(frame.success);
    EXPECT_EQ(frame.error.message, QStringLiteral("insufficient fit points"));
}

// ---- Closed interpolation -------------------------------------------

TEST(BuildClosedTest, PeriodicCubic) {
    const QVector<Vec3> fit = { Vec3(0, 0), Vec3(4, 0), Vec3(4, 3), Vec3(1, 4), Vec3(-1, 2) };
    auto frame = buildClosed(fit);
    ASSERT_TRUE(frame.success);

    const ControlFrame& f = frame.value;
    EXPECT_TRUE(f.closed);
    ASSERT_EQ(f.controlPoints.size(), fit.size() + 3);
    EXPECT_EQ(f.knots.size(), f.controlPoints.size() + 4);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(f.controlPoints[fit.size() + i], f.controlPoints[i]);
    }

    auto t = parametrizeClosed(fit, ParametrizationMethod::Distance);
    for (int i = 0; i < fit.size(); ++i) {
        expectNear(f.pointAt(t.value[i]).value, fit[i]);
    }
    expectNear(f.pointAt(f.domainStart()).value, f.pointAt(f.domainEnd()).value);
}

TEST(BuildClosedTest, PeriodicQuadratic) {
    const QVector<Vec3> fit = { Vec3(0, 0), Vec3(2, 0), Vec3(2, 2), Vec3(0, 2) };
    FitOptions options;
    options.degree = 2;
    options.method = ParametrizationMethod::Uniform;
    auto frame = buildClosed(fit, options);
    ASSERT_TRUE(frame.success);

    const ControlFrame& f = frame.value;
    EXPECT_EQ(f.controlPoints.size(), 6);
    EXPECT_EQ(f.knots.size(), 9);

    // Parameters before the first breakpoint belong to the next period
    expectNear(f.pointAt(1.0).value, fit[0]);
    expectNear(f.pointAt(0.25).value, fit[1]);
    expectNear(f.pointAt(0.5).value, fit[2]);
    expectNear(f.pointAt(0.75).value, fit[3]);
}

TEST(BuildClosedTest, TooFewPointsFail) {
    auto frame = buildClosed({ Vec3(0, 0), Vec3(1, 0), Vec3(1, 1) });
    EXPECT_FALSE(frame.success);
    EXPECT_EQ(frame.error.message, QStringLiteral("insufficient fit points"));
}

// ---- Approximation --------------------------------------------------

TEST(ApproximateTest, ReducedControlPoints) {
    QVector<Vec3> fit;
    for (int i = 0; i <= 8; ++i) {
        fit.append(Vec3(i, 2.0 * i));
    }
    auto frame = approximate(fit, 5);
    ASSERT_TRUE(frame.success);

    const ControlFrame& f = frame.value;
    EXPECT_EQ(f.controlPoints.size(), 5);
    EXPECT_EQ(f.knots.size(), 9);
    EXPECT_TRUE(f.isValid());
    EXPECT_EQ(f.controlPoints.first(), fit.first());
    EXPECT_EQ(f.controlPoints.last(), fit.last());

    // A straight line lies in the spline space, so the fit is exact
    auto t = parametrize(fit, ParametrizationMethod::Distance);
    for (int i = 0; i < fit.size(); ++i) {
        expectNear(f.pointAt(t.value[i]).value, fit[i], 1e-6);
    }
}

TEST(ApproximateTest, CountOutOfRange) {
    const QVector<Vec3> fit = wave(6);
    auto tooMany = approximate(fit, 7);
    EXPECT_FALSE(tooMany.success);
    EXPECT_EQ(tooMany.error.field, QStringLiteral("count"));

    auto tooFew = approximate(fit, 3);
    EXPECT_FALSE(tooFew.success);
    EXPECT_EQ(tooFew.error.field, QStringLiteral("count"));
}

// ---- Control point frames -------------------------------------------

TEST(ControlFrameTest, ClosedUniformWrapsPoints) {
    const QVector<Vec3> cps = { Vec3(0, 0), Vec3(1, 0), Vec3(1, 1), Vec3(0, 1) };
    auto frame = closedUniformFrame(cps, 3);
    ASSERT_TRUE(frame.success);

    const ControlFrame& f = frame.value;
    EXPECT_TRUE(f.closed);
    EXPECT_EQ(f.controlPoints.size(), 7);
    EXPECT_EQ(f.knots.size(), 11);
    expectNear(f.pointAt(f.domainStart()).value, f.pointAt(f.domainEnd()).value);
}

TEST(ControlFrameTest, RationalWeights) {
    const QVector<Vec3> cps = { Vec3(0, 0), Vec3(1, 1), Vec3(2, 0) };

    auto mismatch = buildOpenRational(cps, { 1.0, 2.0 }, 2);
    EXPECT_FALSE(mismatch.success);
    EXPECT_EQ(mismatch.error.field, QStringLiteral("weights"));

    auto unit = buildOpenRational(cps, { 1.0, 1.0, 1.0 }, 2);
    auto plain = openUniformFrame(cps, 2);
    ASSERT_TRUE(unit.success);
    ASSERT_TRUE(plain.success);
    EXPECT_TRUE(unit.value.isRational());
    expectNear(unit.value.pointAt(0.5).value, plain.value.pointAt(0.5).value);

    auto closed = buildClosedRational(cps, { 1.0, 2.0, 1.0 }, 2);
    ASSERT_TRUE(closed.success);
    EXPECT_EQ(closed.value.weights.size(), closed.value.controlPoints.size());
}

TEST(ControlFrameTest, InsufficientControlPoints) {
    auto frame = openUniformFrame({ Vec3(0, 0), Vec3(1, 0) }, 3);
    EXPECT_FALSE(frame.success);
    EXPECT_EQ(frame.error.message, QStringLiteral("insufficient control points"));
}

TEST(ControlFrameTest, InvalidFrameHasEmptyDomain) {
    ControlFrame frame;
    frame.degree = 3;
    frame.controlPoints = { Vec3(0, 0), Vec3(1, 1), Vec3(2, 0), Vec3(3, 1) };
    frame.knots = { 0, 0, 1 };
    EXPECT_FALSE(frame.isValid());
    EXPECT_EQ(frame.order(), 4);
    EXPECT_DOUBLE_EQ(frame.domainStart(), 0.0);
    EXPECT_DOUBLE_EQ(frame.domainEnd(), 0.0);

    frame.knots = { 0, 0, 0, 0, 2, 1, 1, 1 };
    EXPECT_FALSE(frame.isValid());

    frame.knots = { 0, 0, 0, 0, 2, 2, 2, 2 };
    ASSERT_TRUE(frame.isValid());
    EXPECT_DOUBLE_EQ(frame.domainStart(), 0.0);
    EXPECT_DOUBLE_EQ(frame.domainEnd(), 2.0);
}
