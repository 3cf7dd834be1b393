// =====================================================================
//  tests/quadrilateral_test.cpp — Quad vertices
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <gtest/gtest.h>

#include <draftcore/geometry/quadrilateral.h>

using namespace draftcore;
using namespace draftcore::geometry;

TEST(QuadrilateralTest, TriangleRepeatsLastPoint) {
    const Vec3 a(0, 0), b(1, 0), c(1, 1);
    auto quad = normalizeQuadrilateral({ a, b, c });
    ASSERT_TRUE(quad.success);
    EXPECT_EQ(quad.value[0], a);
    EXPECT_EQ(quad.value[1], b);
    EXPECT_EQ(quad.value[2], c);
    EXPECT_EQ(quad.value[3], c);
}

TEST(QuadrilateralTest, FourPointsUnchanged) {
    const Vec3 a(0, 0), b(1, 0), c(1, 1), d(0, 1, 2);
    auto quad = normalizeQuadrilateral({ a, b, c, d });
    ASSERT_TRUE(quad.success);
    EXPECT_EQ(quad.value[3], d);
}

TEST(QuadrilateralTest, WrongCountsFail) {
    auto two = normalizeQuadrilateral({ Vec3(0, 0), Vec3(1, 0) });
    EXPECT_FALSE(two.success);
    EXPECT_EQ(two.error.code, ErrorCode::ValueError);
    EXPECT_EQ(two.error.message, QStringLiteral("expected 3 or 4 points"));

    QVector<Vec3> five(5, Vec3());
    EXPECT_FALSE(normalizeQuadrilateral(five).success);
}
