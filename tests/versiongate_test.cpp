// =====================================================================
//  tests/versiongate_test.cpp — Minimum DXF versions
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <gtest/gtest.h>

#include <draftcore/dxf/versiongate.h>

using namespace draftcore;
using namespace draftcore::dxf;

TEST(VersionGateTest, R12EntitiesAreAlwaysAllowed) {
    EXPECT_EQ(minimumVersion(EntityType::Line), DxfVersion::R12);
    EXPECT_EQ(minimumVersion(EntityType::Polyline), DxfVersion::R12);
    EXPECT_EQ(minimumVersion(EntityType::Dimension), DxfVersion::R12);
    EXPECT_FALSE(requireVersion(EntityType::Face3d, DxfVersion::R12).isError());
}

TEST(VersionGateTest, R2000Entities) {
    const EntityType kinds[] = {
        EntityType::Ellipse, EntityType::LWPolyline, EntityType::MText,
        EntityType::Ray, EntityType::XLine, EntityType::Spline,
        EntityType::Body, EntityType::Region, EntityType::Solid3d,
        EntityType::Hatch, EntityType::Mesh, EntityType::Image,
        EntityType::PdfUnderlay, EntityType::DwfUnderlay, EntityType::DgnUnderlay,
    };
    for (EntityType kind : kinds) {
        EXPECT_EQ(minimumVersion(kind), DxfVersion::R2000) << dxfTypeName(kind).toStdString();
        EXPECT_TRUE(requireVersion(kind, DxfVersion::R12).isError());
        EXPECT_FALSE(requireVersion(kind, DxfVersion::R2000).isError());
    }
}

TEST(VersionGateTest, SurfaceFamilyNeedsR2007) {
    const Error error = requireVersion(EntityType::LoftedSurface, DxfVersion::R2000);
    ASSERT_EQ(error.code, ErrorCode::VersionError);
    EXPECT_EQ(error.entityType, QStringLiteral("LOFTEDSURFACE"));
    EXPECT_EQ(error.required, DxfVersion::R2007);
    EXPECT_EQ(error.actual, DxfVersion::R2000);
    EXPECT_TRUE(error.toString().contains(QStringLiteral("R2007")));

    EXPECT_FALSE(requireVersion(EntityType::LoftedSurface, DxfVersion::R2007).isError());
    EXPECT_TRUE(isSupported(EntityType::Surface, DxfVersion::R2018));
}

TEST(VersionGateTest, VersionNames) {
    EXPECT_EQ(versionName(DxfVersion::R2013), QStringLiteral("R2013"));
    EXPECT_EQ(acadVersion(DxfVersion::R2000), QStringLiteral("AC1015"));
    EXPECT_EQ(versionFromString(QStringLiteral("ac1021")), DxfVersion::R2007);
    EXPECT_EQ(versionFromString(QStringLiteral("R12")), DxfVersion::R12);
    EXPECT_FALSE(versionFromString(QStringLiteral("R14")).has_value());
}
