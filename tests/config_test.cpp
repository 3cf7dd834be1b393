// =====================================================================
//  tests/config_test.cpp — Factory configuration
// =====================================================================
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <gtest/gtest.h>

#include <draftcore/config.h>

#include <QFile>
#include <QJsonObject>
#include <QTemporaryDir>

using namespace draftcore;

TEST(FactoryConfigTest, Defaults) {
    const FactoryConfig config;
    EXPECT_EQ(config.dxfVersion, dxf::DxfVersion::R2000);
    EXPECT_EQ(config.dimstyle, QStringLiteral("EZDXF"));
    EXPECT_EQ(config.fit.degree, 3);
    EXPECT_EQ(config.fit.method, geometry::ParametrizationMethod::Distance);
    EXPECT_EQ(config.hatchColor, 7);
}

TEST(FactoryConfigTest, SaveAndLoad) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("draftcore.json"));

    FactoryConfig config;
    config.dxfVersion = dxf::DxfVersion::R2013;
    config.dimstyle = QStringLiteral("ISO-25");
    config.fit.degree = 2;
    config.fit.method = geometry::ParametrizationMethod::Centripetal;
    config.fit.power = 0.3;
    config.hatchColor = 5;

    QString error;
    ASSERT_TRUE(config.save(path, &error)) << error.toStdString();

    FactoryConfig loaded;
    ASSERT_TRUE(loaded.load(path, &error)) << error.toStdString();
    EXPECT_EQ(loaded.dxfVersion, dxf::DxfVersion::R2013);
    EXPECT_EQ(loaded.dimstyle, QStringLiteral("ISO-25"));
    EXPECT_EQ(loaded.fit.degree, 2);
    EXPECT_EQ(loaded.fit.method, geometry::ParametrizationMethod::Centripetal);
    EXPECT_DOUBLE_EQ(loaded.fit.power, 0.3);
    EXPECT_EQ(loaded.hatchColor, 5);
}

TEST(FactoryConfigTest, MissingKeysKeepValues) {
    FactoryConfig config;
    config.hatchColor = 2;

    QJsonObject json;
    json[QStringLiteral("dxf_version")] = QStringLiteral("AC1021");
    ASSERT_TRUE(config.fromJson(json));
    EXPECT_EQ(config.dxfVersion, dxf::DxfVersion::R2007);
    EXPECT_EQ(config.hatchColor, 2);
    EXPECT_EQ(config.dimstyle, QStringLiteral("EZDXF"));
}

TEST(FactoryConfigTest, UnknownNamesAreRejected) {
    FactoryConfig config;
    QString error;

    QJsonObject badVersion;
    badVersion[QStringLiteral("dxf_version")] = QStringLiteral("R14");
    badVersion[QStringLiteral("hatch_color")] = 1;
    EXPECT_FALSE(config.fromJson(badVersion, &error));
    EXPECT_EQ(error, QStringLiteral("Unknown DXF version: R14"));
    EXPECT_EQ(config.hatchColor, 7);

    QJsonObject spline;
    spline[QStringLiteral("method")] = QStringLiteral("chord");
    QJsonObject badMethod;
    badMethod[QStringLiteral("spline")] = spline;
    EXPECT_FALSE(config.fromJson(badMethod, &error));
    EXPECT_EQ(error, QStringLiteral("Unknown spline method: chord"));

    QJsonObject flat;
    flat[QStringLiteral("degree")] = 0;
    QJsonObject badDegree;
    badDegree[QStringLiteral("spline")] = flat;
    EXPECT_FALSE(config.fromJson(badDegree, &error));
    EXPECT_EQ(config.fit.degree, 3);
}

TEST(FactoryConfigTest, InvalidFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("broken.json"));

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ \"dxf_version\": ");
    file.close();

    FactoryConfig config;
    QString error;
    EXPECT_FALSE(config.load(path, &error));
    EXPECT_TRUE(error.startsWith(QStringLiteral("Invalid config JSON")));

    EXPECT_FALSE(config.load(dir.filePath(QStringLiteral("missing.json")), &error));
    EXPECT_TRUE(error.startsWith(QStringLiteral("Failed to read config")));
}
