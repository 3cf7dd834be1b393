// =====================================================================
//  src/libdraftcore/config.cpp — Factory configuration
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/config.h>

#include "logging.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

namespace draftcore {

QJsonObject FactoryConfig::toJson() const
{
    QJsonObject spline;
    spline[QStringLiteral("degree")] = fit.degree;
    spline[QStringLiteral("method")] = geometry::methodName(fit.method);
    spline[QStringLiteral("power")] = fit.power;

    QJsonObject obj;
    obj[QStringLiteral("draftcore_version")] = QString::fromLatin1(draftcore::version());
    obj[QStringLiteral("dxf_version")] = dxf::versionName(dxfVersion);
    obj[QStringLiteral("dimstyle")] = dimstyle;
    obj[QStringLiteral("spline")] = spline;
    obj[QStringLiteral("hatch_color")] = hatchColor;
    return obj;
}

bool FactoryConfig::fromJson(const QJsonObject& json, QString* errorMsg)
{
    // Parse into a copy so a failure leaves this config untouched
    FactoryConfig parsed = *this;

    if (json.contains(QStringLiteral("dxf_version"))) {
        const QString name = json[QStringLiteral("dxf_version")].toString();
        auto version = dxf::versionFromString(name);
        if (!version) {
            if (errorMsg) *errorMsg = QStringLiteral("Unknown DXF version: %1").arg(name);
            return false;
        }
        parsed.dxfVersion = *version;
    }

    if (json.contains(QStringLiteral("dimstyle"))) {
        parsed.dimstyle = json[QStringLiteral("dimstyle")].toString(parsed.dimstyle);
    }

    if (json.contains(QStringLiteral("spline"))) {
        const QJsonObject spline = json[QStringLiteral("spline")].toObject();
        parsed.fit.degree = spline[QStringLiteral("degree")].toInt(parsed.fit.degree);
        parsed.fit.power = spline[QStringLiteral("power")].toDouble(parsed.fit.power);
        if (spline.contains(QStringLiteral("method"))) {
            const QString name = spline[QStringLiteral("method")].toString();
            auto method = geometry::methodFromString(name);
            if (!method.success) {
                if (errorMsg) *errorMsg = QStringLiteral("Unknown spline method: %1").arg(name);
                return false;
            }
            parsed.fit.method = method.value;
        }
        if (parsed.fit.degree < 1) {
            if (errorMsg) *errorMsg = QStringLiteral("Spline degree must be at least 1");
            return false;
        }
    }

    if (json.contains(QStringLiteral("hatch_color"))) {
        parsed.hatchColor = json[QStringLiteral("hatch_color")].toInt(parsed.hatchColor);
    }

    *this = parsed;
    return true;
}

bool FactoryConfig::load(const QString& path, QString* errorMsg)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to read config: %1").arg(file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMsg) *errorMsg = QStringLiteral("Invalid config JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        if (errorMsg) *errorMsg = QStringLiteral("Config must be a JSON object");
        return false;
    }

    if (!fromJson(doc.object(), errorMsg)) {
        qCWarning(lcConfig) << "Rejected config" << path;
        return false;
    }
    qCDebug(lcConfig) << "Loaded config" << path << "DXF" << dxf::versionName(dxfVersion);
    return true;
}

bool FactoryConfig::save(const QString& path, QString* errorMsg) const
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to write config: %1").arg(file.errorString());
        return false;
    }

    QJsonDocument doc(toJson());
    file.write(doc.toJson(QJsonDocument::Indented));
    return true;
}

}  // namespace draftcore
