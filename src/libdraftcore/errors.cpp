// =====================================================================
//  src/libdraftcore/errors.cpp — Operation errors
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/errors.h>

namespace draftcore {

QString Error::toString() const
{
    switch (code) {
    case ErrorCode::None:
        return QString();
    case ErrorCode::VersionError:
        return QStringLiteral("%1 requires DXF version %2+ (active version is %3)")
            .arg(entityType, dxf::versionName(required), dxf::versionName(actual));
    case ErrorCode::ValueError:
        if (field.isEmpty()) {
            return message;
        }
        return QStringLiteral("Invalid '%1': %2").arg(field, message);
    }
    return message;
}

Error Error::version(const QString& entityType, dxf::DxfVersion required,
                     dxf::DxfVersion actual)
{
    Error e;
    e.code = ErrorCode::VersionError;
    e.entityType = entityType;
    e.required = required;
    e.actual = actual;
    e.message = e.toString();
    return e;
}

Error Error::value(const QString& field, const QString& message)
{
    Error e;
    e.code = ErrorCode::ValueError;
    e.field = field;
    e.message = message;
    return e;
}

}  // namespace draftcore
