// =====================================================================
//  src/libdraftcore/draftcore/errors.h — Operation errors and results
// =====================================================================
//
//  Every factory and engine operation reports failure through a Result
//  carrying an Error.  Validation failures are detected before anything
//  is sent to the entity database, so a failed Result means nothing
//  was created.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_ERRORS_H
#define DRAFTCORE_ERRORS_H

#include "core.h"
#include "dxf/types.h"

#include <QString>

#include <utility>

namespace draftcore {

/// Error taxonomy
enum class ErrorCode {
    None,           ///< No error
    VersionError,   ///< Entity kind not supported by the active DXF version
    ValueError      ///< Malformed geometric or attribute input
};

/// Error details, enough to form an actionable message
struct DRAFTCORE_EXPORT Error {
    ErrorCode code = ErrorCode::None;
    QString message;
    QString entityType;                               ///< Version errors: DXF type
    dxf::DxfVersion required = dxf::DxfVersion::R12;  ///< Version errors
    dxf::DxfVersion actual = dxf::DxfVersion::R12;    ///< Version errors
    QString field;                                    ///< Value errors: offending input

    bool isError() const { return code != ErrorCode::None; }

    /// Human-readable description including kind, versions or field
    QString toString() const;

    /// Entity kind requires a newer DXF version
    static Error version(const QString& entityType, dxf::DxfVersion required,
                         dxf::DxfVersion actual);

    /// Malformed input value
    static Error value(const QString& field, const QString& message);
};

/// Outcome of a fallible operation
template <typename T>
struct Result {
    bool success = false;
    T value{};
    Error error;

    static Result ok(T v)
    {
        Result r;
        r.success = true;
        r.value = std::move(v);
        return r;
    }

    static Result fail(Error e)
    {
        Result r;
        r.error = std::move(e);
        return r;
    }
};

}  // namespace draftcore

#endif  // DRAFTCORE_ERRORS_H
