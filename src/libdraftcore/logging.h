// =====================================================================
//  src/libdraftcore/logging.h — Logging categories (private)
// =====================================================================
//
//  Enable with QT_LOGGING_RULES, e.g. "draftcore.*.debug=true".
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_LOGGING_H
#define DRAFTCORE_LOGGING_H

#include <QLoggingCategory>

namespace draftcore {

Q_DECLARE_LOGGING_CATEGORY(lcFactory)
Q_DECLARE_LOGGING_CATEGORY(lcSpline)
Q_DECLARE_LOGGING_CATEGORY(lcDimension)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

}  // namespace draftcore

#endif  // DRAFTCORE_LOGGING_H
