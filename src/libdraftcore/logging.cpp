// =====================================================================
//  src/libdraftcore/logging.cpp — Logging categories
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "logging.h"

namespace draftcore {

Q_LOGGING_CATEGORY(lcFactory, "draftcore.factory")
Q_LOGGING_CATEGORY(lcSpline, "draftcore.spline")
Q_LOGGING_CATEGORY(lcDimension, "draftcore.dimension")
Q_LOGGING_CATEGORY(lcConfig, "draftcore.config")

}  // namespace draftcore
