// =====================================================================
//  src/libdraftcore/core.cpp -- Library version information
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "draftcore/core.h"

// OCCT kernel headers
#include <Standard_Version.hxx>

namespace draftcore {

const char* version()
{
    return "0.1.0";
}

const char* occtVersion()
{
    return OCC_VERSION_COMPLETE;
}

}  // namespace draftcore
