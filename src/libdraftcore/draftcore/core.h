// =====================================================================
//  src/libdraftcore/draftcore/core.h — Library version and export macros
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_CORE_H
#define DRAFTCORE_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building libdraftcore as a shared library, DRAFTCORE_SHARED and
// DRAFTCORE_BUILDING are defined.  Consumers linking against the shared
// library only see DRAFTCORE_SHARED (set as a PUBLIC compile definition).

#if defined(DRAFTCORE_SHARED)
  #if defined(DRAFTCORE_BUILDING)
    #if defined(_WIN32)
      #define DRAFTCORE_EXPORT __declspec(dllexport)
    #else
      #define DRAFTCORE_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define DRAFTCORE_EXPORT __declspec(dllimport)
    #else
      #define DRAFTCORE_EXPORT
    #endif
  #endif
#else
  #define DRAFTCORE_EXPORT
#endif

namespace draftcore {

/// Library version string (e.g., "0.1.0").
DRAFTCORE_EXPORT const char* version();

/// Version of the OpenCASCADE kernel the library was built against.
DRAFTCORE_EXPORT const char* occtVersion();

}  // namespace draftcore

#endif  // DRAFTCORE_CORE_H
