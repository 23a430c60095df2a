#pragma once
//
// VecCase - VecCase/Diagnostics/Check.hpp
// Centralized lightweight diagnostics macros (no heavy deps).
//
// Provided:
//   - VCASE_CHECK(cond): soft check (no-op in Release). In Debug, optional breakpoint.
//
// Not provided here (to avoid clashes with Logger.hpp):
//   - VCASE_ASSERT(...) -> lives in Logger.hpp (rich formatting).
//
// Optional toggles (define before including this header):
//   - VCASE_CHECK_BREAK   : if defined, VCASE_CHECK will break in Debug when cond fails
//

// ----------------------------------------------------------------------------
// Debug detection (respects user-defined VCASE_DEBUG; falls back to !NDEBUG)
// ----------------------------------------------------------------------------
#ifndef VCASE_DEBUG
#  ifndef NDEBUG
#    define VCASE_DEBUG 1
#  else
#    define VCASE_DEBUG 0
#  endif
#endif

// ----------------------------------------------------------------------------
// Internal cross-compiler debug break helper (Debug only)
// ----------------------------------------------------------------------------
#if VCASE_DEBUG
#  if defined(_MSC_VER)
#    define VCASE_INTERNAL_DEBUG_BREAK() __debugbreak()
#  elif defined(__clang__) || defined(__GNUC__)
#    define VCASE_INTERNAL_DEBUG_BREAK() __builtin_trap()
#  else
#    include <cstdlib>
#    define VCASE_INTERNAL_DEBUG_BREAK() std::abort()
#  endif
#else
#  define VCASE_INTERNAL_DEBUG_BREAK() ((void)0)
#endif

// ----------------------------------------------------------------------------
// VCASE_CHECK: soft check
//  - Release: no-op
//  - Debug:   by default no break (non-intrusive); define VCASE_CHECK_BREAK to break
// ----------------------------------------------------------------------------
#ifndef VCASE_CHECK
#  if VCASE_DEBUG
#    ifdef VCASE_CHECK_BREAK
#      define VCASE_CHECK(cond) do { if(!(cond)) { VCASE_INTERNAL_DEBUG_BREAK(); } } while(0)
#    else
#      define VCASE_CHECK(cond) do { if(!(cond)) { /* optional breakpoint in debug */ } } while(0)
#    endif
#  else
#    define VCASE_CHECK(cond) ((void)0)
#  endif
#endif
