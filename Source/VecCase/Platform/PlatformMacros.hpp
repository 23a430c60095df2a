// =============================
// PlatformMacros.hpp
// =============================
#pragma once

// General-purpose lightweight macros safe across platforms.
// Includes: branch prediction hints.

// -----------------------------
// Branch prediction hints
// -----------------------------
#if defined(__GNUC__) || defined(__clang__)
#ifndef VCASE_LIKELY
#define VCASE_LIKELY(x)   __builtin_expect(!!(x), 1)
#endif
#ifndef VCASE_UNLIKELY
#define VCASE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#endif
#else
  // Safe fallbacks
#ifndef VCASE_LIKELY
#define VCASE_LIKELY(x)   (!!(x))
#endif
#ifndef VCASE_UNLIKELY
#define VCASE_UNLIKELY(x) (!!(x))
#endif
#endif

// Keep this header minimal; prefer standard attributes (e.g. [[nodiscard]]) over macro aliases.
