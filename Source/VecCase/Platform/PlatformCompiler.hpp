// =============================
// PlatformCompiler.hpp
// =============================
#pragma once

// Compiler/attributes helpers.
// Keep simple. Prefer standard C++ attributes where possible.

// -----------------------------
// Compiler detection
// -----------------------------
#if defined(_MSC_VER)
#define VCASE_COMPILER_MSVC 1
#else
#define VCASE_COMPILER_MSVC 0
#endif

#if defined(__clang__)
#define VCASE_COMPILER_CLANG 1
#else
#define VCASE_COMPILER_CLANG 0
#endif

#if defined(__GNUC__) && !VCASE_COMPILER_CLANG
#define VCASE_COMPILER_GCC 1
#else
#define VCASE_COMPILER_GCC 0
#endif

// -----------------------------
// Inlining / noinline
// -----------------------------
// Kernel entry points are NOINLINE; timed calls stay real calls.
#if VCASE_COMPILER_MSVC
#define VCASE_FORCEINLINE __forceinline
#define VCASE_NOINLINE    __declspec(noinline)
#else
#define VCASE_FORCEINLINE inline __attribute__((always_inline))
#define VCASE_NOINLINE    __attribute__((noinline))
#endif
