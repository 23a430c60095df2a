// =============================
// PlatformDefines.hpp
// =============================
#pragma once

// Pure preprocessor platform detection (OS, arch, word size).
// Keep this header *very* lightweight: no runtime logic, no external deps.

// -----------------------------
// OS Detection
// -----------------------------
#if defined(_WIN32) || defined(_WIN64)
#define VCASE_PLATFORM_WINDOWS 1
#else
#define VCASE_PLATFORM_WINDOWS 0
#endif

#if defined(__linux__)
#define VCASE_PLATFORM_LINUX 1
#else
#define VCASE_PLATFORM_LINUX 0
#endif

#if defined(__APPLE__) && defined(__MACH__)
#define VCASE_PLATFORM_APPLE 1
#else
#define VCASE_PLATFORM_APPLE 0
#endif

// -----------------------------
// CPU Architecture
// -----------------------------
#if defined(_M_X64) || defined(__x86_64__)
#define VCASE_CPU_X64 1
#else
#define VCASE_CPU_X64 0
#endif

#if defined(_M_IX86) || defined(__i386__)
#define VCASE_CPU_X86 1
#else
#define VCASE_CPU_X86 0
#endif

#if defined(__aarch64__) || defined(_M_ARM64)
#define VCASE_CPU_ARM64 1
#else
#define VCASE_CPU_ARM64 0
#endif

// Either flavor of x86 exposes CPUID.
#define VCASE_CPU_X86_FAMILY (VCASE_CPU_X64 || VCASE_CPU_X86)

// -----------------------------
// Instruction sets enabled at compile time
// -----------------------------
// These reflect the -m / -march flags of the translation unit, not the host.
// Runtime capabilities are reported by the feature probe (Cpu/).
#if defined(__SSE2__) || defined(_M_X64) || (defined(_M_IX86_FP) && _M_IX86_FP >= 2)
#define VCASE_ISA_SSE2 1
#else
#define VCASE_ISA_SSE2 0
#endif

#if defined(__AVX2__)
#define VCASE_ISA_AVX2 1
#else
#define VCASE_ISA_AVX2 0
#endif

#if defined(__ARM_NEON) || defined(__ARM_NEON__) || defined(_M_ARM64)
#define VCASE_ISA_NEON 1
#else
#define VCASE_ISA_NEON 0
#endif

// -----------------------------
// Word size (32/64 bits)
// -----------------------------
#if defined(_WIN64) || defined(__x86_64__) || defined(__aarch64__) || defined(__ppc64__) || defined(__LP64__)
#define VCASE_PLATFORM_64BITS 1
#define VCASE_PLATFORM_32BITS 0
#else
#define VCASE_PLATFORM_64BITS 0
#define VCASE_PLATFORM_32BITS 1
#endif

// -----------------------------
// Sanity guards
// -----------------------------
#if ((VCASE_PLATFORM_32BITS + VCASE_PLATFORM_64BITS) != 1)
#error "VCASE: Exactly one of VCASE_PLATFORM_32BITS or VCASE_PLATFORM_64BITS must be 1."
#endif

// Keep this file preprocessor-only.
