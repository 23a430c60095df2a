#pragma once
// ============================================================================
// VecCase - Source/VecCase/Kernels/AsciiUpper.hpp
// ----------------------------------------------------------------------------
// Purpose : Branchless ASCII uppercase kernels at three vector widths plus a
//           scalar reference used as the test oracle.
// Contract:
//   - Every byte in 'a'..'z' becomes the matching 'A'..'Z'; every other byte
//     (including all bytes >= 0x80) is copied unchanged.
//   - src and dst must each be valid for `length` bytes. They may be the same
//     pointer (in-place); partial overlap is not supported.
//   - A vector kernel requires length >= its minimum width. A shorter length
//     returns KernelStatus::InvalidLength and writes nothing; a null pointer
//     returns KernelStatus::InvalidArgument and writes nothing.
//   - All kernels are noexcept and allocation-free.
// Notes:
//   - The SIMD backend is fixed when this module is compiled (see
//     Simd/Byte16.hpp). Each build flavor compiles its own copy, and
//     KernelDesc::native reports whether that copy runs at native width.
// ============================================================================

#include "VecCase/Types.hpp"

#include <span>

namespace vcase::kernels
{
    enum class KernelStatus : u8
    {
        Ok = 0,
        InvalidArgument, // Null source or destination.
        InvalidLength,   // length below the kernel's minimum width.
    };

    [[nodiscard]] constexpr const char* KernelStatusName(KernelStatus status) noexcept
    {
        switch (status)
        {
        case KernelStatus::Ok:              return "Ok";
        case KernelStatus::InvalidArgument: return "InvalidArgument";
        case KernelStatus::InvalidLength:   return "InvalidLength";
        default:                            return "<unknown>";
        }
    }

    using KernelFn = KernelStatus (*)(const u8* src, u8* dst, usize length) noexcept;

    // Uniform handle the verifier and runner use for every variant.
    struct KernelDesc
    {
        const char* name = nullptr;
        usize       minLength = 0;
        u32         vectorBits = 0;
        bool        native = false; // Vector width maps onto a real register on this build.
        KernelFn    fn = nullptr;
    };

    inline constexpr usize kMinLength128   = 16;
    inline constexpr usize kMinLength128x2 = 32;
    inline constexpr usize kMinLength256   = 32;

    // 16-byte vectors; tail is one chunk at length - 16.
    [[nodiscard]] KernelStatus ToAsciiUpper128(const u8* src, u8* dst, usize length) noexcept;

    // Two independent 16-byte vectors per step; tail is two chunks at
    // length - 32 and length - 16.
    [[nodiscard]] KernelStatus ToAsciiUpper128x2(const u8* src, u8* dst, usize length) noexcept;

    // 32-byte vectors; AVX2 when compiled for it, two 16-byte halves otherwise.
    [[nodiscard]] KernelStatus ToAsciiUpper256(const u8* src, u8* dst, usize length) noexcept;

    // Byte-at-a-time oracle. Accepts any length, including 0.
    [[nodiscard]] KernelStatus ToAsciiUpperReference(const u8* src, u8* dst, usize length) noexcept;

    // The three vector kernels in benchmark order: 128, 128x2, 256.
    [[nodiscard]] std::span<const KernelDesc> AllAsciiUpperKernels() noexcept;

} // namespace vcase::kernels
