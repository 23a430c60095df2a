#pragma once

// ============================================================================
// VecCase - Source/VecCase/Simd/Byte32.hpp
// ----------------------------------------------------------------------------
// Purpose : 32 lanes of signed 8-bit integers. Native on AVX2; elsewhere the
//           vector is decomposed into two Byte16 halves.
// Contract: Same lane semantics as Byte16 (wrapping add, signed compare
//           returning 0xFF/0x00, unaligned load/store of 32 bytes).
// Notes   : HasNativeByte32() reports whether this TU was compiled for AVX2.
//           The decomposed path performs two 16-byte operations per call and
//           is the "emulated" width the harness warns about.
// ============================================================================

#include "VecCase/Simd/Byte16.hpp"

#if VCASE_ISA_AVX2
#    include <immintrin.h>
#endif

namespace vcase
{
    namespace simd
    {
        namespace detail
        {
#if VCASE_ISA_AVX2
            static constexpr bool kHasNativeByte32 = true;
#else
            static constexpr bool kHasNativeByte32 = false;
#endif
        } // namespace detail

        [[nodiscard]] inline constexpr bool HasNativeByte32() noexcept
        {
            return detail::kHasNativeByte32;
        }

        inline constexpr usize kByte32Lanes = 32;

        struct Byte32
        {
#if VCASE_ISA_AVX2
            __m256i v;
#else
            Byte16 lo;
            Byte16 hi;
#endif
        };

        [[nodiscard]] VCASE_FORCEINLINE Byte32 Splat32(i8 value) noexcept
        {
#if VCASE_ISA_AVX2
            return Byte32{ _mm256_set1_epi8(static_cast<char>(value)) };
#else
            return Byte32{ Splat(value), Splat(value) };
#endif
        }

        [[nodiscard]] VCASE_FORCEINLINE Byte32 Load32(const u8* ptr) noexcept
        {
#if VCASE_ISA_AVX2
            return Byte32{ _mm256_loadu_si256(reinterpret_cast<const __m256i*>(ptr)) };
#else
            return Byte32{ Load(ptr), Load(ptr + kByte16Lanes) };
#endif
        }

        VCASE_FORCEINLINE void Store(u8* ptr, const Byte32& value) noexcept
        {
#if VCASE_ISA_AVX2
            _mm256_storeu_si256(reinterpret_cast<__m256i*>(ptr), value.v);
#else
            Store(ptr, value.lo);
            Store(ptr + kByte16Lanes, value.hi);
#endif
        }

        [[nodiscard]] VCASE_FORCEINLINE Byte32 Add(const Byte32& a, const Byte32& b) noexcept
        {
#if VCASE_ISA_AVX2
            return Byte32{ _mm256_add_epi8(a.v, b.v) };
#else
            return Byte32{ Add(a.lo, b.lo), Add(a.hi, b.hi) };
#endif
        }

        [[nodiscard]] VCASE_FORCEINLINE Byte32 CmpLt(const Byte32& a, const Byte32& b) noexcept
        {
#if VCASE_ISA_AVX2
            // AVX2 only has greater-than; a < b is b > a.
            return Byte32{ _mm256_cmpgt_epi8(b.v, a.v) };
#else
            return Byte32{ CmpLt(a.lo, b.lo), CmpLt(a.hi, b.hi) };
#endif
        }

        [[nodiscard]] VCASE_FORCEINLINE Byte32 And(const Byte32& a, const Byte32& b) noexcept
        {
#if VCASE_ISA_AVX2
            return Byte32{ _mm256_and_si256(a.v, b.v) };
#else
            return Byte32{ And(a.lo, b.lo), And(a.hi, b.hi) };
#endif
        }

        [[nodiscard]] VCASE_FORCEINLINE Byte32 Xor(const Byte32& a, const Byte32& b) noexcept
        {
#if VCASE_ISA_AVX2
            return Byte32{ _mm256_xor_si256(a.v, b.v) };
#else
            return Byte32{ Xor(a.lo, b.lo), Xor(a.hi, b.hi) };
#endif
        }

    } // namespace simd
} // namespace vcase
