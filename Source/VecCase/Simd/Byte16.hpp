#pragma once

// ============================================================================
// VecCase - Source/VecCase/Simd/Byte16.hpp
// ----------------------------------------------------------------------------
// Purpose : Provide a thin, SIMD-friendly abstraction for 16 lanes of signed
//           8-bit integers. Backends: SSE2, NEON, and a portable scalar
//           fallback with identical results.
// ----------------------------------------------------------------------------
// Contract:
//   - No dynamic allocations, no exceptions, no RTTI.
//   - Arithmetic wraps modulo 256 per lane on every backend.
//   - Comparisons are signed and return an all-ones (0xFF) or all-zeros lane.
//   - Load/Store are unaligned; ptr must be valid for 16 bytes.
// ----------------------------------------------------------------------------
// Notes:
//   - The backend is chosen from the translation unit's ISA flags
//     (VCASE_ISA_*), not from the running host. A TU compiled without SSE2 or
//     NEON gets the scalar fallback even on capable hardware.
//   - Keep the API surface identical across backends; call sites never
//     branch on the backend.
// ============================================================================

#include "VecCase/Platform/PlatformDefines.hpp"
#include "VecCase/Platform/PlatformCompiler.hpp"
#include "VecCase/Types.hpp"

#if VCASE_ISA_SSE2
#    include <emmintrin.h>
#elif VCASE_ISA_NEON
#    include <arm_neon.h>
#else
#    include <cstring>
#endif

namespace vcase
{
    namespace simd
    {
        // --------------------------------------------------------------------
        // Capability flags
        // --------------------------------------------------------------------
        namespace detail
        {
#if VCASE_ISA_SSE2 || VCASE_ISA_NEON
            static constexpr bool kHasNativeByte16 = true;
#else
            static constexpr bool kHasNativeByte16 = false;
#endif
        } // namespace detail

        [[nodiscard]] inline constexpr bool HasNativeByte16() noexcept
        {
            return detail::kHasNativeByte16;
        }

        [[nodiscard]] inline constexpr const char* Byte16BackendName() noexcept
        {
#if VCASE_ISA_SSE2
            return "SSE2";
#elif VCASE_ISA_NEON
            return "NEON";
#else
            return "Scalar";
#endif
        }

        inline constexpr usize kByte16Lanes = 16;

        // --------------------------------------------------------------------
        // Byte16
        // --------------------------------------------------------------------
        // Wraps the native 128-bit register when a backend is available, a
        // plain lane array otherwise.
        struct Byte16
        {
#if VCASE_ISA_SSE2
            __m128i v;
#elif VCASE_ISA_NEON
            int8x16_t v;
#else
            i8 lanes[kByte16Lanes];
#endif
        };

        // --------------------------------------------------------------------
        // Construction helpers
        // --------------------------------------------------------------------

        [[nodiscard]] VCASE_FORCEINLINE Byte16 Splat(i8 value) noexcept
        {
#if VCASE_ISA_SSE2
            return Byte16{ _mm_set1_epi8(static_cast<char>(value)) };
#elif VCASE_ISA_NEON
            return Byte16{ vdupq_n_s8(value) };
#else
            Byte16 r{};
            for (usize i = 0; i < kByte16Lanes; ++i)
            {
                r.lanes[i] = value;
            }
            return r;
#endif
        }

        // --------------------------------------------------------------------
        // Load / Store (unaligned)
        // --------------------------------------------------------------------

        [[nodiscard]] VCASE_FORCEINLINE Byte16 Load(const u8* ptr) noexcept
        {
#if VCASE_ISA_SSE2
            return Byte16{ _mm_loadu_si128(reinterpret_cast<const __m128i*>(ptr)) };
#elif VCASE_ISA_NEON
            return Byte16{ vld1q_s8(reinterpret_cast<const int8_t*>(ptr)) };
#else
            Byte16 r{};
            std::memcpy(r.lanes, ptr, kByte16Lanes);
            return r;
#endif
        }

        VCASE_FORCEINLINE void Store(u8* ptr, const Byte16& value) noexcept
        {
#if VCASE_ISA_SSE2
            _mm_storeu_si128(reinterpret_cast<__m128i*>(ptr), value.v);
#elif VCASE_ISA_NEON
            vst1q_s8(reinterpret_cast<int8_t*>(ptr), value.v);
#else
            std::memcpy(ptr, value.lanes, kByte16Lanes);
#endif
        }

        // --------------------------------------------------------------------
        // Lane-wise operations
        // --------------------------------------------------------------------

        // Wrapping add.
        [[nodiscard]] VCASE_FORCEINLINE Byte16 Add(const Byte16& a, const Byte16& b) noexcept
        {
#if VCASE_ISA_SSE2
            return Byte16{ _mm_add_epi8(a.v, b.v) };
#elif VCASE_ISA_NEON
            return Byte16{ vaddq_s8(a.v, b.v) };
#else
            Byte16 r{};
            for (usize i = 0; i < kByte16Lanes; ++i)
            {
                r.lanes[i] = static_cast<i8>(static_cast<u8>(static_cast<u8>(a.lanes[i]) + static_cast<u8>(b.lanes[i])));
            }
            return r;
#endif
        }

        // Signed a < b, 0xFF where true.
        [[nodiscard]] VCASE_FORCEINLINE Byte16 CmpLt(const Byte16& a, const Byte16& b) noexcept
        {
#if VCASE_ISA_SSE2
            return Byte16{ _mm_cmplt_epi8(a.v, b.v) };
#elif VCASE_ISA_NEON
            return Byte16{ vreinterpretq_s8_u8(vcltq_s8(a.v, b.v)) };
#else
            Byte16 r{};
            for (usize i = 0; i < kByte16Lanes; ++i)
            {
                r.lanes[i] = (a.lanes[i] < b.lanes[i]) ? i8{ -1 } : i8{ 0 };
            }
            return r;
#endif
        }

        [[nodiscard]] VCASE_FORCEINLINE Byte16 And(const Byte16& a, const Byte16& b) noexcept
        {
#if VCASE_ISA_SSE2
            return Byte16{ _mm_and_si128(a.v, b.v) };
#elif VCASE_ISA_NEON
            return Byte16{ vandq_s8(a.v, b.v) };
#else
            Byte16 r{};
            for (usize i = 0; i < kByte16Lanes; ++i)
            {
                r.lanes[i] = static_cast<i8>(a.lanes[i] & b.lanes[i]);
            }
            return r;
#endif
        }

        [[nodiscard]] VCASE_FORCEINLINE Byte16 Xor(const Byte16& a, const Byte16& b) noexcept
        {
#if VCASE_ISA_SSE2
            return Byte16{ _mm_xor_si128(a.v, b.v) };
#elif VCASE_ISA_NEON
            return Byte16{ veorq_s8(a.v, b.v) };
#else
            Byte16 r{};
            for (usize i = 0; i < kByte16Lanes; ++i)
            {
                r.lanes[i] = static_cast<i8>(a.lanes[i] ^ b.lanes[i]);
            }
            return r;
#endif
        }

    } // namespace simd
} // namespace vcase
