#pragma once
// ============================================================================
// VecCase - VecCase/Memory/Alignment.hpp
// ----------------------------------------------------------------------------
// Purpose : Centralize alignment math (predicates, normalization, integer
//           round-up) in constexpr-friendly utilities.
// Contract: Buffers and page helpers route alignment math through these
//           helpers to guarantee power-of-two results >= alignof(max_align_t).
// Notes   : Integer overloads are constrained to unsigned types. Saturation
//           avoids UB on extreme inputs to keep behavior deterministic.
// ============================================================================

#include <cstddef>      // std::size_t, std::max_align_t
#include <cstdint>      // std::uintptr_t
#include <limits>       // std::numeric_limits
#include <type_traits>  // std::is_integral_v, std::is_unsigned_v

#include "VecCase/Diagnostics/Check.hpp"
#include "VecCase/Logger.hpp" // VCASE_LOG_*, VCASE_ASSERT

#ifndef VCASE_LOGCAT_ALIGNMENT
#define VCASE_LOGCAT_ALIGNMENT "Memory.Alignment"
#endif

namespace vcase::core
{
    using usize = std::size_t;

    // ---
    // Purpose : Test whether the provided unsigned value has exactly one bit set.
    // Contract: Returns true only when value > 0 and power-of-two.
    // ---
    [[nodiscard]] constexpr bool IsPowerOfTwo(usize x) noexcept
    {
        return (x != 0) && ((x & (x - 1)) == 0);
    }

    namespace detail
    {
        [[nodiscard]] constexpr usize HighestPow2() noexcept
        {
            return (usize{ 1 } << (std::numeric_limits<usize>::digits - 1));
        }

        // ---
        // Purpose : Round arbitrary unsigned input up to the next power-of-two with saturation.
        // Contract: Returns at least 1; clamps to HighestPow2() on overflow.
        // ---
        [[nodiscard]] constexpr usize NextPow2Saturated(usize x) noexcept
        {
            if (x == 0) return usize{ 1 };
            if (IsPowerOfTwo(x)) return x;
            if (x > HighestPow2()) return HighestPow2();

            usize p = 1;
            while (p < x) { p <<= 1; }
            return p;
        }

        template <class U>
        [[nodiscard]] constexpr bool add_would_overflow(U a, U b) noexcept
        {
            static_assert(std::is_unsigned_v<U>, "Overflow helper expects unsigned type");
            return a > (std::numeric_limits<U>::max)() - b;
        }
    } // namespace detail

    // ---
    // Purpose : Canonicalize caller-provided alignment to a power of two.
    // Contract: Maps zero to `alignof(std::max_align_t)`; never returns 0.
    // ---
    [[nodiscard]] constexpr usize NormalizeAlignment(usize alignment) noexcept
    {
        const usize minAlign = alignof(std::max_align_t);
        if (alignment == 0)
            return minAlign;

        const usize rounded = detail::NextPow2Saturated(alignment);
        return (rounded < minAlign) ? minAlign : rounded;
    }

    // ---
    // Purpose : Bump an unsigned integral value up to the next aligned multiple.
    // Contract: T must be unsigned integral; alignment normalized via NormalizeAlignment().
    //           Clamps to max(T) on overflow and reports through VCASE_ASSERT.
    // ---
    template <class T>
    [[nodiscard]] constexpr T AlignUp(T value, usize alignment) noexcept
    {
        static_assert(std::is_integral_v<T>, "AlignUp<T>: T must be integral");
        static_assert(std::is_unsigned_v<T>, "AlignUp<T>: T must be UNSIGNED");
        const T a = static_cast<T>(NormalizeAlignment(alignment));
        const T mask = static_cast<T>(a - T{ 1 });

        if ((value & mask) == T{ 0 })
            return value;

        if (detail::add_would_overflow<T>(value, mask))
        {
            VCASE_ASSERT(false && "AlignUp overflow: value + (alignment-1) exceeds max");
            return (std::numeric_limits<T>::max)();
        }

        return static_cast<T>((value + mask) & ~mask);
    }

    // ---
    // Purpose : Verify an unsigned integer adheres to the requested alignment.
    // ---
    template <class T,
              std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>, int> = 0>
    [[nodiscard]] constexpr bool IsAligned(T value, usize alignment) noexcept
    {
        const T a = static_cast<T>(NormalizeAlignment(alignment));
        return (value & (a - T{ 1 })) == T{ 0 };
    }

    // ---
    // Purpose : Determine whether a pointer satisfies the requested alignment.
    // Contract: Works with null pointers; normalizes alignment before evaluation.
    // Notes   : Misalignment diagnostics are logged only when the category is enabled.
    // ---
    [[nodiscard]] inline bool IsAligned(const void* ptr, usize alignment) noexcept
    {
        const std::uintptr_t p = reinterpret_cast<std::uintptr_t>(ptr);
        const bool ok = IsAligned<std::uintptr_t>(p, alignment);
        if (!ok)
        {
            VCASE_LOG_WARNING(VCASE_LOGCAT_ALIGNMENT, "Pointer {} is NOT aligned to {}",
                ptr, static_cast<usize>(NormalizeAlignment(alignment)));
        }
        return ok;
    }

    static_assert(IsPowerOfTwo(4096), "4096 is power of two");
    static_assert(!IsPowerOfTwo(0), "0 is not power of two");
    static_assert(NormalizeAlignment(0) >= alignof(std::max_align_t),
        "Zero alignment maps to at least max_align_t");
    static_assert(NormalizeAlignment(4096) == 4096,
        "Normalize preserves valid power-of-two");
    static_assert(IsPowerOfTwo(NormalizeAlignment((std::numeric_limits<usize>::max)())),
        "Normalization returns a power-of-two even for extreme inputs");
    static_assert(AlignUp<usize>(4097, 4096) == 8192, "4097 aligned up to 4096 -> 8192");
    static_assert(AlignUp<usize>(4096, 4096) == 4096, "4096 already aligned");
    static_assert(IsAligned<usize>(8192, 4096), "8192 is aligned to 4096");
    static_assert(!IsAligned<usize>(4100, 4096), "4100 is not aligned to 4096");

} // namespace vcase::core
