// ============================================================================
// VecCase - Source/VecCase/Kernels/AsciiUpper.cpp
// ----------------------------------------------------------------------------
// Per lane, treating the byte b as signed:
//   shifted  = b + (128 - 'a')           wraps 'a'..'z' onto -128..-103
//   isLower  = shifted < -127 + ('z' - 'a')
//   out      = b ^ (isLower & 0x20)
// Only 'a'..'z' land below the bound, so every other byte passes through.
// ============================================================================

#include "VecCase/Kernels/AsciiUpper.hpp"
#include "VecCase/Kernels/OverlapTail.hpp"
#include "VecCase/CoreMinimal.hpp"
#include "VecCase/Simd/Byte16.hpp"
#include "VecCase/Simd/Byte32.hpp"

namespace vcase::kernels
{
    namespace
    {
        constexpr i8 kShift   = static_cast<i8>(128 - 'a');
        constexpr i8 kBound   = static_cast<i8>(-127 + ('z' - 'a'));
        constexpr i8 kCaseBit = 0x20;

        static_assert(kShift == 31 && kBound == -102, "Range-test constants drifted");

        struct UpperConstants16
        {
            simd::Byte16 shift = simd::Splat(kShift);
            simd::Byte16 bound = simd::Splat(kBound);
            simd::Byte16 caseBit = simd::Splat(kCaseBit);
        };

        struct UpperConstants32
        {
            simd::Byte32 shift = simd::Splat32(kShift);
            simd::Byte32 bound = simd::Splat32(kBound);
            simd::Byte32 caseBit = simd::Splat32(kCaseBit);
        };

        template <class Vec, class Constants>
        VCASE_FORCEINLINE Vec UpperLanes(const Vec& bytes, const Constants& k) noexcept
        {
            const Vec shifted = simd::Add(bytes, k.shift);
            const Vec isLower = simd::CmpLt(shifted, k.bound);
            return simd::Xor(bytes, simd::And(isLower, k.caseBit));
        }

        [[nodiscard]] VCASE_FORCEINLINE KernelStatus CheckArguments(const u8* src, u8* dst, usize length, usize minLength) noexcept
        {
            if (VCASE_UNLIKELY(src == nullptr || dst == nullptr))
            {
                return KernelStatus::InvalidArgument;
            }
            if (VCASE_UNLIKELY(length < minLength))
            {
                return KernelStatus::InvalidLength;
            }
            return KernelStatus::Ok;
        }
    } // namespace

    VCASE_NOINLINE KernelStatus ToAsciiUpper128(const u8* src, u8* dst, usize length) noexcept
    {
        if (const KernelStatus status = CheckArguments(src, dst, length, kMinLength128); status != KernelStatus::Ok)
        {
            return status;
        }

        const UpperConstants16 k{};
        ForEachChunkWithOverlapTail<simd::kByte16Lanes>(length, [&](usize offset) noexcept {
            simd::Store(dst + offset, UpperLanes(simd::Load(src + offset), k));
        });
        return KernelStatus::Ok;
    }

    VCASE_NOINLINE KernelStatus ToAsciiUpper128x2(const u8* src, u8* dst, usize length) noexcept
    {
        if (const KernelStatus status = CheckArguments(src, dst, length, kMinLength128x2); status != KernelStatus::Ok)
        {
            return status;
        }

        constexpr usize kStep = 2 * simd::kByte16Lanes;
        static_assert(kStep == kMinLength128x2);

        const UpperConstants16 k{};
        ForEachChunkWithOverlapTail<kStep>(length, [&](usize offset) noexcept {
            // Both loads issue before either store so the two lanes stay independent.
            const simd::Byte16 a = simd::Load(src + offset);
            const simd::Byte16 b = simd::Load(src + offset + simd::kByte16Lanes);
            simd::Store(dst + offset, UpperLanes(a, k));
            simd::Store(dst + offset + simd::kByte16Lanes, UpperLanes(b, k));
        });
        return KernelStatus::Ok;
    }

    VCASE_NOINLINE KernelStatus ToAsciiUpper256(const u8* src, u8* dst, usize length) noexcept
    {
        if (const KernelStatus status = CheckArguments(src, dst, length, kMinLength256); status != KernelStatus::Ok)
        {
            return status;
        }

        static_assert(simd::kByte32Lanes == kMinLength256);

        const UpperConstants32 k{};
        ForEachChunkWithOverlapTail<simd::kByte32Lanes>(length, [&](usize offset) noexcept {
            simd::Store(dst + offset, UpperLanes(simd::Load32(src + offset), k));
        });
        return KernelStatus::Ok;
    }

    KernelStatus ToAsciiUpperReference(const u8* src, u8* dst, usize length) noexcept
    {
        if (src == nullptr || dst == nullptr)
        {
            return KernelStatus::InvalidArgument;
        }

        for (usize i = 0; i < length; ++i)
        {
            const u8 c = src[i];
            dst[i] = (c >= 'a' && c <= 'z') ? static_cast<u8>(c ^ 0x20u) : c;
        }
        return KernelStatus::Ok;
    }

    std::span<const KernelDesc> AllAsciiUpperKernels() noexcept
    {
        static constexpr KernelDesc kKernels[] = {
            { "ToAsciiUpper128",   kMinLength128,   128, simd::HasNativeByte16(), &ToAsciiUpper128 },
            { "ToAsciiUpper128x2", kMinLength128x2, 128, simd::HasNativeByte16(), &ToAsciiUpper128x2 },
            { "ToAsciiUpper256",   kMinLength256,   256, simd::HasNativeByte32(), &ToAsciiUpper256 },
        };
        return kKernels;
    }

} // namespace vcase::kernels
