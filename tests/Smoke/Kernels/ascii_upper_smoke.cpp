// ============================================================================
// AsciiUpper Smoke Test
// ----------------------------------------------------------------------------
// Purpose : Check every vector kernel against the scalar reference across all
//           lengths from the kernel minimum upward, the full byte range,
//           in-place use, idempotence, and argument rejection.
// Contract: No exceptions escape; deterministic; returns non-zero on failure.
// ============================================================================

#include "VecCase/Kernels/AsciiUpper.hpp"
#include "VecCase/Simd/Byte32.hpp"

#include <cstring>
#include <string_view>
#include <vector>

namespace
{
    using namespace vcase;
    using namespace vcase::kernels;

    constexpr usize kMaxLength = 300;
    constexpr u8 kCanary = 0xCC;

    // Deterministic bytes that sweep every value, including 'a'..'z' and >= 0x80.
    void FillPattern(std::vector<u8>& bytes, usize salt)
    {
        for (usize i = 0; i < bytes.size(); ++i)
        {
            bytes[i] = static_cast<u8>((i * 37u + salt * 11u + 5u) & 0xFFu);
        }
    }

    int CheckAgainstReference(const KernelDesc& kernel)
    {
        std::vector<u8> src(kMaxLength);
        std::vector<u8> expected(kMaxLength);
        std::vector<u8> dst(kMaxLength + 1);

        for (usize length = kernel.minLength; length <= kMaxLength; ++length)
        {
            FillPattern(src, length);
            if (ToAsciiUpperReference(src.data(), expected.data(), length) != KernelStatus::Ok)
            {
                return 1;
            }

            std::memset(dst.data(), kCanary, dst.size());
            if (kernel.fn(src.data(), dst.data(), length) != KernelStatus::Ok)
            {
                return 2;
            }
            if (std::memcmp(dst.data(), expected.data(), length) != 0)
            {
                return 3;
            }
            // Nothing past `length` may be touched.
            if (dst[length] != kCanary)
            {
                return 4;
            }

            // Idempotence: a second pass over uppercase output changes nothing.
            if (kernel.fn(dst.data(), dst.data(), length) != KernelStatus::Ok ||
                std::memcmp(dst.data(), expected.data(), length) != 0)
            {
                return 5;
            }
        }
        return 0;
    }

    int CheckFullByteRange(const KernelDesc& kernel)
    {
        std::vector<u8> src(256);
        std::vector<u8> dst(256);
        for (usize i = 0; i < src.size(); ++i)
        {
            src[i] = static_cast<u8>(i);
        }

        if (kernel.fn(src.data(), dst.data(), src.size()) != KernelStatus::Ok)
        {
            return 10;
        }

        for (usize i = 0; i < dst.size(); ++i)
        {
            const u8 expected = (i >= 'a' && i <= 'z') ? static_cast<u8>(i - 32u) : static_cast<u8>(i);
            if (dst[i] != expected)
            {
                return 11;
            }
        }
        return 0;
    }

    int CheckInPlace(const KernelDesc& kernel)
    {
        constexpr std::string_view kText = "the quick brown fox jumps over the lazy dog 0123456789 {|}~`@[";
        constexpr std::string_view kUpper = "THE QUICK BROWN FOX JUMPS OVER THE LAZY DOG 0123456789 {|}~`@[";
        static_assert(kText.size() == kUpper.size());

        std::vector<u8> buffer(kText.begin(), kText.end());
        if (kernel.fn(buffer.data(), buffer.data(), buffer.size()) != KernelStatus::Ok)
        {
            return 20;
        }
        if (std::memcmp(buffer.data(), kUpper.data(), kUpper.size()) != 0)
        {
            return 21;
        }
        return 0;
    }

    int CheckRejections(const KernelDesc& kernel)
    {
        std::vector<u8> src(kernel.minLength, static_cast<u8>('a'));
        std::vector<u8> dst(kernel.minLength, kCanary);

        if (kernel.fn(src.data(), dst.data(), kernel.minLength - 1) != KernelStatus::InvalidLength)
        {
            return 30;
        }
        if (kernel.fn(src.data(), dst.data(), 0) != KernelStatus::InvalidLength)
        {
            return 31;
        }
        for (u8 b : dst)
        {
            if (b != kCanary)
            {
                return 32;
            }
        }
        if (kernel.fn(nullptr, dst.data(), kernel.minLength) != KernelStatus::InvalidArgument)
        {
            return 33;
        }
        if (kernel.fn(src.data(), nullptr, kernel.minLength) != KernelStatus::InvalidArgument)
        {
            return 34;
        }

        // Exactly the minimum is served by the tail chunk alone.
        if (kernel.fn(src.data(), dst.data(), kernel.minLength) != KernelStatus::Ok)
        {
            return 35;
        }
        for (u8 b : dst)
        {
            if (b != static_cast<u8>('A'))
            {
                return 36;
            }
        }
        return 0;
    }
} // namespace

int RunAsciiUpperSmoke()
{
    const auto kernelList = AllAsciiUpperKernels();
    if (kernelList.size() != 3)
    {
        return 100;
    }

    if (std::string_view(kernelList[0].name) != "ToAsciiUpper128" ||
        std::string_view(kernelList[1].name) != "ToAsciiUpper128x2" ||
        std::string_view(kernelList[2].name) != "ToAsciiUpper256")
    {
        return 101;
    }

    if (kernelList[0].minLength != 16 || kernelList[1].minLength != 32 || kernelList[2].minLength != 32)
    {
        return 102;
    }

    // Each flavor links its own kernels; native flags follow the ISA this
    // binary was compiled for.
    if (kernelList[0].native != simd::HasNativeByte16() ||
        kernelList[1].native != simd::HasNativeByte16() ||
        kernelList[2].native != simd::HasNativeByte32())
    {
        return 103;
    }
#if VCASE_ISA_AVX2
    if (kernelList[2].vectorBits != 256 || !kernelList[2].native)
    {
        return 104;
    }
#endif

    for (const KernelDesc& kernel : kernelList)
    {
        if (int rc = CheckAgainstReference(kernel); rc != 0) return rc;
        if (int rc = CheckFullByteRange(kernel); rc != 0) return rc;
        if (int rc = CheckInPlace(kernel); rc != 0) return rc;
        if (int rc = CheckRejections(kernel); rc != 0) return rc;
    }

    // Reference accepts any length, including zero.
    u8 one = static_cast<u8>('q');
    if (ToAsciiUpperReference(&one, &one, 0) != KernelStatus::Ok || one != 'q')
    {
        return 110;
    }
    if (ToAsciiUpperReference(&one, &one, 1) != KernelStatus::Ok || one != 'Q')
    {
        return 111;
    }

    return 0;
}
