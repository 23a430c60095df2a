// ============================================================================
// Correctness Verifier Smoke Test
// ----------------------------------------------------------------------------
// Purpose : Real kernels pass the bilingual sample; broken, rejecting and
//           missing kernels are reported with the right status.
// Contract: No exceptions escape; deterministic; returns non-zero on failure.
// ============================================================================

#include "VecCase/Bench/Verifier.hpp"
#include "VecCase/Kernels/AsciiUpper.hpp"

#include <cstring>
#include <string_view>

namespace
{
    using namespace vcase;

    // Copies without converting.
    kernels::KernelStatus IdentityKernel(const u8* src, u8* dst, usize length) noexcept
    {
        std::memcpy(dst, src, length);
        return kernels::KernelStatus::Ok;
    }

    // Also flips UTF-8 lead bytes, corrupting the Cyrillic sequences.
    kernels::KernelStatus OverreachingKernel(const u8* src, u8* dst, usize length) noexcept
    {
        const kernels::KernelStatus status = kernels::ToAsciiUpperReference(src, dst, length);
        for (usize i = 0; i < length; ++i)
        {
            if (dst[i] >= 0xC0u)
            {
                dst[i] = static_cast<u8>(dst[i] ^ 0x20u);
            }
        }
        return status;
    }

    kernels::KernelStatus RejectingKernel(const u8*, u8*, usize) noexcept
    {
        return kernels::KernelStatus::InvalidLength;
    }
} // namespace

int RunVerifierSmoke()
{
    using namespace vcase::bench;

    if (kVerifyInput.size() != kVerifyExpected.size() || kVerifyInput.size() <= kernels::kMinLength256)
    {
        return 1;
    }

    for (const kernels::KernelDesc& kernel : kernels::AllAsciiUpperKernels())
    {
        const VerifyResult result = VerifyKernel(kernel);
        if (!result.Passed() || result.actual != kVerifyExpected)
        {
            return 2;
        }
    }

    {
        const kernels::KernelDesc identity{ "Identity", 1, 8, false, &IdentityKernel };
        const VerifyResult result = VerifyKernel(identity);
        if (result.status != VerifyStatus::Mismatch || result.actual != kVerifyInput)
        {
            return 3;
        }
    }

    {
        const kernels::KernelDesc overreaching{ "Overreaching", 1, 8, false, &OverreachingKernel };
        const VerifyResult result = VerifyKernel(overreaching);
        if (result.status != VerifyStatus::Mismatch || result.actual == kVerifyExpected)
        {
            return 4;
        }
    }

    {
        const kernels::KernelDesc rejecting{ "Rejecting", 1, 8, false, &RejectingKernel };
        const VerifyResult result = VerifyKernel(rejecting);
        if (result.status != VerifyStatus::KernelRejected ||
            result.kernelStatus != kernels::KernelStatus::InvalidLength ||
            !result.actual.empty())
        {
            return 5;
        }
    }

    {
        const kernels::KernelDesc missing{ "Missing", 1, 8, false, nullptr };
        if (VerifyKernel(missing).status != VerifyStatus::KernelRejected)
        {
            return 6;
        }
    }

    // Custom sample through the same comparison path.
    {
        const kernels::KernelDesc kernel = kernels::AllAsciiUpperKernels()[1];
        const VerifyResult result = VerifyKernelOn(kernel,
            "zzzz aaaa ~~~~ ```` {{{{ @@@@ [[[[ ZZZZ",
            "ZZZZ AAAA ~~~~ ```` {{{{ @@@@ [[[[ ZZZZ");
        if (!result.Passed())
        {
            return 7;
        }
    }

    if (std::string_view(VerifyStatusName(VerifyStatus::Mismatch)) != "Mismatch")
    {
        return 8;
    }

    return 0;
}
