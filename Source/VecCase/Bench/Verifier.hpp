#pragma once
// ============================================================================
// VecCase - VecCase/Bench/Verifier.hpp
// ----------------------------------------------------------------------------
// Purpose : Correctness gate run before any timing. Converts a fixed mixed
//           Cyrillic/Latin UTF-8 string with a kernel and compares the output
//           byte-for-byte with the expected uppercase form.
// Contract: The sample is longer than every kernel's minimum width and mixes
//           multi-byte sequences (which must pass through untouched) with
//           ASCII letters. VerifyKernel never throws for kernel failures; the
//           only exception source is std::string allocation.
// ============================================================================

#include "VecCase/Kernels/AsciiUpper.hpp"

#include <string>
#include <string_view>

namespace vcase::bench
{
    inline constexpr std::string_view kVerifyInput =
        "Привіт, Всесвіт! Hello, World! Привіт, Всесвіт! Hello, World!";
    inline constexpr std::string_view kVerifyExpected =
        "Привіт, Всесвіт! HELLO, WORLD! Привіт, Всесвіт! HELLO, WORLD!";

    enum class VerifyStatus : u8
    {
        Ok = 0,
        KernelRejected, // Kernel returned a non-Ok KernelStatus.
        Mismatch,       // Output differs from the expected bytes.
    };

    [[nodiscard]] constexpr const char* VerifyStatusName(VerifyStatus status) noexcept
    {
        switch (status)
        {
        case VerifyStatus::Ok:             return "Ok";
        case VerifyStatus::KernelRejected: return "KernelRejected";
        case VerifyStatus::Mismatch:       return "Mismatch";
        default:                           return "<unknown>";
        }
    }

    struct VerifyResult
    {
        VerifyStatus          status = VerifyStatus::Ok;
        kernels::KernelStatus kernelStatus = kernels::KernelStatus::Ok;
        std::string           actual; // Bytes the kernel produced (empty when rejected).

        [[nodiscard]] bool Passed() const noexcept { return status == VerifyStatus::Ok; }
    };

    // Verify against an arbitrary sample; input and expected must be the same size.
    [[nodiscard]] VerifyResult VerifyKernelOn(const kernels::KernelDesc& kernel,
                                              std::string_view input,
                                              std::string_view expected);

    // Verify against kVerifyInput / kVerifyExpected.
    [[nodiscard]] VerifyResult VerifyKernel(const kernels::KernelDesc& kernel);

} // namespace vcase::bench
