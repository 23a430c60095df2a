// ============================================================================
// VecCase - VecCase/Bench/Verifier.cpp
// ============================================================================

#include "VecCase/Bench/Verifier.hpp"
#include "VecCase/CoreMinimal.hpp"

#include <utility>

namespace vcase::bench
{
    VerifyResult VerifyKernelOn(const kernels::KernelDesc& kernel,
                                std::string_view input,
                                std::string_view expected)
    {
        VCASE_ASSERT(input.size() == expected.size(), "Verify sample and expectation differ in size");

        VerifyResult result{};
        if (kernel.fn == nullptr)
        {
            result.status = VerifyStatus::KernelRejected;
            result.kernelStatus = kernels::KernelStatus::InvalidArgument;
            return result;
        }

        std::string output(input.size(), '\0');
        const kernels::KernelStatus status = kernel.fn(
            reinterpret_cast<const u8*>(input.data()),
            reinterpret_cast<u8*>(output.data()),
            input.size());

        result.kernelStatus = status;
        if (status != kernels::KernelStatus::Ok)
        {
            result.status = VerifyStatus::KernelRejected;
            return result;
        }

        result.status = (output == expected) ? VerifyStatus::Ok : VerifyStatus::Mismatch;
        result.actual = std::move(output);
        return result;
    }

    VerifyResult VerifyKernel(const kernels::KernelDesc& kernel)
    {
        static_assert(kVerifyInput.size() == kVerifyExpected.size());
        static_assert(kVerifyInput.size() >= kernels::kMinLength256);
        return VerifyKernelOn(kernel, kVerifyInput, kVerifyExpected);
    }

} // namespace vcase::bench
