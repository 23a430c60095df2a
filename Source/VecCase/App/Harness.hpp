#pragma once
// ============================================================================
// VecCase - VecCase/App/Harness.hpp
// ----------------------------------------------------------------------------
// Purpose : End-to-end benchmark pipeline: environment report, correctness
//           gate, buffer setup, then one timed run per kernel.
// Contract:
//   - Every kernel is verified before any buffer is allocated. The first
//     verification failure stops the pipeline (VerificationFailed).
//   - Source and sink are distinct AlignedBuffers of bufferMiB * MiB bytes;
//     they are released on every exit path.
//   - The first kernel rejected by the runner stops the pipeline
//     (BenchFailed).
//   - Report text goes to HarnessConfig::out; failures are logged through
//     the Logger with the kernel name.
// Notes   : Feature and clock backends are injected so tests can drive the
//           whole pipeline deterministically.
// ============================================================================

#include "VecCase/Types.hpp"
#include "VecCase/App/CommandLine.hpp"
#include "VecCase/Bench/Runner.hpp"
#include "VecCase/Contracts/Clock.hpp"
#include "VecCase/Contracts/CpuFeatures.hpp"
#include "VecCase/Kernels/AsciiUpper.hpp"

#include <cstdio>
#include <span>
#include <vector>

namespace vcase::app
{
    struct HarnessConfig
    {
        u64                                 bufferMiB = kDefaultBufferMiB;
        bench::BenchConfig                  benchConfig{};
        std::FILE*                          out = stdout;
        u64                                 fillSeed = 0;  // 0 picks a random seed.
        std::span<const kernels::KernelDesc> kernelList{}; // Empty selects AllAsciiUpperKernels().
    };

    enum class HarnessStatus : u8
    {
        Ok = 0,
        InvalidConfig,      // Buffer size of zero or overflowing usize.
        VerificationFailed,
        BenchFailed,
    };

    [[nodiscard]] constexpr const char* HarnessStatusName(HarnessStatus status) noexcept
    {
        switch (status)
        {
        case HarnessStatus::Ok:                 return "Ok";
        case HarnessStatus::InvalidConfig:      return "InvalidConfig";
        case HarnessStatus::VerificationFailed: return "VerificationFailed";
        case HarnessStatus::BenchFailed:        return "BenchFailed";
        default:                                return "<unknown>";
        }
    }

    // Process exit code: 0 ok, 1 verification/bench failure, 2 bad argument.
    [[nodiscard]] constexpr int ExitCodeFor(HarnessStatus status) noexcept
    {
        switch (status)
        {
        case HarnessStatus::Ok:            return 0;
        case HarnessStatus::InvalidConfig: return 2;
        default:                           return 1;
        }
    }

    inline constexpr int kExitArgumentError = 2;

    struct HarnessReport
    {
        HarnessStatus                   status = HarnessStatus::Ok;
        const char*                     failedKernel = nullptr;
        std::vector<bench::BenchResult> results;
    };

    // True when the 256-bit kernel will not run on native 256-bit registers.
    [[nodiscard]] bool WideKernelIsEmulated(const kernels::KernelDesc& kernel,
                                            const cpu::CpuFeatureInterface& features) noexcept;

    [[nodiscard]] HarnessReport RunHarness(const HarnessConfig& config,
                                           const cpu::CpuFeatureInterface& features,
                                           time::ClockInterface& clock);

} // namespace vcase::app
