// ============================================================================
// VecCase - VecCase/App/Harness.cpp
// ============================================================================

#include "VecCase/App/Harness.hpp"
#include "VecCase/CoreMinimal.hpp"
#include "VecCase/Bench/BufferFill.hpp"
#include "VecCase/Bench/Verifier.hpp"
#include "VecCase/Cpu/FeatureReport.hpp"
#include "VecCase/Diagnostics/ConsoleReport.hpp"
#include "VecCase/Memory/AlignedBuffer.hpp"
#include "VecCase/Simd/Byte32.hpp"

#include <limits>

namespace vcase::app
{
    namespace
    {
        constexpr u32 kWideVectorBits = 256;

        void ReportEnvironment(std::FILE* out, const cpu::CpuFeatureInterface& features)
        {
            const cpu::FeatureReport report = cpu::BuildFeatureReport(features);
            core::ReportLine(out, "--- Environment Information ---");
            core::ReportLine(out, "Supported: {}", cpu::JoinFeatureNames(report.supported));
            core::ReportLine(out, "Unsupported: {}", cpu::JoinFeatureNames(report.unsupported));
            core::ReportBlankLine(out);
        }

        [[nodiscard]] bool VerifyAll(std::span<const kernels::KernelDesc> kernelList,
                                     const cpu::CpuFeatureInterface& features,
                                     std::FILE* out,
                                     const char*& failedKernel)
        {
            core::ReportLine(out, "Verifying correctness of the benchmarks...");

            for (const kernels::KernelDesc& kernel : kernelList)
            {
                if (WideKernelIsEmulated(kernel, features))
                {
                    core::ReportLine(out, "Warning: V256 is not accelerated on this system and will run as two 128-bit halves.");
                }

                const bench::VerifyResult result = bench::VerifyKernel(kernel);
                if (result.status == bench::VerifyStatus::KernelRejected)
                {
                    VCASE_LOG_ERROR("Verify", "{} failed to convert the string to uppercase. Output: <rejected: {}>",
                        kernel.name, kernels::KernelStatusName(result.kernelStatus));
                    failedKernel = kernel.name;
                    return false;
                }
                if (result.status == bench::VerifyStatus::Mismatch)
                {
                    VCASE_LOG_ERROR("Verify", "{} failed to convert the string to uppercase. Output: {}",
                        kernel.name, result.actual);
                    failedKernel = kernel.name;
                    return false;
                }
                core::ReportLine(out, "{} passed verification.", kernel.name);
            }
            return true;
        }
    } // namespace

    bool WideKernelIsEmulated(const kernels::KernelDesc& kernel,
                              const cpu::CpuFeatureInterface& features) noexcept
    {
        if (kernel.vectorBits < kWideVectorBits)
        {
            return false;
        }
        return !kernel.native || !cpu::IsSupported(features, cpu::CpuFeature::Avx2);
    }

    HarnessReport RunHarness(const HarnessConfig& config,
                             const cpu::CpuFeatureInterface& features,
                             time::ClockInterface& clock)
    {
        HarnessReport report{};
        std::FILE* out = config.out;

        if (config.bufferMiB == 0 || config.bufferMiB > (std::numeric_limits<usize>::max)() / MiB)
        {
            VCASE_LOG_ERROR("App", "buffer size of {} MiB is not allocatable", config.bufferMiB);
            report.status = HarnessStatus::InvalidConfig;
            return report;
        }

        const std::span<const kernels::KernelDesc> kernelList =
            config.kernelList.empty() ? kernels::AllAsciiUpperKernels() : config.kernelList;

        ReportEnvironment(out, features);
        VCASE_LOG_VERBOSE("App", "SIMD backend {}, 256-bit vectors {}", simd::Byte16BackendName(),
            simd::HasNativeByte32() ? "native" : "as two 128-bit halves");

        if (!VerifyAll(kernelList, features, out, report.failedKernel))
        {
            report.status = HarnessStatus::VerificationFailed;
            return report;
        }

        core::ReportLine(out, "Allocating {} MiB of memory and filling it with random data...", config.bufferMiB);

        const usize length = static_cast<usize>(config.bufferMiB) * MiB;
        memory::AlignedBuffer source = memory::AlignedBuffer::Allocate(length);
        memory::AlignedBuffer sink = memory::AlignedBuffer::Allocate(length);

        const u64 seed = (config.fillSeed != 0) ? config.fillSeed : bench::RandomSeed();
        bench::FillRandomBytes(source.Bytes(), seed);
        VCASE_LOG_VERBOSE("App", "source filled with seed {:#x}", seed);

        core::ReportLine(out, "Memory allocation and initialization completed.");
        core::ReportLine(out, "Running benchmarks...");
        core::ReportBlankLine(out);

        report.results.reserve(kernelList.size());
        for (const kernels::KernelDesc& kernel : kernelList)
        {
            const bench::BenchResult result = bench::RunKernelBench(
                kernel, source.Data(), sink.Data(), length, config.benchConfig, clock, out);
            report.results.push_back(result);

            if (!result.Succeeded())
            {
                report.status = HarnessStatus::BenchFailed;
                report.failedKernel = kernel.name;
                return report;
            }
        }

        core::ReportLine(out, "Benchmarks completed successfully.");
        return report;
    }

} // namespace vcase::app
