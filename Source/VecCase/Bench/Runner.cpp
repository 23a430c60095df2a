// ============================================================================
// VecCase - VecCase/Bench/Runner.cpp
// ============================================================================

#include "VecCase/Bench/Runner.hpp"
#include "VecCase/CoreMinimal.hpp"
#include "VecCase/Diagnostics/Check.hpp"
#include "VecCase/Diagnostics/ConsoleReport.hpp"

namespace vcase::bench
{
    namespace
    {
        constexpr double kNanosPerMicro = 1'000.0;
        constexpr double kMicrosPerSecond = 1'000'000.0;
        constexpr double kTrafficFactor = 2.0; // One read + one write per byte.

        [[nodiscard]] BenchResult Rejected(const kernels::KernelDesc& kernel, usize length,
                                           kernels::KernelStatus status, std::FILE* out) noexcept
        {
            core::ReportLine(out, "Failed.");
            VCASE_LOG_ERROR("Bench", "{} rejected its arguments (length={}): {}",
                kernel.name, length, kernels::KernelStatusName(status));

            BenchResult result{};
            result.Name = kernel.name;
            result.Bytes = length;
            result.Status = BenchStatus::KernelRejected;
            result.Rejection = status;
            return result;
        }
    } // namespace

    double ComputeThroughputMiBps(usize length, double meanMicros) noexcept
    {
        if (meanMicros <= 0.0)
        {
            return 0.0;
        }
        return static_cast<double>(length) / meanMicros * kMicrosPerSecond
            / static_cast<double>(MiB) * kTrafficFactor;
    }

    BenchResult RunKernelBench(const kernels::KernelDesc& kernel,
                               const u8* src,
                               u8* dst,
                               usize length,
                               const BenchConfig& config,
                               time::ClockInterface& clock,
                               std::FILE* out) noexcept
    {
        VCASE_CHECK(kernel.fn != nullptr && kernel.name != nullptr);
        VCASE_ASSERT(time::IsBound(clock), "RunKernelBench needs a bound clock");

        const u64 timedIterations = (config.timedIterations == 0) ? 1 : config.timedIterations;

        core::ReportLine(out, "---- Executing {} ----", kernel.name);
        core::ReportText(out, "Warming up...");

        if (kernel.fn == nullptr)
        {
            return Rejected(kernel, length, kernels::KernelStatus::InvalidArgument, out);
        }

        // Warm-up: prime caches and predictors; excluded from timings.
        for (u64 i = 0; i < config.warmupIterations; ++i)
        {
            const kernels::KernelStatus status = kernel.fn(src, dst, length);
            if (status != kernels::KernelStatus::Ok)
            {
                return Rejected(kernel, length, status, out);
            }
        }

        core::ReportLine(out, "Done.");
        core::ReportLine(out, "Running...");

        double sumMicros = 0.0;
        double minMicros = 0.0;
        double maxMicros = 0.0;

        for (u64 i = 0; i < timedIterations; ++i)
        {
            const time::Nanoseconds start = time::NowMonotonicNs(clock);
            const kernels::KernelStatus status = kernel.fn(src, dst, length);
            const time::Nanoseconds end = time::NowMonotonicNs(clock);

            if (VCASE_UNLIKELY(status != kernels::KernelStatus::Ok))
            {
                return Rejected(kernel, length, status, out);
            }

            const double sample = static_cast<double>(end - start) / kNanosPerMicro;
            sumMicros += sample;
            if (i == 0 || sample < minMicros) minMicros = sample;
            if (i == 0 || sample > maxMicros) maxMicros = sample;
        }

        BenchResult result{};
        result.Name = kernel.name;
        result.Iterations = timedIterations;
        result.Bytes = length;
        result.MeanMicros = sumMicros / static_cast<double>(timedIterations);
        result.MinMicros = minMicros;
        result.MaxMicros = maxMicros;
        result.ThroughputMiBps = ComputeThroughputMiBps(length, result.MeanMicros);
        result.Status = BenchStatus::Ok;

        core::ReportLine(out, "Average execution time: {:.2f} µs per iteration", result.MeanMicros);
        core::ReportLine(out, "Throughput: {:.2f} MiB/s", result.ThroughputMiBps);
        core::ReportLine(out, "---- Completed {} ----", kernel.name);
        core::ReportBlankLine(out);

        VCASE_LOG_VERBOSE("Bench", "{}: N={} min={:.2f}us max={:.2f}us",
            kernel.name, timedIterations, minMicros, maxMicros);

        return result;
    }

} // namespace vcase::bench
