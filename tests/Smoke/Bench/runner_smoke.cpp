// ============================================================================
// Benchmark Runner Smoke Test
// ----------------------------------------------------------------------------
// Purpose : Drive RunKernelBench with a deterministic clock: call counts,
//           mean, throughput arithmetic, report text, and kernel rejection.
// Contract: No exceptions escape; deterministic; returns non-zero on failure.
// ============================================================================

#include "VecCase/Bench/Runner.hpp"
#include "VecCase/Kernels/AsciiUpper.hpp"
#include "VecCase/Time/NullClock.hpp"

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace
{
    using namespace vcase;

    u64 gCountedCalls = 0;

    kernels::KernelStatus CountingKernel(const u8* src, u8* dst, usize length) noexcept
    {
        ++gCountedCalls;
        return kernels::ToAsciiUpperReference(src, dst, length);
    }

    std::string ReadAll(std::FILE* file)
    {
        std::string text;
        std::rewind(file);
        char buffer[256];
        std::size_t n = 0;
        while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0)
        {
            text.append(buffer, n);
        }
        return text;
    }

    bool Near(double a, double b)
    {
        return std::fabs(a - b) <= 1e-9 * (std::fabs(b) + 1.0);
    }
} // namespace

int RunBenchRunnerSmoke()
{
    using namespace vcase::bench;

    // Throughput arithmetic.
    if (ComputeThroughputMiBps(MiB, 0.0) != 0.0 || ComputeThroughputMiBps(MiB, -1.0) != 0.0)
    {
        return 1;
    }
    // 1 MiB in 1 us, read + write: 2'000'000 MiB/s.
    if (!Near(ComputeThroughputMiBps(MiB, 1.0), 2'000'000.0))
    {
        return 2;
    }

    if (kDefaultWarmupIterations != 100 || kDefaultTimedIterations != 3000)
    {
        return 3;
    }

    std::vector<u8> src(4096, static_cast<u8>('x'));
    std::vector<u8> dst(4096, 0);

    // Call counts and NullClock timing: every sample is exactly one step.
    {
        const kernels::KernelDesc counting{ "Counting", 1, 8, false, &CountingKernel };
        BenchConfig config{};
        config.warmupIterations = 5;
        config.timedIterations = 7;

        time::NullClock backend{};
        backend.stepNs = 2'000; // 2 us between the two samples of a call.
        time::ClockInterface clock = time::MakeNullClockInterface(backend);

        gCountedCalls = 0;
        const BenchResult result = RunKernelBench(counting, src.data(), dst.data(), src.size(), config, clock, nullptr);
        if (!result.Succeeded() || gCountedCalls != 12 || result.Iterations != 7)
        {
            return 4;
        }
        if (!Near(result.MeanMicros, 2.0) || !Near(result.MinMicros, 2.0) || !Near(result.MaxMicros, 2.0))
        {
            return 5;
        }
        if (!Near(result.ThroughputMiBps, ComputeThroughputMiBps(4096, 2.0)) || result.Bytes != 4096)
        {
            return 6;
        }
        if (dst[0] != 'X' || dst[4095] != 'X')
        {
            return 7;
        }

        // Zero timed iterations are promoted to one.
        config.warmupIterations = 0;
        config.timedIterations = 0;
        gCountedCalls = 0;
        const BenchResult single = RunKernelBench(counting, src.data(), dst.data(), src.size(), config, clock, nullptr);
        if (!single.Succeeded() || single.Iterations != 1 || gCountedCalls != 1)
        {
            return 8;
        }
    }

    // Report text for a real kernel.
    {
        const kernels::KernelDesc kernel = kernels::AllAsciiUpperKernels()[0];
        BenchConfig config{};
        config.warmupIterations = 2;
        config.timedIterations = 3;

        time::NullClock backend{};
        backend.stepNs = 1'000;
        time::ClockInterface clock = time::MakeNullClockInterface(backend);

        std::FILE* file = std::tmpfile();
        if (!file)
        {
            return 9;
        }
        const BenchResult result = RunKernelBench(kernel, src.data(), dst.data(), src.size(), config, clock, file);
        const std::string text = ReadAll(file);
        std::fclose(file);

        if (!result.Succeeded())
        {
            return 10;
        }

        const std::string expected =
            "---- Executing ToAsciiUpper128 ----\n"
            "Warming up...Done.\n"
            "Running...\n"
            "Average execution time: 1.00 µs per iteration\n"
            "Throughput: 7812.50 MiB/s\n"
            "---- Completed ToAsciiUpper128 ----\n"
            "\n";
        if (text != expected)
        {
            return 11;
        }
    }

    // Rejection: buffer shorter than the kernel's minimum width.
    {
        const kernels::KernelDesc kernel = kernels::AllAsciiUpperKernels()[2];
        time::NullClock backend{};
        time::ClockInterface clock = time::MakeNullClockInterface(backend);

        const BenchResult result = RunKernelBench(kernel, src.data(), dst.data(), 8, BenchConfig{}, clock, nullptr);
        if (result.Succeeded() ||
            result.Status != BenchStatus::KernelRejected ||
            result.Rejection != kernels::KernelStatus::InvalidLength ||
            result.MeanMicros != 0.0)
        {
            return 12;
        }
    }

    return 0;
}
