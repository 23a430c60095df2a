// ============================================================================
// Harness Smoke Test
// ----------------------------------------------------------------------------
// Purpose : Run the whole pipeline with injected feature and clock backends:
//           report layout, result collection, and each early-exit path.
// Contract: Small buffers and iteration counts; deterministic clock; returns
//           non-zero on failure.
// ============================================================================

#include "VecCase/App/Harness.hpp"
#include "VecCase/Bench/Verifier.hpp"
#include "VecCase/Cpu/StaticFeatureProbe.hpp"
#include "VecCase/Kernels/AsciiUpper.hpp"
#include "VecCase/Time/NullClock.hpp"

#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>

namespace
{
    using namespace vcase;

    std::string ReadAll(std::FILE* file)
    {
        std::string text;
        std::rewind(file);
        char buffer[512];
        std::size_t n = 0;
        while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0)
        {
            text.append(buffer, n);
        }
        return text;
    }

    bool Contains(const std::string& text, std::string_view needle)
    {
        return text.find(needle) != std::string::npos;
    }

    // Correct on short inputs, refuses anything the size of a benchmark buffer.
    kernels::KernelStatus ShortOnlyKernel(const u8* src, u8* dst, usize length) noexcept
    {
        if (length > 4096)
        {
            return kernels::KernelStatus::InvalidLength;
        }
        return kernels::ToAsciiUpperReference(src, dst, length);
    }

    kernels::KernelStatus IdentityKernel(const u8* src, u8* dst, usize length) noexcept
    {
        std::memcpy(dst, src, length);
        return kernels::KernelStatus::Ok;
    }

    app::HarnessConfig SmallConfig(std::FILE* out)
    {
        app::HarnessConfig config{};
        config.bufferMiB = 1;
        config.benchConfig.warmupIterations = 2;
        config.benchConfig.timedIterations = 3;
        config.out = out;
        config.fillSeed = 42;
        return config;
    }
} // namespace

int RunHarnessSmoke()
{
    using namespace vcase::app;

    const cpu::StaticFeatureProbe probe{ cpu::CpuFeature::Sse, cpu::CpuFeature::Sse2,
                                         cpu::CpuFeature::Avx, cpu::CpuFeature::Avx2 };
    const cpu::CpuFeatureInterface features = cpu::MakeStaticFeatureInterface(probe);

    time::NullClock clockBackend{};
    time::ClockInterface clock = time::MakeNullClockInterface(clockBackend);

    // Full pipeline.
    {
        std::FILE* file = std::tmpfile();
        if (!file)
        {
            return 1;
        }
        const HarnessReport report = RunHarness(SmallConfig(file), features, clock);
        const std::string text = ReadAll(file);
        std::fclose(file);

        if (report.status != HarnessStatus::Ok || report.failedKernel != nullptr || report.results.size() != 3)
        {
            return 2;
        }
        for (const bench::BenchResult& result : report.results)
        {
            if (!result.Succeeded() || result.Iterations != 3 || result.Bytes != MiB || result.MeanMicros <= 0.0)
            {
                return 3;
            }
        }
        if (std::string_view(report.results[2].Name) != "ToAsciiUpper256")
        {
            return 4;
        }

        const std::string_view expectedHead =
            "--- Environment Information ---\n"
            "Supported: AVX, AVX2, SSE, SSE2\n"
            "Unsupported: AES, BMI1, BMI2, FMA, LZCNT, PCLMULQDQ, POPCNT, SSE3, SSSE3, SSE4.1, SSE4.2\n"
            "\n"
            "Verifying correctness of the benchmarks...\n";
        if (text.compare(0, expectedHead.size(), expectedHead) != 0)
        {
            return 5;
        }

        const bool emulated = WideKernelIsEmulated(kernels::AllAsciiUpperKernels()[2], features);
        if (Contains(text, "Warning: V256 is not accelerated") != emulated)
        {
            return 6;
        }

        const std::size_t v0 = text.find("ToAsciiUpper128 passed verification.\n");
        const std::size_t v1 = text.find("ToAsciiUpper128x2 passed verification.\n");
        const std::size_t v2 = text.find("ToAsciiUpper256 passed verification.\n");
        const std::size_t alloc = text.find("Allocating");
        if (v0 == std::string::npos || v1 == std::string::npos || v2 == std::string::npos ||
            !(v0 < v1 && v1 < v2 && v2 < alloc))
        {
            return 19;
        }

        if (!Contains(text, "Allocating 1 MiB of memory and filling it with random data...\n"
                            "Memory allocation and initialization completed.\n"
                            "Running benchmarks...\n"
                            "\n"
                            "---- Executing ToAsciiUpper128 ----\n"))
        {
            return 7;
        }

        const std::size_t a = text.find("---- Completed ToAsciiUpper128 ----");
        const std::size_t b = text.find("---- Completed ToAsciiUpper128x2 ----");
        const std::size_t c = text.find("---- Completed ToAsciiUpper256 ----");
        if (a == std::string::npos || b == std::string::npos || c == std::string::npos || !(a < b && b < c))
        {
            return 8;
        }

        const std::string_view tail = "Benchmarks completed successfully.\n";
        if (text.size() < tail.size() || text.compare(text.size() - tail.size(), tail.size(), tail) != 0)
        {
            return 9;
        }
    }

    // Warning logic: emulated unless both the build and the host have native 256-bit.
    {
        const kernels::KernelDesc nativeWide{ "Wide", 32, 256, true, &ShortOnlyKernel };
        const kernels::KernelDesc emulatedWide{ "Wide", 32, 256, false, &ShortOnlyKernel };
        const kernels::KernelDesc narrow{ "Narrow", 16, 128, false, &ShortOnlyKernel };

        const cpu::StaticFeatureProbe noAvx2{ cpu::CpuFeature::Sse2 };
        const cpu::CpuFeatureInterface noAvx2Features = cpu::MakeStaticFeatureInterface(noAvx2);

        if (WideKernelIsEmulated(nativeWide, features) ||
            !WideKernelIsEmulated(nativeWide, noAvx2Features) ||
            !WideKernelIsEmulated(emulatedWide, features) ||
            WideKernelIsEmulated(narrow, noAvx2Features))
        {
            return 10;
        }
    }

    // Verification failure stops before any allocation.
    {
        const kernels::KernelDesc list[] = {
            kernels::AllAsciiUpperKernels()[0],
            { "IdentityKernel", 1, 128, true, &IdentityKernel },
            kernels::AllAsciiUpperKernels()[2],
        };

        std::FILE* file = std::tmpfile();
        if (!file)
        {
            return 11;
        }
        HarnessConfig config = SmallConfig(file);
        config.kernelList = list;
        const HarnessReport report = RunHarness(config, features, clock);
        const std::string text = ReadAll(file);
        std::fclose(file);

        if (report.status != HarnessStatus::VerificationFailed ||
            report.failedKernel == nullptr ||
            std::string_view(report.failedKernel) != "IdentityKernel" ||
            !report.results.empty())
        {
            return 12;
        }
        if (Contains(text, "Allocating") || Contains(text, "Executing"))
        {
            return 13;
        }
        if (!Contains(text, "ToAsciiUpper128 passed verification.") ||
            Contains(text, "IdentityKernel passed verification.") ||
            Contains(text, "ToAsciiUpper256 passed verification."))
        {
            return 20;
        }
        if (ExitCodeFor(report.status) != 1)
        {
            return 14;
        }
    }

    // Benchmark failure: passes verification, rejects the real buffer.
    {
        const kernels::KernelDesc list[] = {
            kernels::AllAsciiUpperKernels()[0],
            { "ShortOnlyKernel", 1, 128, true, &ShortOnlyKernel },
            kernels::AllAsciiUpperKernels()[2],
        };

        HarnessConfig config = SmallConfig(nullptr);
        config.kernelList = list;
        const HarnessReport report = RunHarness(config, features, clock);

        if (report.status != HarnessStatus::BenchFailed ||
            report.failedKernel == nullptr ||
            std::string_view(report.failedKernel) != "ShortOnlyKernel" ||
            report.results.size() != 2 ||
            !report.results[0].Succeeded() ||
            report.results[1].Status != bench::BenchStatus::KernelRejected)
        {
            return 15;
        }
        if (ExitCodeFor(report.status) != 1)
        {
            return 16;
        }
    }

    // Invalid buffer size.
    {
        HarnessConfig config = SmallConfig(nullptr);
        config.bufferMiB = 0;
        const HarnessReport report = RunHarness(config, features, clock);
        if (report.status != HarnessStatus::InvalidConfig || ExitCodeFor(report.status) != 2)
        {
            return 17;
        }
    }

    if (ExitCodeFor(HarnessStatus::Ok) != 0)
    {
        return 18;
    }

    return 0;
}
