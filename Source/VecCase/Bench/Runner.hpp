#pragma once
// ============================================================================
// VecCase - VecCase/Bench/Runner.hpp
// ----------------------------------------------------------------------------
// Purpose : Fixed-count micro-benchmark runner for one uppercase kernel over a
//           source/sink buffer pair. Reports mean latency per call and the
//           combined read + write bandwidth.
// Contract: Single-threaded, not re-entrant. Performs `warmupIterations`
//           untimed calls, then `timedIterations` calls each bracketed by two
//           clock samples. Timed iterations of 0 are promoted to 1 to keep a
//           valid divisor. No adaptive stopping, no outlier rejection.
//           A kernel that rejects its arguments stops the run immediately with
//           BenchStatus::KernelRejected.
// Notes   :
//   - The clock is injected through time::ClockInterface so tests can run the
//     loop against a deterministic NullClock.
//   - Report lines go to `out` (may be null); diagnostics go to the Logger.
//   - Throughput counts every byte twice (read from src, written to dst).
// ============================================================================

#include "VecCase/Types.hpp"
#include "VecCase/Contracts/Clock.hpp"
#include "VecCase/Kernels/AsciiUpper.hpp"

#include <cstdio>

// --- Policy knobs -----------------------------------------------------------
#ifndef VCASE_BENCH_WARMUP_ITERS
#define VCASE_BENCH_WARMUP_ITERS 100
#endif

#ifndef VCASE_BENCH_TIMED_ITERS
#define VCASE_BENCH_TIMED_ITERS 3000
#endif

namespace vcase::bench
{
    inline constexpr u64 kDefaultWarmupIterations = static_cast<u64>(VCASE_BENCH_WARMUP_ITERS);
    inline constexpr u64 kDefaultTimedIterations  = static_cast<u64>(VCASE_BENCH_TIMED_ITERS);

    struct BenchConfig
    {
        u64 warmupIterations = kDefaultWarmupIterations;
        u64 timedIterations  = kDefaultTimedIterations;
    };

    enum class BenchStatus : u8
    {
        Ok = 0,
        KernelRejected,
    };

    // === BenchResult ========================================================
    // Purpose : Outcome of one kernel run.
    // Contract: `Name` is the kernel's static name. Timing fields are zero when
    //           Status != Ok. MinMicros/MaxMicros bound the individual samples.
    // ------------------------------------------------------------------------
    struct BenchResult
    {
        const char*           Name{nullptr};
        u64                   Iterations{0};       // Timed calls measured.
        usize                 Bytes{0};            // Buffer length per call.
        double                MeanMicros{0.0};
        double                MinMicros{0.0};
        double                MaxMicros{0.0};
        double                ThroughputMiBps{0.0};
        BenchStatus           Status{BenchStatus::Ok};
        kernels::KernelStatus Rejection{kernels::KernelStatus::Ok};

        [[nodiscard]] constexpr bool Succeeded() const noexcept { return Status == BenchStatus::Ok; }
    };

    // length / mean_us * 1e6 / MiB * 2. Non-positive mean yields 0.
    [[nodiscard]] double ComputeThroughputMiBps(usize length, double meanMicros) noexcept;

    // === RunKernelBench =====================================================
    // Purpose : Warm up, time, and report one kernel on (src, dst, length).
    // Contract: src/dst valid for `length` bytes; clock must be bound.
    // ------------------------------------------------------------------------
    [[nodiscard]] BenchResult RunKernelBench(const kernels::KernelDesc& kernel,
                                             const u8* src,
                                             u8* dst,
                                             usize length,
                                             const BenchConfig& config,
                                             time::ClockInterface& clock,
                                             std::FILE* out) noexcept;

} // namespace vcase::bench
