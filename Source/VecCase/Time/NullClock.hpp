// ============================================================================
// VecCase - Source/VecCase/Time/NullClock.hpp
// ----------------------------------------------------------------------------
// Purpose : Minimal clock backend that satisfies the clock contract without
//           relying on platform clocks. Useful for tests and CI.
// Contract: Header-only, no exceptions/RTTI, no allocations. All methods are
//           noexcept and deterministic.
// Notes   : Advances an internal counter by a fixed step each call to
//           NowMonotonicNs, so every begin/end sample pair measures exactly
//           one step.
// ============================================================================

#pragma once

#include "VecCase/Contracts/Clock.hpp"

namespace vcase::time
{
    struct NullClock
    {
        Nanoseconds currentNs = 0;
        Nanoseconds stepNs    = 1'000; // 1 us per sample.

        [[nodiscard]] constexpr ClockCaps GetCaps() const noexcept
        {
            ClockCaps caps{};
            caps.monotonic = true;
            caps.high_res  = false;
            caps.determinism = vcase::DeterminismMode::Replay;
            caps.threadSafety = vcase::ThreadSafetyMode::ExternalSync;
            return caps;
        }

        [[nodiscard]] Nanoseconds NowMonotonicNs() noexcept
        {
            currentNs += stepNs;
            return currentNs;
        }
    };

    static_assert(ClockBackend<NullClock>, "NullClock must satisfy clock backend concept.");

    [[nodiscard]] inline ClockInterface MakeNullClockInterface(NullClock& backend) noexcept
    {
        return MakeClockInterface(backend);
    }

} // namespace vcase::time
