// ============================================================================
// VecCase - Source/VecCase/Time/SteadyClock.hpp
// ----------------------------------------------------------------------------
// Purpose : Production clock backend built on std::chrono::steady_clock.
// Contract: Header-only, noexcept, stateless. Monotonic; never goes backwards.
// Notes   : Resolution is whatever the standard library provides (typically
//           nanoseconds on Linux and Windows).
// ============================================================================

#pragma once

#include "VecCase/Contracts/Clock.hpp"

#include <chrono>

namespace vcase::time
{
    struct SteadyClock
    {
        [[nodiscard]] ClockCaps GetCaps() const noexcept
        {
            ClockCaps caps{};
            caps.monotonic = std::chrono::steady_clock::is_steady;
            caps.high_res  = std::chrono::steady_clock::period::den >= 1'000'000;
            caps.determinism = vcase::DeterminismMode::Off;
            caps.threadSafety = vcase::ThreadSafetyMode::ThreadSafe;
            return caps;
        }

        [[nodiscard]] Nanoseconds NowMonotonicNs() noexcept
        {
            const auto now = std::chrono::steady_clock::now().time_since_epoch();
            return static_cast<Nanoseconds>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
        }
    };

    static_assert(ClockBackend<SteadyClock>, "SteadyClock must satisfy clock backend concept.");

    [[nodiscard]] inline ClockInterface MakeSteadyClockInterface(SteadyClock& backend) noexcept
    {
        return MakeClockInterface(backend);
    }

} // namespace vcase::time
