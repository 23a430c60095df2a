// ============================================================================
// VecCase - Source/VecCase/Contracts/Clock.hpp
// ----------------------------------------------------------------------------
// Purpose : Clock contract describing a backend-agnostic monotonic time source
//           so the benchmark runner can be driven by a real clock or by a
//           deterministic one without knowing which.
// Contract: Header-only, no exceptions/RTTI, project-absolute includes only.
//           All types are POD or trivially copyable; no allocations occur in
//           this layer. Thread-safety is left to the backend; callers must
//           externally synchronize per backend instance.
// Notes   : Timestamps are nanoseconds from an unspecified epoch. Only
//           differences between two samples are meaningful.
// ============================================================================

#pragma once

#include "VecCase/Types.hpp"

#include <concepts>
#include <type_traits>

namespace vcase::time
{
    using Nanoseconds = vcase::u64;

    // ------------------------------------------------------------------------
    // Backend metadata and capabilities
    // ------------------------------------------------------------------------

    struct ClockCaps
    {
        bool monotonic = false;
        bool high_res  = false;
        vcase::DeterminismMode determinism = vcase::DeterminismMode::Unknown;
        vcase::ThreadSafetyMode threadSafety = vcase::ThreadSafetyMode::Unknown;
    };

    static_assert(std::is_trivially_copyable_v<ClockCaps>, "ClockCaps must stay POD.");

    // ------------------------------------------------------------------------
    // Dynamic face (tiny v-table for late binding)
    // ------------------------------------------------------------------------

    struct ClockVTable
    {
        using GetCapsFunc      = ClockCaps(*)(const void* userData) noexcept;
        using NowMonotonicFunc = Nanoseconds(*)(void* userData) noexcept;

        GetCapsFunc      getCaps      = nullptr;
        NowMonotonicFunc nowMonotonic = nullptr;
    };

    struct ClockInterface
    {
        ClockVTable vtable{};
        void*       userData = nullptr; // Non-owning backend instance pointer.
    };

    [[nodiscard]] inline ClockCaps QueryCaps(const ClockInterface& clock) noexcept
    {
        return (clock.vtable.getCaps && clock.userData)
            ? clock.vtable.getCaps(clock.userData)
            : ClockCaps{};
    }

    [[nodiscard]] inline Nanoseconds NowMonotonicNs(ClockInterface& clock) noexcept
    {
        return (clock.vtable.nowMonotonic && clock.userData)
            ? clock.vtable.nowMonotonic(clock.userData)
            : Nanoseconds{0};
    }

    [[nodiscard]] inline bool IsBound(const ClockInterface& clock) noexcept
    {
        return clock.vtable.nowMonotonic != nullptr && clock.userData != nullptr;
    }

    // ------------------------------------------------------------------------
    // Static face (concept + adapter to dynamic v-table)
    // ------------------------------------------------------------------------

    template <typename Backend>
    concept ClockBackend = requires(Backend& backend, const Backend& constBackend)
    {
        { constBackend.GetCaps() } noexcept -> std::same_as<ClockCaps>;
        { backend.NowMonotonicNs() } noexcept -> std::same_as<Nanoseconds>;
    };

    namespace detail
    {
        template <typename Backend>
        struct ClockInterfaceAdapter
        {
            static ClockCaps GetCaps(const void* userData) noexcept
            {
                return static_cast<const Backend*>(userData)->GetCaps();
            }

            static Nanoseconds NowMonotonic(void* userData) noexcept
            {
                return static_cast<Backend*>(userData)->NowMonotonicNs();
            }
        };
    } // namespace detail

    template <typename Backend>
    [[nodiscard]] inline ClockInterface MakeClockInterface(Backend& backend) noexcept
    {
        static_assert(ClockBackend<Backend>, "Backend must satisfy ClockBackend concept.");

        ClockInterface iface{};
        iface.userData            = &backend;
        iface.vtable.getCaps      = &detail::ClockInterfaceAdapter<Backend>::GetCaps;
        iface.vtable.nowMonotonic = &detail::ClockInterfaceAdapter<Backend>::NowMonotonic;
        return iface;
    }

} // namespace vcase::time
