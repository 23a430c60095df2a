// ============================================================================
// VecCase - Source/VecCase/Cpu/CpuidFeatureProbe.hpp
// ----------------------------------------------------------------------------
// Purpose : Hardware feature backend. Reads CPUID leaves 1, 7 and 0x80000001
//           once at construction and answers from the cached bit set.
// Contract: noexcept, no allocations. Construction is cheap enough to do once
//           per process. On hosts without CPUID every feature is reported
//           unsupported and GetCaps().hardwareQuery is false.
// Notes   : AVX, AVX2 and FMA are reported only when the OS also saves YMM
//           state (CPUID.1:ECX.OSXSAVE and XCR0 bits 1-2); a CPU that has the
//           instructions under an OS that does not enable them cannot run them.
// ============================================================================

#pragma once

#include "VecCase/Contracts/CpuFeatures.hpp"

namespace vcase::cpu
{
    class CpuidFeatureProbe
    {
    public:
        CpuidFeatureProbe() noexcept;

        [[nodiscard]] CpuFeatureCaps GetCaps() const noexcept;

        [[nodiscard]] bool IsSupported(CpuFeature feature) const noexcept
        {
            return mFeatures.Has(feature);
        }

        [[nodiscard]] CpuFeatureSet Features() const noexcept { return mFeatures; }

        // Raw query, exposed for tests that cross-check the cached set.
        [[nodiscard]] static CpuFeatureSet Detect() noexcept;

    private:
        CpuFeatureSet mFeatures{};
    };

    static_assert(CpuFeatureBackend<CpuidFeatureProbe>, "CpuidFeatureProbe must satisfy CpuFeatureBackend.");

    [[nodiscard]] inline CpuFeatureInterface MakeCpuidFeatureInterface(const CpuidFeatureProbe& backend) noexcept
    {
        return MakeCpuFeatureInterface(backend);
    }

} // namespace vcase::cpu
