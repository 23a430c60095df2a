// ============================================================================
// VecCase - Source/VecCase/Cpu/StaticFeatureProbe.hpp
// ----------------------------------------------------------------------------
// Purpose : Feature backend that answers from a caller-provided set instead of
//           the hardware. Used for deterministic tests.
// Contract: Header-only, noexcept, no allocations. Answers never change after
//           construction.
// ============================================================================

#pragma once

#include "VecCase/Contracts/CpuFeatures.hpp"

#include <initializer_list>

namespace vcase::cpu
{
    struct StaticFeatureProbe
    {
        CpuFeatureSet features{};

        StaticFeatureProbe() noexcept = default;

        explicit StaticFeatureProbe(CpuFeatureSet set) noexcept
            : features(set)
        {
        }

        StaticFeatureProbe(std::initializer_list<CpuFeature> supported) noexcept
        {
            for (CpuFeature feature : supported)
            {
                features.Set(feature);
            }
        }

        [[nodiscard]] constexpr CpuFeatureCaps GetCaps() const noexcept
        {
            CpuFeatureCaps caps{};
            caps.hardwareQuery = false;
            caps.determinism = vcase::DeterminismMode::Strict;
            return caps;
        }

        [[nodiscard]] constexpr bool IsSupported(CpuFeature feature) const noexcept
        {
            return features.Has(feature);
        }
    };

    static_assert(CpuFeatureBackend<StaticFeatureProbe>, "StaticFeatureProbe must satisfy CpuFeatureBackend.");

    [[nodiscard]] inline CpuFeatureInterface MakeStaticFeatureInterface(const StaticFeatureProbe& backend) noexcept
    {
        return MakeCpuFeatureInterface(backend);
    }

} // namespace vcase::cpu
