// ============================================================================
// VecCase - Source/VecCase/Cpu/FeatureReport.hpp
// ----------------------------------------------------------------------------
// Purpose : Partition the fixed feature list into supported / unsupported
//           names for the environment section of the report.
// Contract: Both lists keep CpuFeature order. Every feature lands in exactly
//           one list. Names are static string literals.
// ============================================================================

#pragma once

#include "VecCase/Contracts/CpuFeatures.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace vcase::cpu
{
    struct FeatureReport
    {
        std::vector<std::string_view> supported;
        std::vector<std::string_view> unsupported;
    };

    [[nodiscard]] FeatureReport BuildFeatureReport(const CpuFeatureInterface& features);

    // "A, B, C"; empty list yields an empty string.
    [[nodiscard]] std::string JoinFeatureNames(const std::vector<std::string_view>& names);

} // namespace vcase::cpu
