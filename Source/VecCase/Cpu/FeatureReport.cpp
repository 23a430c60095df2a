// ============================================================================
// VecCase - Source/VecCase/Cpu/FeatureReport.cpp
// ============================================================================

#include "VecCase/Cpu/FeatureReport.hpp"

#include <fmt/ranges.h>

namespace vcase::cpu
{
    FeatureReport BuildFeatureReport(const CpuFeatureInterface& features)
    {
        FeatureReport report{};
        report.supported.reserve(kCpuFeatureCount);
        report.unsupported.reserve(kCpuFeatureCount);

        for (usize i = 0; i < kCpuFeatureCount; ++i)
        {
            const CpuFeature feature = FeatureAt(i);
            if (IsSupported(features, feature))
            {
                report.supported.emplace_back(FeatureName(feature));
            }
            else
            {
                report.unsupported.emplace_back(FeatureName(feature));
            }
        }
        return report;
    }

    std::string JoinFeatureNames(const std::vector<std::string_view>& names)
    {
        return fmt::format("{}", fmt::join(names, ", "));
    }

} // namespace vcase::cpu
