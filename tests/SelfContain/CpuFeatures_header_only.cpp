#include "VecCase/Contracts/CpuFeatures.hpp"
#include "VecCase/Cpu/StaticFeatureProbe.hpp"

namespace
{
    using namespace vcase::cpu;

    static_assert(CpuFeatureBackend<StaticFeatureProbe>, "StaticFeatureProbe must satisfy the feature contract.");

    struct DummyFeatures
    {
        [[nodiscard]] constexpr CpuFeatureCaps GetCaps() const noexcept { return CpuFeatureCaps{}; }
        [[nodiscard]] constexpr bool IsSupported(CpuFeature) const noexcept { return false; }
    };

    static_assert(CpuFeatureBackend<DummyFeatures>, "DummyFeatures must satisfy the feature contract.");

    void UseFeatureInterface() noexcept
    {
        const DummyFeatures backend{};
        const auto iface = MakeCpuFeatureInterface(backend);
        (void)IsSupported(iface, CpuFeature::Avx2);
        (void)QueryCaps(iface);
        (void)FeatureName(FeatureAt(0));
    }
}
