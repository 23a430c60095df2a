// ============================================================================
// VecCase - Source/VecCase/Contracts/CpuFeatures.hpp
// ----------------------------------------------------------------------------
// Purpose : CPU feature contract. Names the fixed list of x86 extensions the
//           harness reports on and describes a backend-agnostic way to ask
//           whether the host supports each of them.
// Contract: Header-only, no exceptions/RTTI, no allocations. Feature order is
//           fixed and is the order every report uses. Backends answer
//           IsSupported() for every CpuFeature value below Count.
// Notes   : Reporting only. Nothing in the harness selects kernels from these
//           answers; the kernels are fixed at compile time per build flavor.
// ============================================================================

#pragma once

#include "VecCase/Types.hpp"

#include <concepts>
#include <type_traits>

namespace vcase::cpu
{
    // ------------------------------------------------------------------------
    // Feature identifiers (report order)
    // ------------------------------------------------------------------------

    enum class CpuFeature : vcase::u8
    {
        Aes = 0,
        Avx,
        Avx2,
        Bmi1,
        Bmi2,
        Fma,
        Lzcnt,
        Pclmulqdq,
        Popcnt,
        Sse,
        Sse2,
        Sse3,
        Ssse3,
        Sse41,
        Sse42,
        Count
    };

    inline constexpr vcase::usize kCpuFeatureCount = static_cast<vcase::usize>(CpuFeature::Count);

    [[nodiscard]] constexpr const char* FeatureName(CpuFeature feature) noexcept
    {
        switch (feature)
        {
        case CpuFeature::Aes:       return "AES";
        case CpuFeature::Avx:       return "AVX";
        case CpuFeature::Avx2:      return "AVX2";
        case CpuFeature::Bmi1:      return "BMI1";
        case CpuFeature::Bmi2:      return "BMI2";
        case CpuFeature::Fma:       return "FMA";
        case CpuFeature::Lzcnt:     return "LZCNT";
        case CpuFeature::Pclmulqdq: return "PCLMULQDQ";
        case CpuFeature::Popcnt:    return "POPCNT";
        case CpuFeature::Sse:       return "SSE";
        case CpuFeature::Sse2:      return "SSE2";
        case CpuFeature::Sse3:      return "SSE3";
        case CpuFeature::Ssse3:     return "SSSE3";
        case CpuFeature::Sse41:     return "SSE4.1";
        case CpuFeature::Sse42:     return "SSE4.2";
        default:                    return "<unknown>";
        }
    }

    [[nodiscard]] constexpr CpuFeature FeatureAt(vcase::usize index) noexcept
    {
        return (index < kCpuFeatureCount) ? static_cast<CpuFeature>(index) : CpuFeature::Count;
    }

    // ------------------------------------------------------------------------
    // CpuFeatureSet: one bit per CpuFeature
    // ------------------------------------------------------------------------

    struct CpuFeatureSet
    {
        vcase::u32 bits = 0;

        [[nodiscard]] constexpr bool Has(CpuFeature feature) const noexcept
        {
            return feature < CpuFeature::Count && ((bits >> static_cast<vcase::u32>(feature)) & 1u) != 0;
        }

        constexpr void Set(CpuFeature feature, bool supported = true) noexcept
        {
            if (feature >= CpuFeature::Count)
            {
                return;
            }
            const vcase::u32 mask = 1u << static_cast<vcase::u32>(feature);
            bits = supported ? (bits | mask) : (bits & ~mask);
        }
    };

    static_assert(kCpuFeatureCount <= 32, "CpuFeatureSet stores one bit per feature in a u32.");
    static_assert(std::is_trivially_copyable_v<CpuFeatureSet>);

    // ------------------------------------------------------------------------
    // Backend metadata and capabilities
    // ------------------------------------------------------------------------

    struct CpuFeatureCaps
    {
        bool hardwareQuery = false; // True when answers come from the executing CPU.
        vcase::DeterminismMode determinism = vcase::DeterminismMode::Unknown;
    };

    static_assert(std::is_trivially_copyable_v<CpuFeatureCaps>);

    // ------------------------------------------------------------------------
    // Dynamic face (tiny v-table for late binding)
    // ------------------------------------------------------------------------

    struct CpuFeatureVTable
    {
        using GetCapsFunc     = CpuFeatureCaps(*)(const void* userData) noexcept;
        using IsSupportedFunc = bool(*)(const void* userData, CpuFeature feature) noexcept;

        GetCapsFunc     getCaps     = nullptr;
        IsSupportedFunc isSupported = nullptr;
    };

    struct CpuFeatureInterface
    {
        CpuFeatureVTable vtable{};
        const void*      userData = nullptr; // Non-owning backend instance pointer.
    };

    [[nodiscard]] inline CpuFeatureCaps QueryCaps(const CpuFeatureInterface& features) noexcept
    {
        return (features.vtable.getCaps && features.userData)
            ? features.vtable.getCaps(features.userData)
            : CpuFeatureCaps{};
    }

    // An unbound interface answers "unsupported" for everything.
    [[nodiscard]] inline bool IsSupported(const CpuFeatureInterface& features, CpuFeature feature) noexcept
    {
        return (features.vtable.isSupported && features.userData)
            ? features.vtable.isSupported(features.userData, feature)
            : false;
    }

    // ------------------------------------------------------------------------
    // Static face (concept + adapter to dynamic v-table)
    // ------------------------------------------------------------------------

    template <typename Backend>
    concept CpuFeatureBackend = requires(const Backend& constBackend, CpuFeature feature)
    {
        { constBackend.GetCaps() } noexcept -> std::same_as<CpuFeatureCaps>;
        { constBackend.IsSupported(feature) } noexcept -> std::same_as<bool>;
    };

    namespace detail
    {
        template <typename Backend>
        struct CpuFeatureInterfaceAdapter
        {
            static CpuFeatureCaps GetCaps(const void* userData) noexcept
            {
                return static_cast<const Backend*>(userData)->GetCaps();
            }

            static bool IsSupported(const void* userData, CpuFeature feature) noexcept
            {
                return static_cast<const Backend*>(userData)->IsSupported(feature);
            }
        };
    } // namespace detail

    template <typename Backend>
    [[nodiscard]] inline CpuFeatureInterface MakeCpuFeatureInterface(const Backend& backend) noexcept
    {
        static_assert(CpuFeatureBackend<Backend>, "Backend must satisfy CpuFeatureBackend concept.");

        CpuFeatureInterface iface{};
        iface.userData           = &backend;
        iface.vtable.getCaps     = &detail::CpuFeatureInterfaceAdapter<Backend>::GetCaps;
        iface.vtable.isSupported = &detail::CpuFeatureInterfaceAdapter<Backend>::IsSupported;
        return iface;
    }

} // namespace vcase::cpu
