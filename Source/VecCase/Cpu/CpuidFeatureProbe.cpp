// ============================================================================
// VecCase - Source/VecCase/Cpu/CpuidFeatureProbe.cpp
// ----------------------------------------------------------------------------
// Purpose : CPUID / XGETBV plumbing behind CpuidFeatureProbe.
// Contract: Compiles on every platform; the x86 paths are gated on
//           VCASE_CPU_X86_FAMILY and the compiler's intrinsic flavor.
// ============================================================================

#include "VecCase/Cpu/CpuidFeatureProbe.hpp"
#include "VecCase/CoreMinimal.hpp"

#if VCASE_CPU_X86_FAMILY
#    if VCASE_COMPILER_MSVC
#        include <intrin.h>     // __cpuidex, _xgetbv
#    else
#        include <cpuid.h>      // __cpuid_count, __get_cpuid_max
#    endif
#endif

namespace vcase::cpu
{
    namespace
    {
#if VCASE_CPU_X86_FAMILY
        struct CpuidRegs
        {
            u32 eax = 0;
            u32 ebx = 0;
            u32 ecx = 0;
            u32 edx = 0;
        };

        [[nodiscard]] CpuidRegs QueryCpuid(u32 leaf, u32 subleaf) noexcept
        {
            CpuidRegs regs{};
#if VCASE_COMPILER_MSVC
            int raw[4] = {};
            __cpuidex(raw, static_cast<int>(leaf), static_cast<int>(subleaf));
            regs.eax = static_cast<u32>(raw[0]);
            regs.ebx = static_cast<u32>(raw[1]);
            regs.ecx = static_cast<u32>(raw[2]);
            regs.edx = static_cast<u32>(raw[3]);
#else
            __cpuid_count(leaf, subleaf, regs.eax, regs.ebx, regs.ecx, regs.edx);
#endif
            return regs;
        }

        // Only valid once CPUID.1:ECX.OSXSAVE has been observed.
        [[nodiscard]] u64 ReadXcr0() noexcept
        {
#if VCASE_COMPILER_MSVC
            return static_cast<u64>(_xgetbv(0));
#else
            u32 lo = 0;
            u32 hi = 0;
            __asm__ volatile("xgetbv" : "=a"(lo), "=d"(hi) : "c"(0u));
            return (static_cast<u64>(hi) << 32u) | lo;
#endif
        }

        [[nodiscard]] constexpr bool Bit(u32 reg, u32 index) noexcept
        {
            return ((reg >> index) & 1u) != 0;
        }
#endif
    } // namespace

    CpuidFeatureProbe::CpuidFeatureProbe() noexcept
        : mFeatures(Detect())
    {
    }

    CpuFeatureCaps CpuidFeatureProbe::GetCaps() const noexcept
    {
        CpuFeatureCaps caps{};
        caps.hardwareQuery = (VCASE_CPU_X86_FAMILY != 0);
        caps.determinism = vcase::DeterminismMode::Off;
        return caps;
    }

    CpuFeatureSet CpuidFeatureProbe::Detect() noexcept
    {
        CpuFeatureSet set{};

#if VCASE_CPU_X86_FAMILY
        const u32 maxLeaf = QueryCpuid(0u, 0u).eax;
        if (maxLeaf < 1u)
        {
            VCASE_LOG_WARNING("Cpu", "CPUID reports no feature leaves; treating every extension as unsupported");
            return set;
        }

        const CpuidRegs leaf1 = QueryCpuid(1u, 0u);

        set.Set(CpuFeature::Sse,       Bit(leaf1.edx, 25));
        set.Set(CpuFeature::Sse2,      Bit(leaf1.edx, 26));
        set.Set(CpuFeature::Sse3,      Bit(leaf1.ecx, 0));
        set.Set(CpuFeature::Pclmulqdq, Bit(leaf1.ecx, 1));
        set.Set(CpuFeature::Ssse3,     Bit(leaf1.ecx, 9));
        set.Set(CpuFeature::Sse41,     Bit(leaf1.ecx, 19));
        set.Set(CpuFeature::Sse42,     Bit(leaf1.ecx, 20));
        set.Set(CpuFeature::Popcnt,    Bit(leaf1.ecx, 23));
        set.Set(CpuFeature::Aes,       Bit(leaf1.ecx, 25));

        // XCR0 bit 1 = XMM state, bit 2 = YMM state.
        const bool osSavesYmm = Bit(leaf1.ecx, 27) && ((ReadXcr0() & 0x6u) == 0x6u);

        set.Set(CpuFeature::Avx, osSavesYmm && Bit(leaf1.ecx, 28));
        set.Set(CpuFeature::Fma, osSavesYmm && Bit(leaf1.ecx, 12));

        if (maxLeaf >= 7u)
        {
            const CpuidRegs leaf7 = QueryCpuid(7u, 0u);
            set.Set(CpuFeature::Bmi1, Bit(leaf7.ebx, 3));
            set.Set(CpuFeature::Avx2, osSavesYmm && Bit(leaf7.ebx, 5));
            set.Set(CpuFeature::Bmi2, Bit(leaf7.ebx, 8));
        }

        const u32 maxExtLeaf = QueryCpuid(0x80000000u, 0u).eax;
        if (maxExtLeaf >= 0x80000001u)
        {
            const CpuidRegs ext1 = QueryCpuid(0x80000001u, 0u);
            set.Set(CpuFeature::Lzcnt, Bit(ext1.ecx, 5)); // ABM
        }

        VCASE_LOG_VERBOSE("Cpu", "CPUID feature bits: {:#x}", set.bits);
#else
        VCASE_LOG_VERBOSE("Cpu", "Host has no CPUID; x86 extensions reported unsupported");
#endif

        return set;
    }

} // namespace vcase::cpu
