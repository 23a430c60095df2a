// Compile-only self containment check for the byte-vector headers
#include "VecCase/Simd/Byte32.hpp"

namespace {
    using namespace vcase::simd;

    static_assert(kByte16Lanes == 16, "Byte16 holds 16 lanes");
    static_assert(kByte32Lanes == 32, "Byte32 holds 32 lanes");

    void TouchByteVectors(const vcase::u8* src, vcase::u8* dst) noexcept
    {
        const Byte32 v = Add(Load32(src), Splat32(1));
        Store(dst, Xor(And(v, CmpLt(v, Splat32(0))), v));
    }
}
