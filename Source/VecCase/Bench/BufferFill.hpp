#pragma once
// ============================================================================
// VecCase - VecCase/Bench/BufferFill.hpp
// ----------------------------------------------------------------------------
// Purpose : Fill a benchmark source buffer with uniformly distributed bytes
//           (0x00-0xFF) so roughly 10% of the input is lowercase ASCII and
//           the kernels see realistic mixed data.
// Contract: noexcept, no allocations. Same seed -> same bytes.
// Notes   : Uses std::mt19937_64 and slices each 64-bit draw into 8 bytes;
//           every output bit of the engine is uniform, so each byte is too.
// ============================================================================

#include "VecCase/Types.hpp"

#include <cstring>
#include <random>
#include <span>

namespace vcase::bench
{
    inline void FillRandomBytes(std::span<u8> bytes, u64 seed) noexcept
    {
        std::mt19937_64 engine(seed);

        usize offset = 0;
        const usize size = bytes.size();
        while (offset < size)
        {
            const u64 word = engine();
            const usize chunk = (size - offset < sizeof(word)) ? (size - offset) : sizeof(word);
            std::memcpy(bytes.data() + offset, &word, chunk);
            offset += chunk;
        }
    }

    // Non-deterministic seed for real runs.
    [[nodiscard]] inline u64 RandomSeed()
    {
        std::random_device device;
        return (static_cast<u64>(device()) << 32u) ^ static_cast<u64>(device());
    }

} // namespace vcase::bench
