#pragma once
// ============================================================================
// VecCase - Source/VecCase/Kernels/OverlapTail.hpp
// ----------------------------------------------------------------------------
// Purpose : Fixed-width chunk iteration that covers a buffer of any length
//           >= Width without a scalar remainder loop. Full chunks run from the
//           front; the last chunk is re-anchored at `length - Width` and may
//           overlap bytes the main loop already processed.
// Contract: length >= Width (caller-checked). `chunk(offset)` is invoked with
//           offsets in [0, length - Width]; every byte in [0, length) is
//           covered at least once. Only valid for transforms that are
//           idempotent and position-independent per byte: re-processing an
//           already-transformed byte must yield the same byte.
// Notes   : The main loop runs while `offset + Width < length`, so a buffer of
//           exactly Width bytes is handled by the tail chunk alone, and in a
//           multiple-of-Width buffer the tail lands on the last aligned chunk
//           with no overlap.
// ============================================================================

#include "VecCase/Platform/PlatformCompiler.hpp"
#include "VecCase/Types.hpp"

namespace vcase::kernels
{
    template <usize Width, class F>
    VCASE_FORCEINLINE void ForEachChunkWithOverlapTail(usize length, F&& chunk) noexcept
    {
        static_assert(Width > 0, "Chunk width must be positive");

        usize offset = 0;
        for (; offset + Width < length; offset += Width)
        {
            chunk(offset);
        }
        chunk(length - Width);
    }

} // namespace vcase::kernels
