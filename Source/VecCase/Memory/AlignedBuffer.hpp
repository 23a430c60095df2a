#pragma once
// ============================================================================
// VecCase - VecCase/Memory/AlignedBuffer.hpp
// ----------------------------------------------------------------------------
// Purpose : Own one page-backed byte buffer whose base is aligned to
//           kBufferAlignment (4096). Used for the benchmark source/sink pair.
// Contract: Allocate() returns exactly `length` usable bytes or terminates the
//           process through the OOM policy; it never returns a partially
//           usable buffer. Move-only; the destructor releases the pages
//           exactly once. Not thread-safe.
// Notes   : Pages come straight from the PageAllocator facade (mmap /
//           VirtualAlloc), so the base is also page-aligned and the tail up to
//           the next page boundary is readable but outside Size().
// ============================================================================

#include "VecCase/CoreMinimal.hpp"
#include "VecCase/Memory/Alignment.hpp"
#include "VecCase/Memory/OOM.hpp"
#include "VecCase/Memory/PageAllocator.hpp"

#include <span>
#include <utility>   // std::exchange

namespace vcase::memory
{
    inline constexpr usize kBufferAlignment = 4096;

    static_assert(::vcase::core::IsPowerOfTwo(kBufferAlignment), "Buffer alignment must be a power of two");

    class AlignedBuffer final
    {
    public:
        AlignedBuffer() noexcept = default;

        AlignedBuffer(const AlignedBuffer&) = delete;
        AlignedBuffer& operator=(const AlignedBuffer&) = delete;

        AlignedBuffer(AlignedBuffer&& other) noexcept
            : mData(std::exchange(other.mData, nullptr))
            , mSize(std::exchange(other.mSize, 0))
            , mReserved(std::exchange(other.mReserved, 0))
        {
        }

        AlignedBuffer& operator=(AlignedBuffer&& other) noexcept
        {
            if (this != &other)
            {
                Reset();
                mData = std::exchange(other.mData, nullptr);
                mSize = std::exchange(other.mSize, 0);
                mReserved = std::exchange(other.mReserved, 0);
            }
            return *this;
        }

        ~AlignedBuffer() noexcept { Reset(); }

        // ---
        // Purpose : Allocate `length` bytes aligned to kBufferAlignment.
        // Contract: length > 0 (a zero request yields an empty buffer and a
        //           soft check). Allocation failure is fatal.
        // ---
        [[nodiscard]] static AlignedBuffer Allocate(usize length) noexcept
        {
            AlignedBuffer buffer{};
            if (length == 0)
            {
                VCASE_CHECK(false);
                return buffer;
            }

            const usize granularity = (PageSize() > kBufferAlignment) ? PageSize() : kBufferAlignment;
            const usize reserved = ::vcase::core::AlignUp<usize>(length, granularity);
            if (reserved < length)
            {
                VCASE_MEM_FATAL_OOM(length, kBufferAlignment, "AlignedBuffer::Allocate");
            }

            void* base = Reserve(reserved);
            if (!base)
            {
                VCASE_MEM_FATAL_OOM(length, kBufferAlignment, "AlignedBuffer::Allocate");
            }

            if (!::vcase::core::IsAligned(base, kBufferAlignment) || !Commit(base, reserved))
            {
                Release(base, reserved);
                VCASE_MEM_FATAL_OOM(length, kBufferAlignment, "AlignedBuffer::Allocate");
            }

            buffer.mData = static_cast<u8*>(base);
            buffer.mSize = length;
            buffer.mReserved = reserved;
            return buffer;
        }

        [[nodiscard]] u8* Data() noexcept { return mData; }
        [[nodiscard]] const u8* Data() const noexcept { return mData; }
        [[nodiscard]] usize Size() const noexcept { return mSize; }
        [[nodiscard]] bool IsValid() const noexcept { return mData != nullptr; }

        [[nodiscard]] std::span<u8> Bytes() noexcept { return { mData, mSize }; }
        [[nodiscard]] std::span<const u8> Bytes() const noexcept { return { mData, mSize }; }

        void Reset() noexcept
        {
            if (mData)
            {
                Release(mData, mReserved);
            }
            mData = nullptr;
            mSize = 0;
            mReserved = 0;
        }

    private:
        u8*   mData = nullptr;
        usize mSize = 0;
        usize mReserved = 0; // Page-rounded length handed to Reserve/Release.
    };

} // namespace vcase::memory
