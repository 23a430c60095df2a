#pragma once
// ============================================================================
// VecCase - VecCase/Memory/PageAllocator.hpp
// ----------------------------------------------------------------------------
// Purpose : Expose a minimal, cross-platform virtual memory facade that wraps
//           page reservation, commitment, and release without imposing a
//           higher-level policy. Serves as the substrate for AlignedBuffer.
// Contract: All functions are stateless and thread-safe. Sizes are aligned
//           upward to PageSize() automatically. Reserve/Release must be paired
//           with identical (ptr, size) parameters.
// Notes   : Windows paths rely on VirtualAlloc/VirtualFree while POSIX paths
//           lean on mmap/munmap/mprotect. Errors are logged and surfaced as
//           nullptr / false; the OOM policy belongs to the caller.
// ============================================================================

#include "VecCase/CoreMinimal.hpp"
#include "VecCase/Memory/Alignment.hpp"
#include "VecCase/Diagnostics/Check.hpp"

// ------------------------------------------------------------------------
// Platform includes (minimal)
// ------------------------------------------------------------------------
#if VCASE_PLATFORM_WINDOWS
#    ifndef NOMINMAX
#        define NOMINMAX
#    endif
#    include <windows.h>
#else
#    include <errno.h>
#    include <sys/mman.h>
#    include <unistd.h>
#endif

namespace vcase
{
namespace memory
{
#ifndef VCASE_PAGE_ALLOCATOR_LOG_CATEGORY
#    define VCASE_PAGE_ALLOCATOR_LOG_CATEGORY "Memory.PageAllocator"
#endif

    // ------------------------------------------------------------------------
    // PageSize()
    // ------------------------------------------------------------------------
    // Purpose : Return the native OS page size in bytes.
    // Contract: Thread-safe, computed once, never returns 0.
    // ------------------------------------------------------------------------
    [[nodiscard]] inline usize PageSize() noexcept
    {
        static const usize cached = []() noexcept -> usize {
#if VCASE_PLATFORM_WINDOWS
            SYSTEM_INFO sysInfo{};
            ::GetSystemInfo(&sysInfo);
            return static_cast<usize>(sysInfo.dwPageSize);
#else
            long page = ::sysconf(_SC_PAGESIZE);
            if (page <= 0)
            {
                page = 4096;
            }
            return static_cast<usize>(page);
#endif
        }();
        return cached;
    }

    // ------------------------------------------------------------------------
    // Reserve()
    // ------------------------------------------------------------------------
    // Purpose : Reserve a contiguous virtual address range without committing
    //           physical pages.
    // Contract: Size must be positive; it is aligned upward to PageSize().
    //           Returns nullptr on failure (caller decides OOM policy).
    // ------------------------------------------------------------------------
    [[nodiscard]] inline void* Reserve(usize size) noexcept
    {
        size = ::vcase::core::AlignUp<usize>(size, PageSize());
        if (size == 0)
        {
            VCASE_CHECK(false);
            return nullptr;
        }

#if VCASE_PLATFORM_WINDOWS
        void* ptr = ::VirtualAlloc(nullptr, size, MEM_RESERVE, PAGE_NOACCESS);
        if (!ptr)
        {
            VCASE_LOG_ERROR(VCASE_PAGE_ALLOCATOR_LOG_CATEGORY, "Reserve() failed (Windows): {}", ::GetLastError());
        }
        return ptr;
#else
        void* ptr = ::mmap(nullptr, size, PROT_NONE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if (ptr == MAP_FAILED)
        {
            VCASE_LOG_ERROR(VCASE_PAGE_ALLOCATOR_LOG_CATEGORY, "Reserve() failed (POSIX): errno={}", errno);
            return nullptr;
        }
        return ptr;
#endif
    }

    // ------------------------------------------------------------------------
    // Commit()
    // ------------------------------------------------------------------------
    // Purpose : Commit a previously reserved range for read/write access.
    // Contract: ptr must originate from Reserve() and be page-aligned; size is
    //           rounded up to the nearest page multiple. Returns false when the
    //           OS refuses; the range then stays inaccessible.
    // ------------------------------------------------------------------------
    [[nodiscard]] inline bool Commit(void* ptr, usize size) noexcept
    {
        if (!ptr || size == 0)
        {
            VCASE_CHECK(false);
            return false;
        }

        const usize pageSize = PageSize();
        size = ::vcase::core::AlignUp<usize>(size, pageSize);
        VCASE_ASSERT(::vcase::core::IsAligned<std::uintptr_t>(reinterpret_cast<std::uintptr_t>(ptr), pageSize),
            "Commit() expects a page-aligned pointer");

#if VCASE_PLATFORM_WINDOWS
        if (!::VirtualAlloc(ptr, size, MEM_COMMIT, PAGE_READWRITE))
        {
            VCASE_LOG_ERROR(VCASE_PAGE_ALLOCATOR_LOG_CATEGORY, "Commit() failed (Windows): {}", ::GetLastError());
            return false;
        }
#else
        if (::mprotect(ptr, size, PROT_READ | PROT_WRITE) != 0)
        {
            VCASE_LOG_ERROR(VCASE_PAGE_ALLOCATOR_LOG_CATEGORY, "Commit() failed (POSIX): errno={}", errno);
            return false;
        }
#endif
        return true;
    }

    // ------------------------------------------------------------------------
    // Release()
    // ------------------------------------------------------------------------
    // Purpose : Release an entire reservation.
    // Contract: ptr must match the base returned by Reserve(); size is rounded
    //           up to PageSize(). After this call the range is invalid.
    // Notes   : Windows path ignores the size parameter per VirtualFree API.
    // ------------------------------------------------------------------------
    inline void Release(void* ptr, usize size) noexcept
    {
        if (!ptr || size == 0)
        {
            VCASE_CHECK(false);
            return;
        }

        const usize pageSize = PageSize();
        size = ::vcase::core::AlignUp<usize>(size, pageSize);
        VCASE_ASSERT(::vcase::core::IsAligned<std::uintptr_t>(reinterpret_cast<std::uintptr_t>(ptr), pageSize),
            "Release() expects a page-aligned pointer");

#if VCASE_PLATFORM_WINDOWS
        if (!::VirtualFree(ptr, 0, MEM_RELEASE))
        {
            VCASE_LOG_ERROR(VCASE_PAGE_ALLOCATOR_LOG_CATEGORY, "Release() failed (Windows): {}", ::GetLastError());
        }
#else
        if (::munmap(ptr, size) != 0)
        {
            VCASE_LOG_ERROR(VCASE_PAGE_ALLOCATOR_LOG_CATEGORY, "Release() failed (POSIX): errno={}", errno);
        }
#endif
    }
} // namespace memory
} // namespace vcase
