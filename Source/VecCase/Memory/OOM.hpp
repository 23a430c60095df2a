#pragma once
// ============================================================================
// VecCase - VecCase/Memory/OOM.hpp
// ----------------------------------------------------------------------------
// Purpose : Out-of-memory policy invoked by the buffer layer after an
//           allocation failure. Uses the logging front-end; no local fallbacks.
// Contract: Header-only and noexcept; never allocates, never throws.
//           Benchmark buffers are not optional, so allocation failure is
//           always fatal: log the request then terminate the process.
// Notes   : Callers go through VCASE_MEM_FATAL_OOM so the report carries the
//           failing call site.
// ============================================================================
#include "VecCase/Logger.hpp"

#include <cstddef>
#include <cstdlib>

#ifndef VCASE_MEM_LOG_CATEGORY
#define VCASE_MEM_LOG_CATEGORY "Memory"
#endif

namespace vcase::core {

    // ---
    // Purpose : Execute the fatal OOM path, logging context before terminating.
    // Contract: Never returns; safe to call with null `where`.
    // ---
    [[noreturn]] inline void FatalOOM(std::size_t size, std::size_t align,
        const char* where,
        const char* file, int line) noexcept
    {
        VCASE_LOG_FATAL(VCASE_MEM_LOG_CATEGORY,
            "Out of memory in {}: size={} align={} at {}:{}",
            where ? where : "<unknown>", size, align, file, line);

        // Unreachable when logging is enabled (Fatal aborts); kept for the disabled build.
        std::abort();
    }

} // namespace vcase::core

#define VCASE_MEM_FATAL_OOM(size, align, where) \
    ::vcase::core::FatalOOM((size), (align), (where), __FILE__, __LINE__)
