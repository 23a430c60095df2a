#pragma once
// ============================================================================
// VecCase - VecCase/Diagnostics/ConsoleReport.hpp
// ----------------------------------------------------------------------------
// Purpose : Plain report output (no level prefix, no category) to a caller-
//           chosen stream. Report text is not subject to the Logger filters.
// Contract: noexcept. A null stream discards the text. Sink failures are
//           reported once per call through VCASE_LOG_ERROR and otherwise
//           ignored; the report never aborts the pipeline.
// Notes   : ReportText leaves the line open and flushes, for "Warming up..."
//           style progress that is completed by a later ReportLine.
// ============================================================================

#include "VecCase/Logger.hpp"

#include <cstdio>
#include <exception>

#include <fmt/core.h>

namespace vcase::core
{
    template <class... Args>
    inline void ReportText(std::FILE* out, fmt::format_string<Args...> format, Args&&... args) noexcept
    {
        if (!out)
        {
            return;
        }
        try
        {
            fmt::print(out, format, static_cast<Args&&>(args)...);
            std::fflush(out);
        }
        catch (const std::exception& e)
        {
            VCASE_LOG_ERROR("Report", "report output failed: {}", e.what());
        }
    }

    template <class... Args>
    inline void ReportLine(std::FILE* out, fmt::format_string<Args...> format, Args&&... args) noexcept
    {
        if (!out)
        {
            return;
        }
        try
        {
            fmt::print(out, format, static_cast<Args&&>(args)...);
            std::fputc('\n', out);
        }
        catch (const std::exception& e)
        {
            VCASE_LOG_ERROR("Report", "report output failed: {}", e.what());
        }
    }

    inline void ReportBlankLine(std::FILE* out) noexcept
    {
        if (out)
        {
            std::fputc('\n', out);
        }
    }

} // namespace vcase::core
