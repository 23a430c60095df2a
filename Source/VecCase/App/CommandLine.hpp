#pragma once
// ============================================================================
// VecCase - VecCase/App/CommandLine.hpp
// ----------------------------------------------------------------------------
// Purpose : Parse the single optional positional argument: buffer size in MiB.
// Contract: noexcept, no allocations. Surrounding whitespace is ignored and a
//           leading '+' is accepted. The value must be a positive integer
//           whose byte count (value * MiB) fits in usize. Arguments after the
//           first are ignored.
// ============================================================================

#include "VecCase/Types.hpp"

#include <string_view>

#ifndef VCASE_DEFAULT_BUFFER_MIB
#define VCASE_DEFAULT_BUFFER_MIB 16
#endif

namespace vcase::app
{
    inline constexpr u64 kDefaultBufferMiB = static_cast<u64>(VCASE_DEFAULT_BUFFER_MIB);

    inline constexpr std::string_view kParseErrorMessage =
        "Could not parse the length argument. Please provide a valid integer.";

    enum class ParseStatus : u8
    {
        Ok = 0,
        NotAnInteger, // Empty, junk characters, or a bare sign.
        NotPositive,  // Zero or negative.
        TooLarge,     // Out of range, or value * MiB overflows usize.
    };

    [[nodiscard]] constexpr const char* ParseStatusName(ParseStatus status) noexcept
    {
        switch (status)
        {
        case ParseStatus::Ok:           return "Ok";
        case ParseStatus::NotAnInteger: return "NotAnInteger";
        case ParseStatus::NotPositive:  return "NotPositive";
        case ParseStatus::TooLarge:     return "TooLarge";
        default:                        return "<unknown>";
        }
    }

    struct ParseResult
    {
        ParseStatus status = ParseStatus::Ok;
        u64         bufferMiB = kDefaultBufferMiB;

        [[nodiscard]] constexpr bool Ok() const noexcept { return status == ParseStatus::Ok; }
    };

    // Parse one textual MiB value.
    [[nodiscard]] ParseResult ParseBufferMiB(std::string_view text) noexcept;

    // Parse argv; no positional argument yields the default.
    [[nodiscard]] ParseResult ParseCommandLine(int argc, const char* const* argv) noexcept;

} // namespace vcase::app
