// ============================================================================
// VecCase - VecCase/App/CommandLine.cpp
// ============================================================================

#include "VecCase/App/CommandLine.hpp"
#include "VecCase/CoreMinimal.hpp"

#include <charconv>
#include <limits>
#include <system_error>

namespace vcase::app
{
    namespace
    {
        [[nodiscard]] constexpr bool IsSpace(char c) noexcept
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        [[nodiscard]] std::string_view Trim(std::string_view text) noexcept
        {
            while (!text.empty() && IsSpace(text.front())) text.remove_prefix(1);
            while (!text.empty() && IsSpace(text.back())) text.remove_suffix(1);
            return text;
        }
    } // namespace

    ParseResult ParseBufferMiB(std::string_view text) noexcept
    {
        ParseResult result{};
        text = Trim(text);

        bool negative = false;
        if (!text.empty() && (text.front() == '+' || text.front() == '-'))
        {
            negative = (text.front() == '-');
            text.remove_prefix(1);
        }

        // from_chars rejects a second sign, so "+-5" and "--5" fail here.
        if (text.empty())
        {
            result.status = ParseStatus::NotAnInteger;
            return result;
        }

        u64 magnitude = 0;
        const char* first = text.data();
        const char* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, magnitude);

        if (ec == std::errc::result_out_of_range)
        {
            result.status = negative ? ParseStatus::NotPositive : ParseStatus::TooLarge;
            return result;
        }
        if (ec != std::errc{} || ptr != last)
        {
            result.status = ParseStatus::NotAnInteger;
            return result;
        }
        if (negative || magnitude == 0)
        {
            result.status = ParseStatus::NotPositive;
            return result;
        }
        if (magnitude > (std::numeric_limits<usize>::max)() / MiB)
        {
            result.status = ParseStatus::TooLarge;
            return result;
        }

        result.bufferMiB = magnitude;
        return result;
    }

    ParseResult ParseCommandLine(int argc, const char* const* argv) noexcept
    {
        if (argc < 2 || argv == nullptr || argv[1] == nullptr)
        {
            return ParseResult{};
        }

        const ParseResult result = ParseBufferMiB(argv[1]);
        if (!result.Ok())
        {
            VCASE_LOG_VERBOSE("App", "rejected length argument '{}': {}", argv[1], ParseStatusName(result.status));
        }
        return result;
    }

} // namespace vcase::app
