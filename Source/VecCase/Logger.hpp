#pragma once


// =============================
// VecCase - Logger.hpp (C++20 + {fmt}, minimal but solid)
// =============================
// Goals
//  - Always-safe to include (header-only, one formatting dependency)
//  - {fmt} backend: fmt::print with compile-time checked format strings
//  - Zero/low overhead when disabled (compile-time switches)
//  - Simple runtime min-level filter and optional category filter
//  - Thread-safe emission (coarse-grained mutex around a single print)
//
// Non-goals (for now)
//  - Async logging, ring buffers, files, colors, sinks fan-out
//  - Structured logs (JSON)
//
// Notes
//  - Categories are plain string literals (const char*). Keep them short (e.g., "Bench", "Kernel").
//  - Info/Verbose go to stdout, Warn/Error/Fatal to stderr.

#include <cstdint>
#include <atomic>
#include <exception>
#include <mutex>
#include <string_view>
#include <cstdio>       // std::FILE, stdout/stderr
#include <cstdlib>      // std::abort

#include <fmt/core.h>   // fmt::print, fmt::format_string

#ifndef VCASE_ENABLE_LOGGING
#  define VCASE_ENABLE_LOGGING 1
#endif
#ifndef VCASE_ENABLE_LOG_ASSERT
#  define VCASE_ENABLE_LOG_ASSERT 1
#endif

namespace vcase::core {

    enum class LogLevel : std::uint8_t {
        Disabled = 0,
        Fatal = 1,
        Error = 2,
        Warn = 3,
        Info = 4,
        Verbose = 5,
        // NOTE: higher number == more chatty
        // MinLevel policy: a message is emitted if (level <= MinLevel).
    };

    struct LoggerConfig {
        std::atomic<LogLevel> MinLevel{ LogLevel::Info };
        // If non-null, only messages whose category equals this filter are printed.
        // Must stay a stable C-string literal (e.g., "Bench").
        std::atomic<const char*> CategoryEqualsFilter{ nullptr };
    };

    class Logger final {
    public:
        static Logger& Get() noexcept {
            static Logger g;
            return g;
        }

        static void SetMinLevel(LogLevel lvl) noexcept { Get().mCfg.MinLevel.store(lvl, std::memory_order_relaxed); }
        static LogLevel GetMinLevel() noexcept { return Get().mCfg.MinLevel.load(std::memory_order_relaxed); }
        static void SetCategoryEqualsFilter(const char* cat) noexcept {
            Get().mCfg.CategoryEqualsFilter.store(cat, std::memory_order_relaxed);
        }

        // Public check to short-circuit expensive logging
        static bool IsEnabled(LogLevel lvl, const char* category) noexcept {
            return ShouldEmit(lvl, category);
        }

        // ----------------------
        // Level-specific helpers
        // ----------------------
        template <class... Args>
        static void Info(const char* category, fmt::format_string<Args...> format, Args&&... args) noexcept {
            Print(LogLevel::Info, category, stdout, format, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        static void Warn(const char* category, fmt::format_string<Args...> format, Args&&... args) noexcept {
            Print(LogLevel::Warn, category, stderr, format, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        static void Error(const char* category, fmt::format_string<Args...> format, Args&&... args) noexcept {
            Print(LogLevel::Error, category, stderr, format, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        [[noreturn]] static void Fatal(const char* category, fmt::format_string<Args...> format, Args&&... args) noexcept {
            Print(LogLevel::Fatal, category, stderr, format, static_cast<Args&&>(args)...);
            std::fflush(stderr);
            std::abort();
        }
        template <class... Args>
        static void Verbose(const char* category, fmt::format_string<Args...> format, Args&&... args) noexcept {
            Print(LogLevel::Verbose, category, stdout, format, static_cast<Args&&>(args)...);
        }

        // Generic entry (level chosen by caller).
        template <class... Args>
        static void Log(LogLevel lvl, const char* category, fmt::format_string<Args...> format, Args&&... args) noexcept {
            std::FILE* stream = (lvl <= LogLevel::Warn) ? stderr : stdout;
            Print(lvl, category, stream, format, static_cast<Args&&>(args)...);
        }

    private:
        Logger() = default;

        static bool ShouldEmit(LogLevel lvl, const char* category) noexcept {
            Logger& self = Get();
            if (lvl == LogLevel::Disabled) return false;
            if (lvl > self.mCfg.MinLevel.load(std::memory_order_relaxed)) return false;
            const char* filter = self.mCfg.CategoryEqualsFilter.load(std::memory_order_relaxed);
            if (filter) {
                if (!category) return false; // filter active => category is required
                if (std::string_view(filter) != category) return false;
            }
            return true;
        }

        template <class... Args>
        static void Print(LogLevel lvl, const char* category, std::FILE* stream, fmt::format_string<Args...> format, Args&&... args) noexcept {
            if (!ShouldEmit(lvl, category)) return;
            Logger& self = Get();
            const char* lvlStr = ToShortLevel(lvl);
            std::scoped_lock lock(self.mMutex);
            try {
                if (category) {
                    fmt::print(stream, "[{}][{}] ", lvlStr, category);
                }
                else {
                    fmt::print(stream, "[{}] ", lvlStr);
                }
                fmt::print(stream, format, static_cast<Args&&>(args)...);
                std::fputc('\n', stream);
            }
            catch (const std::exception& e) {
                // The sink itself failed; report on stderr without formatting.
                std::fputs("[Logger] emission failed: ", stderr);
                std::fputs(e.what(), stderr);
                std::fputc('\n', stderr);
            }
        }

        static const char* ToShortLevel(LogLevel lvl) noexcept {
            switch (lvl) {
            case LogLevel::Fatal:   return "F";
            case LogLevel::Error:   return "E";
            case LogLevel::Warn:    return "W";
            case LogLevel::Info:    return "I";
            case LogLevel::Verbose: return "V";
            default:                return "-";
            }
        }

    private:
        std::mutex mMutex{};
        LoggerConfig mCfg{};
    };

} // namespace vcase::core

// ----------------------
// Public log macros (single evaluation of Category)
// ----------------------
#if VCASE_ENABLE_LOGGING
#define VCASE_LOG_VERBOSE(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::vcase::core::Logger::IsEnabled(::vcase::core::LogLevel::Verbose, _cat)) { \
            ::vcase::core::Logger::Verbose(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define VCASE_LOG_INFO(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::vcase::core::Logger::IsEnabled(::vcase::core::LogLevel::Info, _cat)) { \
            ::vcase::core::Logger::Info(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define VCASE_LOG_WARNING(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::vcase::core::Logger::IsEnabled(::vcase::core::LogLevel::Warn, _cat)) { \
            ::vcase::core::Logger::Warn(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define VCASE_LOG_ERROR(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::vcase::core::Logger::IsEnabled(::vcase::core::LogLevel::Error, _cat)) { \
            ::vcase::core::Logger::Error(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define VCASE_LOG_FATAL(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        ::vcase::core::Logger::Fatal(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
    } while (0)
#else
#define VCASE_LOG_VERBOSE(Category, Fmt, ...)  ((void)0)
#define VCASE_LOG_INFO(Category, Fmt, ...)     ((void)0)
#define VCASE_LOG_WARNING(Category, Fmt, ...)  ((void)0)
#define VCASE_LOG_ERROR(Category, Fmt, ...)    ((void)0)
#define VCASE_LOG_FATAL(Category, Fmt, ...)    std::abort()
#endif

// ----------------------
// Assert macro
// ----------------------
#if VCASE_ENABLE_LOG_ASSERT
#ifndef VCASE_ASSERT
#include <source_location>

// Argument-counting helper to choose ASSERT_1 or ASSERT_2
#define VCASE_EXPAND(x) x
#define VCASE_GET_MACRO(_1,_2,NAME,...) NAME

// 1-arg form: VCASE_ASSERT(Expr)
#define VCASE_ASSERT_1(Expr) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::vcase::core::Logger::Error("Assert", "{} ({}:{}): assertion failed: {}", \
                    loc.function_name(), loc.file_name(), loc.line(), #Expr); \
            } \
        } while(0)

// 2-arg form: VCASE_ASSERT(Expr, Msg)
#define VCASE_ASSERT_2(Expr, Msg) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::vcase::core::Logger::Error("Assert", "{} ({}:{}): {}", \
                    loc.function_name(), loc.file_name(), loc.line(), Msg); \
            } \
        } while(0)

// Dispatcher that supports both 1-arg and 2-arg calls
#define VCASE_ASSERT(...) \
            VCASE_EXPAND(VCASE_GET_MACRO(__VA_ARGS__, VCASE_ASSERT_2, VCASE_ASSERT_1)(__VA_ARGS__))

#endif
#else
#ifndef VCASE_ASSERT
#define VCASE_ASSERT(...) ((void)0)
#endif
#endif
