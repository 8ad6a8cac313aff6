// Copyright (C) 2026  hwinstr contributors

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string_view>

namespace lib
{
    namespace log
    {
        enum class level : std::uint8_t
        {
            debug,
            info,
            warn,
            error,
            fatal
        };

        // receives fully formatted text, newlines included
        using sink_type = void (*)(level lvl, std::string_view text);

        void default_sink(level lvl, std::string_view text);

        void set_sink(sink_type sink);
        sink_type get_sink();

        void set_level(level lvl);
        level get_level();
        bool enabled(level lvl);

        namespace unsafe
        {
            void lock();
            void unlock();

            // caller holds the lock
            void prints(level lvl, std::string_view text);
        } // namespace unsafe

        void prints(level lvl, std::string_view text);

        // "[level] message\n"
        void vline(level lvl, fmt::string_view format, fmt::format_args args);
        void vprint(level lvl, fmt::string_view format, fmt::format_args args, bool newline);
    } // namespace log

    template<typename ...Args>
    inline void print(fmt::format_string<Args...> format, Args &&...args)
    {
        log::vprint(log::level::info, format, fmt::make_format_args(args...), false);
    }

    template<typename ...Args>
    inline void println(fmt::format_string<Args...> format, Args &&...args)
    {
        log::vprint(log::level::info, format, fmt::make_format_args(args...), true);
    }

    template<typename ...Args>
    inline void debug(fmt::format_string<Args...> format, Args &&...args)
    {
        log::vline(log::level::debug, format, fmt::make_format_args(args...));
    }

    template<typename ...Args>
    inline void info(fmt::format_string<Args...> format, Args &&...args)
    {
        log::vline(log::level::info, format, fmt::make_format_args(args...));
    }

    template<typename ...Args>
    inline void warn(fmt::format_string<Args...> format, Args &&...args)
    {
        log::vline(log::level::warn, format, fmt::make_format_args(args...));
    }

    template<typename ...Args>
    inline void error(fmt::format_string<Args...> format, Args &&...args)
    {
        log::vline(log::level::error, format, fmt::make_format_args(args...));
    }
} // namespace lib
