// Copyright (C) 2026  hwinstr contributors

#pragma once

#include <lib/log.hpp>

#include <source_location>

namespace lib
{
    [[noreturn]]
    void vpanic(fmt::string_view format, fmt::format_args args);

    template<typename ...Args>
    [[noreturn]] inline void panic(fmt::format_string<Args...> format, Args &&...args)
    {
        vpanic(format, fmt::make_format_args(args...));
    }

    template<typename ...Args>
    inline void panic_if(bool cond, fmt::format_string<Args...> format, Args &&...args)
    {
        if (cond) [[unlikely]]
            vpanic(format, fmt::make_format_args(args...));
    }

    inline void bug_on(bool cond, std::source_location loc = std::source_location::current())
    {
        if (cond) [[unlikely]]
            panic("bug at {}:{} in {}", loc.file_name(), loc.line(), loc.function_name());
    }

    template<typename ...Args>
    inline void unused(Args &&...) { }
} // namespace lib
