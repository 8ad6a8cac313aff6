// Copyright (C) 2026  hwinstr contributors

#include <lib/log.hpp>
#include <lib/spinlock.hpp>

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>

namespace lib::log
{
    namespace
    {
        constinit spinlock log_lock;
        constinit std::atomic<sink_type> current_sink { default_sink };
        constinit std::atomic<level> min_level { level::info };
    } // namespace

    void default_sink(level lvl, std::string_view text)
    {
        auto stream = lvl >= level::warn ? stderr : stdout;
        fmt::print(stream, "{}", text);
        std::fflush(stream);
    }

    void set_sink(sink_type sink)
    {
        current_sink.store(sink ? sink : default_sink, std::memory_order_release);
    }

    sink_type get_sink()
    {
        return current_sink.load(std::memory_order_acquire);
    }

    void set_level(level lvl)
    {
        min_level.store(lvl, std::memory_order_relaxed);
    }

    level get_level()
    {
        return min_level.load(std::memory_order_relaxed);
    }

    bool enabled(level lvl)
    {
        return lvl == level::fatal || lvl >= get_level();
    }

    namespace unsafe
    {
        void lock() { log_lock.lock(); }
        void unlock() { log_lock.unlock(); }

        void prints(level lvl, std::string_view text)
        {
            get_sink()(lvl, text);
        }
    } // namespace unsafe

    void prints(level lvl, std::string_view text)
    {
        const std::unique_lock _ { log_lock };
        unsafe::prints(lvl, text);
    }

    void vline(level lvl, fmt::string_view format, fmt::format_args args)
    {
        if (!enabled(lvl))
            return;

        fmt::memory_buffer buf;
        fmt::format_to(fmt::appender(buf), "[{}] ", magic_enum::enum_name(lvl));
        fmt::vformat_to(fmt::appender(buf), format, args);
        buf.push_back('\n');

        prints(lvl, { buf.data(), buf.size() });
    }

    void vprint(level lvl, fmt::string_view format, fmt::format_args args, bool newline)
    {
        if (!enabled(lvl))
            return;

        auto str = fmt::vformat(format, args);
        if (newline)
            str.push_back('\n');

        prints(lvl, str);
    }
} // namespace lib::log
