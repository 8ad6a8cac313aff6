// Copyright (C) 2026  hwinstr contributors

#include <lib/panic.hpp>
#include <arch/x86_64/instructions.hpp>

#include <cstdlib>

namespace lib
{
    [[noreturn]]
    void vpanic(fmt::string_view format, fmt::format_args args)
    {
        log::vline(log::level::fatal, format, args);

#if __STDC_HOSTED__
        std::abort();
#else
        x86_64::instructions::halt_forever();
#endif
    }
} // namespace lib
