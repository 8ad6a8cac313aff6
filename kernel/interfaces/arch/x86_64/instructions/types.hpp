// Copyright (C) 2026  hwinstr contributors

#pragma once

#include <cstdint>

namespace x86_64::instructions
{
    enum class segment : std::uint8_t
    {
        fs,
        gs
    };

    struct cpuid_result
    {
        std::uint32_t eax;
        std::uint32_t ebx;
        std::uint32_t ecx;
        std::uint32_t edx;
    };
} // namespace x86_64::instructions
