// Copyright (C) 2026  hwinstr contributors

#include <system/cpu/features.hpp>
#include <arch/x86_64/instructions.hpp>

#include <cstring>

namespace cpu::features
{
    using namespace x86_64::instructions;

    std::uint32_t max_leaf()
    {
        return cpuid(0).eax;
    }

    std::string vendor()
    {
        const auto res = cpuid(0);

        char buf[12];
        std::memcpy(buf + 0, &res.ebx, 4);
        std::memcpy(buf + 4, &res.edx, 4);
        std::memcpy(buf + 8, &res.ecx, 4);
        return { buf, sizeof(buf) };
    }

    bool fsgsbase()
    {
        if (max_leaf() < 7)
            return false;
        return (cpuid(7, 0).ebx & (1u << 0)) != 0;
    }
} // namespace cpu::features
