// Copyright (C) 2026  hwinstr contributors

#pragma once

#include <cstdint>
#include <string>

namespace cpu::features
{
    std::uint32_t max_leaf();
    std::string vendor();

    // CPUID.(EAX=07H, ECX=0):EBX[0]. only says the processor implements
    // rd/wr{fs,gs}base, not that CR4.FSGSBASE is set
    bool fsgsbase();
} // namespace cpu::features
