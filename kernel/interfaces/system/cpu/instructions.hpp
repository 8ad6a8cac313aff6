// Copyright (C) 2026  hwinstr contributors

#pragma once

#include <string_view>

namespace cpu::instructions
{
    std::string_view backend_name();
    void report();
} // namespace cpu::instructions
