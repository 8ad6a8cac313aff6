// Copyright (C) 2026  hwinstr contributors

#pragma once

#include <arch/x86_64/instructions.hpp>

#include <concepts>
#include <cstddef>

namespace cpu
{
    using x86_64::instructions::halt_forever;

    // sleeps in hlt until pred() holds. any interrupt wakes the cpu, so the
    // condition is checked again after every wake up. interrupts must be
    // enabled or this never returns
    template<typename Pred> requires std::predicate<Pred &>
    void wait_until(Pred &&pred)
    {
        while (!pred())
            x86_64::instructions::halt();
    }

    // busy waits until pred() holds, returns the number of iterations
    template<typename Pred> requires std::predicate<Pred &>
    std::size_t spin_until(Pred &&pred)
    {
        std::size_t spins = 0;
        while (!pred())
        {
            x86_64::instructions::nop();
            spins++;
        }
        return spins;
    }
} // namespace cpu
