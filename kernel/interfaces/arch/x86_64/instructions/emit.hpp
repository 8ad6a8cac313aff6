// Copyright (C) 2026  hwinstr contributors

#pragma once

#if !defined(__GNUC__) || !defined(__x86_64__)
#  error "inline emission needs a GNU-compatible x86_64 compiler, configure with HWINSTR_INLINE_ASM=OFF"
#endif

#include <arch/x86_64/instructions/types.hpp>
#include <cstdint>

namespace x86_64::instructions::backend
{
    // every statement is asm volatile with a memory clobber: the compiler may
    // neither drop it nor move memory accesses across it
    struct emit
    {
        [[gnu::always_inline]]
        static inline void hlt()
        {
            asm volatile ("hlt" ::: "memory");
        }

        [[gnu::always_inline]]
        static inline void nop()
        {
            asm volatile ("nop" ::: "memory");
        }

        [[gnu::always_inline]]
        static inline std::uint64_t read_rip()
        {
            std::uint64_t rip;
            asm volatile ("lea (%%rip), %0" : "=r"(rip) :: "memory");
            return rip;
        }

        [[gnu::always_inline]]
        static inline std::uint64_t rdfsbase()
        {
            std::uint64_t val;
            asm volatile ("rdfsbase %0" : "=r"(val) :: "memory");
            return val;
        }

        [[gnu::always_inline]]
        static inline void wrfsbase(std::uint64_t val)
        {
            asm volatile ("wrfsbase %0" :: "r"(val) : "memory");
        }

        [[gnu::always_inline]]
        static inline std::uint64_t rdgsbase()
        {
            std::uint64_t val;
            asm volatile ("rdgsbase %0" : "=r"(val) :: "memory");
            return val;
        }

        [[gnu::always_inline]]
        static inline void wrgsbase(std::uint64_t val)
        {
            asm volatile ("wrgsbase %0" :: "r"(val) : "memory");
        }

        [[gnu::always_inline]]
        static inline cpuid_result cpuid(std::uint32_t leaf, std::uint32_t subleaf)
        {
            cpuid_result ret;
            asm volatile (
                "cpuid"
                : "=a"(ret.eax), "=b"(ret.ebx), "=c"(ret.ecx), "=d"(ret.edx)
                : "a"(leaf), "c"(subleaf)
                : "memory"
            );
            return ret;
        }

        // https://wiki.osdev.org/Bochs#Magic_Breakpoint
        // needs magic_break: enabled=1 in .bochsrc
        [[gnu::always_inline]]
        static inline void bochs_breakpoint()
        {
            asm volatile ("xchgw %%bx, %%bx" ::: "memory");
        }
    };
} // namespace x86_64::instructions::backend
