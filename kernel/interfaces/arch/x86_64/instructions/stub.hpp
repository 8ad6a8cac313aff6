// Copyright (C) 2026  hwinstr contributors

#pragma once

#include <arch/x86_64/instructions/types.hpp>
#include <cstdint>

// kernel/source/arch/x86_64/instructions/stubs.S
extern "C"
{
    void x86_64_asm_hlt();
    void x86_64_asm_nop();

    std::uint64_t x86_64_asm_rdfsbase();
    void x86_64_asm_wrfsbase(std::uint64_t val);
    std::uint64_t x86_64_asm_rdgsbase();
    void x86_64_asm_wrgsbase(std::uint64_t val);

    void x86_64_asm_cpuid(std::uint32_t leaf, std::uint32_t subleaf, x86_64::instructions::cpuid_result *out);
} // extern "C"

namespace x86_64::instructions::backend
{
    // a call into a separately assembled object is opaque to the optimizer, so
    // it can not be removed and memory accesses are not moved across it.
    // no read_rip or bochs_breakpoint here, both only mean something when
    // emitted at the call site
    struct stub
    {
        static inline void hlt() { x86_64_asm_hlt(); }
        static inline void nop() { x86_64_asm_nop(); }

        static inline std::uint64_t rdfsbase() { return x86_64_asm_rdfsbase(); }
        static inline void wrfsbase(std::uint64_t val) { x86_64_asm_wrfsbase(val); }
        static inline std::uint64_t rdgsbase() { return x86_64_asm_rdgsbase(); }
        static inline void wrgsbase(std::uint64_t val) { x86_64_asm_wrgsbase(val); }

        static inline cpuid_result cpuid(std::uint32_t leaf, std::uint32_t subleaf)
        {
            cpuid_result ret;
            x86_64_asm_cpuid(leaf, subleaf, &ret);
            return ret;
        }
    };
} // namespace x86_64::instructions::backend
