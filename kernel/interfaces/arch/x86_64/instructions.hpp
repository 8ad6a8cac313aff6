// Copyright (C) 2026  hwinstr contributors

#pragma once

#include <arch/x86_64/instructions/backend.hpp>
#include <arch/x86_64/instructions/types.hpp>

#include <cstdint>
#include <utility>

// Special x86_64 instructions. Each function executes exactly one instruction
// through the backend chosen at build time (see backend.hpp).
namespace x86_64::instructions
{
    // Halts the processor until the next interrupt arrives. Any interrupt
    // resumes execution, so wait loops must re-check their condition.
    [[gnu::always_inline]]
    inline void halt()
    {
        backend::active::hlt();
    }

    [[noreturn, gnu::always_inline]]
    inline void halt_forever()
    {
        while (true)
            halt();
    }

    // Executes nop. Use it in otherwise empty loops so that the optimizer can
    // not assume the loop has no side effects and remove it.
    [[gnu::always_inline]]
    inline void nop()
    {
        backend::active::nop();
    }

    [[gnu::always_inline]]
    inline cpuid_result cpuid(std::uint32_t leaf, std::uint32_t subleaf = 0)
    {
        return backend::active::cpuid(leaf, subleaf);
    }

#if HWINSTR_INLINE_ASM
    // Approximate address of the current instruction. Stale by the few
    // instructions the read itself takes; never use it for exact control flow.
    // lea (%rip) only reports the caller's position when emitted at the call
    // site, so there is no out of line form.
    [[gnu::always_inline]]
    inline std::uint64_t read_rip()
    {
        return backend::active::read_rip();
    }

    // Magic breakpoint for the Bochs emulator, a plain xchg on real hardware.
    [[gnu::always_inline]]
    inline void bochs_breakpoint()
    {
        backend::active::bochs_breakpoint();
    }
#endif

    // Callers of anything in here must make sure CR4.FSGSBASE is set,
    // otherwise the instruction raises #UD. Nothing is checked.
    namespace unsafe
    {
        namespace fs
        {
            [[gnu::always_inline]]
            inline std::uint64_t read_base()
            {
                return backend::active::rdfsbase();
            }

            // The FS base is usually the thread local storage pointer, the
            // caller must make sure nothing still relies on the old value.
            [[gnu::always_inline]]
            inline void write_base(std::uint64_t val)
            {
                backend::active::wrfsbase(val);
            }
        } // namespace fs

        namespace gs
        {
            [[gnu::always_inline]]
            inline std::uint64_t read_base()
            {
                return backend::active::rdgsbase();
            }

            // The GS base might be in use (per-cpu data, swapgs), same caveat
            // as fs::write_base.
            [[gnu::always_inline]]
            inline void write_base(std::uint64_t val)
            {
                backend::active::wrgsbase(val);
            }
        } // namespace gs

        [[gnu::always_inline]]
        inline std::uint64_t read_segment_base(segment seg)
        {
            switch (seg)
            {
                case segment::fs:
                    return fs::read_base();
                case segment::gs:
                    return gs::read_base();
            }
            std::unreachable();
        }

        [[gnu::always_inline]]
        inline void write_segment_base(segment seg, std::uint64_t val)
        {
            switch (seg)
            {
                case segment::fs:
                    fs::write_base(val);
                    return;
                case segment::gs:
                    gs::write_base(val);
                    return;
            }
            std::unreachable();
        }
    } // namespace unsafe
} // namespace x86_64::instructions
