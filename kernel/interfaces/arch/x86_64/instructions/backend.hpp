// Copyright (C) 2026  hwinstr contributors

#pragma once

// checked before anything else is included, so that a toolchain without
// inline emission stops on these errors first
#if !defined(HWINSTR_INLINE_ASM)
#  error "HWINSTR_INLINE_ASM is not defined, the build selects the instruction backend"
#endif

#if HWINSTR_INLINE_ASM
#  include <arch/x86_64/instructions/emit.hpp>
#endif
#include <arch/x86_64/instructions/stub.hpp>
#include <arch/x86_64/instructions/types.hpp>

#include <concepts>
#include <cstdint>

namespace x86_64::instructions::backend
{
    template<typename Type>
    concept instruction_backend = requires (std::uint64_t val, std::uint32_t leaf)
    {
        { Type::hlt() } -> std::same_as<void>;
        { Type::nop() } -> std::same_as<void>;

        { Type::rdfsbase() } -> std::same_as<std::uint64_t>;
        { Type::wrfsbase(val) } -> std::same_as<void>;
        { Type::rdgsbase() } -> std::same_as<std::uint64_t>;
        { Type::wrgsbase(val) } -> std::same_as<void>;

        { Type::cpuid(leaf, leaf) } -> std::same_as<cpuid_result>;
    };

    // operations whose meaning depends on the call site
    template<typename Type>
    concept inline_only_backend = instruction_backend<Type> && requires
    {
        { Type::read_rip() } -> std::same_as<std::uint64_t>;
        { Type::bochs_breakpoint() } -> std::same_as<void>;
    };

    enum class kind : std::uint8_t
    {
        emit,
        stub
    };

    static_assert(instruction_backend<stub>);
    static_assert(!inline_only_backend<stub>);

#if HWINSTR_INLINE_ASM
    static_assert(inline_only_backend<emit>);

    using active = emit;
    inline constexpr kind selected = kind::emit;
#else
    using active = stub;
    inline constexpr kind selected = kind::stub;
#endif
} // namespace x86_64::instructions::backend
