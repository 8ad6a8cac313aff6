// Copyright (C) 2026  hwinstr contributors

#pragma once

#include <arch/x86_64/instructions/types.hpp>

#include <cstdint>
#include <expected>

// checked access to the FS/GS base registers on top of the unsafe
// instructions. whether CR4.FSGSBASE is set comes from an enablement source
// supplied by the caller
namespace cpu::segment_base
{
    using x86_64::instructions::segment;

    enum class error : std::uint8_t
    {
        unsupported, // cpu does not implement the instructions
        disabled     // CR4.FSGSBASE is clear
    };

    struct enablement
    {
        virtual ~enablement() = default;
        virtual bool fsgsbase_enabled() = 0;
    };

#if defined(__linux__) && __STDC_HOSTED__
    // linux reports HWCAP2_FSGSBASE in the aux vector only after setting
    // CR4.FSGSBASE on every cpu
    struct hosted_enablement final : enablement
    {
        bool fsgsbase_enabled() override;
    };
#endif

    std::expected<void, error> usable(enablement &source);

    std::expected<std::uint64_t, error> read(enablement &source, segment seg);
    std::expected<void, error> write(enablement &source, segment seg, std::uint64_t val);
} // namespace cpu::segment_base
