// Copyright (C) 2026  hwinstr contributors

#include <system/cpu/segment_base.hpp>
#include <system/cpu/features.hpp>
#include <arch/x86_64/instructions.hpp>
#include <lib/log.hpp>

#include <magic_enum/magic_enum.hpp>

#if defined(__linux__) && __STDC_HOSTED__
#  include <sys/auxv.h>
#  ifndef HWCAP2_FSGSBASE
#    define HWCAP2_FSGSBASE (1 << 1)
#  endif
#endif

namespace cpu::segment_base
{
    namespace
    {
        bool cpu_supported()
        {
            static const bool cached = [] { return features::fsgsbase(); } ();
            return cached;
        }
    } // namespace

#if defined(__linux__) && __STDC_HOSTED__
    bool hosted_enablement::fsgsbase_enabled()
    {
        return (getauxval(AT_HWCAP2) & HWCAP2_FSGSBASE) != 0;
    }
#endif

    std::expected<void, error> usable(enablement &source)
    {
        if (!cpu_supported())
            return std::unexpected { error::unsupported };
        if (!source.fsgsbase_enabled())
            return std::unexpected { error::disabled };
        return { };
    }

    std::expected<std::uint64_t, error> read(enablement &source, segment seg)
    {
        if (const auto ret = usable(source); !ret)
        {
            lib::debug("segment-base: not reading {} base: {}",
                magic_enum::enum_name(seg), magic_enum::enum_name(ret.error()));
            return std::unexpected { ret.error() };
        }
        return x86_64::instructions::unsafe::read_segment_base(seg);
    }

    std::expected<void, error> write(enablement &source, segment seg, std::uint64_t val)
    {
        if (const auto ret = usable(source); !ret)
        {
            lib::debug("segment-base: not writing {} base: {}",
                magic_enum::enum_name(seg), magic_enum::enum_name(ret.error()));
            return ret;
        }
        x86_64::instructions::unsafe::write_segment_base(seg, val);
        return { };
    }
} // namespace cpu::segment_base
