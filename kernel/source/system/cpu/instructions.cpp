// Copyright (C) 2026  hwinstr contributors

#include <system/cpu/instructions.hpp>
#include <system/cpu/features.hpp>
#include <arch/x86_64/instructions/backend.hpp>
#include <arch/x86_64/instructions/operations.hpp>
#include <lib/log.hpp>

#include <magic_enum/magic_enum.hpp>

namespace cpu::instructions
{
    namespace insn = x86_64::instructions;

    std::string_view backend_name()
    {
        return magic_enum::enum_name(insn::backend::selected);
    }

    void report()
    {
        lib::info("cpu: instruction backend: {}", backend_name());
        lib::info("cpu: vendor: {}", features::vendor());

        for (const auto &op : insn::operations)
        {
            if (op.inline_only && insn::backend::selected != insn::backend::kind::emit)
            {
                lib::debug("cpu: {} not available with the {} backend", op.name, backend_name());
                continue;
            }
            lib::debug("cpu: {} -> {} ({}, {})",
                op.name, op.mnemonic,
                magic_enum::enum_name(op.effect),
                magic_enum::enum_name(op.safety)
            );
        }

        if (features::fsgsbase())
            lib::info("cpu: fsgsbase supported, CR4.FSGSBASE must be set before use");
        else
            lib::warn("cpu: fsgsbase not supported, segment base instructions will fault");
    }
} // namespace cpu::instructions
