// Copyright (C) 2026  hwinstr contributors

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace x86_64::instructions
{
    enum class effect : std::uint8_t
    {
        suspend,
        none,
        register_read,
        register_write,
        debug_trap,
        feature_query
    };

    enum class safety : std::uint8_t
    {
        safe,
        caller_verified
    };

    // [prefix] [REX.W] opcode [modrm & modrm_mask == modrm_value]
    struct encoding
    {
        std::optional<std::uint8_t> prefix;
        bool rex_w;
        std::array<std::uint8_t, 2> opcode;
        std::size_t opcode_length;
        std::uint8_t modrm_mask;
        std::uint8_t modrm_value;

        constexpr bool has_modrm() const { return modrm_mask != 0; }
    };

    struct operation
    {
        std::string_view name;
        std::string_view mnemonic;
        std::size_t inputs;
        bool has_output;
        enum effect effect;
        enum safety safety;
        bool inline_only;
        struct encoding encoding;
    };

    inline constexpr std::array operations
    {
        operation {
            .name = "halt", .mnemonic = "hlt",
            .inputs = 0, .has_output = false,
            .effect = effect::suspend, .safety = safety::safe,
            .inline_only = false,
            .encoding = { std::nullopt, false, { 0xF4 }, 1, 0x00, 0x00 }
        },
        operation {
            .name = "nop", .mnemonic = "nop",
            .inputs = 0, .has_output = false,
            .effect = effect::none, .safety = safety::safe,
            .inline_only = false,
            .encoding = { std::nullopt, false, { 0x90 }, 1, 0x00, 0x00 }
        },
        operation {
            .name = "read_rip", .mnemonic = "lea",
            .inputs = 0, .has_output = true,
            .effect = effect::register_read, .safety = safety::safe,
            .inline_only = true,
            .encoding = { std::nullopt, true, { 0x8D }, 1, 0xC7, 0x05 }
        },
        operation {
            .name = "cpuid", .mnemonic = "cpuid",
            .inputs = 2, .has_output = true,
            .effect = effect::feature_query, .safety = safety::safe,
            .inline_only = false,
            .encoding = { std::nullopt, false, { 0x0F, 0xA2 }, 2, 0x00, 0x00 }
        },
        operation {
            .name = "bochs_breakpoint", .mnemonic = "xchg",
            .inputs = 0, .has_output = false,
            .effect = effect::debug_trap, .safety = safety::safe,
            .inline_only = true,
            .encoding = { 0x66, false, { 0x87 }, 1, 0xFF, 0xDB }
        },
        operation {
            .name = "read_fs_base", .mnemonic = "rdfsbase",
            .inputs = 0, .has_output = true,
            .effect = effect::register_read, .safety = safety::caller_verified,
            .inline_only = false,
            .encoding = { 0xF3, true, { 0x0F, 0xAE }, 2, 0xF8, 0xC0 }
        },
        operation {
            .name = "write_fs_base", .mnemonic = "wrfsbase",
            .inputs = 1, .has_output = false,
            .effect = effect::register_write, .safety = safety::caller_verified,
            .inline_only = false,
            .encoding = { 0xF3, true, { 0x0F, 0xAE }, 2, 0xF8, 0xD0 }
        },
        operation {
            .name = "read_gs_base", .mnemonic = "rdgsbase",
            .inputs = 0, .has_output = true,
            .effect = effect::register_read, .safety = safety::caller_verified,
            .inline_only = false,
            .encoding = { 0xF3, true, { 0x0F, 0xAE }, 2, 0xF8, 0xC8 }
        },
        operation {
            .name = "write_gs_base", .mnemonic = "wrgsbase",
            .inputs = 1, .has_output = false,
            .effect = effect::register_write, .safety = safety::caller_verified,
            .inline_only = false,
            .encoding = { 0xF3, true, { 0x0F, 0xAE }, 2, 0xF8, 0xD8 }
        }
    };

    constexpr std::optional<operation> find_operation(std::string_view name)
    {
        for (const auto &op : operations)
        {
            if (op.name == name)
                return op;
        }
        return std::nullopt;
    }

    // offset of the first byte of the instruction in code
    std::optional<std::size_t> find_encoding(const encoding &enc, std::span<const std::uint8_t> code);
} // namespace x86_64::instructions
