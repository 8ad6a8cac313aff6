// Copyright (C) 2026  hwinstr contributors

#include <arch/x86_64/instructions/operations.hpp>

namespace x86_64::instructions
{
    namespace
    {
        bool is_rex_w(std::uint8_t byte)
        {
            return (byte & 0xF8) == 0x48;
        }

        // length of the match at code[0], 0 if there is none
        std::size_t match(const encoding &enc, std::span<const std::uint8_t> code)
        {
            std::size_t idx = 0;
            const auto next = [&](std::uint8_t &out)
            {
                if (idx >= code.size())
                    return false;
                out = code[idx++];
                return true;
            };

            std::uint8_t byte;
            if (enc.prefix.has_value())
            {
                if (!next(byte) || byte != enc.prefix.value())
                    return 0;
            }

            if (enc.rex_w)
            {
                if (!next(byte) || !is_rex_w(byte))
                    return 0;
            }

            for (std::size_t i = 0; i < enc.opcode_length; i++)
            {
                if (!next(byte) || byte != enc.opcode[i])
                    return 0;
            }

            if (enc.has_modrm())
            {
                if (!next(byte) || (byte & enc.modrm_mask) != enc.modrm_value)
                    return 0;
            }
            return idx;
        }
    } // namespace

    std::optional<std::size_t> find_encoding(const encoding &enc, std::span<const std::uint8_t> code)
    {
        for (std::size_t offset = 0; offset < code.size(); offset++)
        {
            if (match(enc, code.subspan(offset)) != 0)
                return offset;
        }
        return std::nullopt;
    }
} // namespace x86_64::instructions
