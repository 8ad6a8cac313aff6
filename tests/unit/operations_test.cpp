// Copyright (C) 2026  hwinstr contributors

#include <gtest/gtest.h>

#include <arch/x86_64/instructions/backend.hpp>
#include <arch/x86_64/instructions/operations.hpp>

#include <set>
#include <string_view>

namespace insn = x86_64::instructions;

namespace
{
    TEST(OperationsTest, NamesAreUnique)
    {
        std::set<std::string_view> names;
        for (const auto &op : insn::operations)
            EXPECT_TRUE(names.insert(op.name).second) << "duplicate " << op.name;
    }

    TEST(OperationsTest, FindOperationByName)
    {
        constexpr auto op = insn::find_operation("write_gs_base");
        static_assert(op.has_value());
        EXPECT_EQ(op->mnemonic, "wrgsbase");
        EXPECT_EQ(op->inputs, 1u);
        EXPECT_FALSE(op->has_output);

        EXPECT_FALSE(insn::find_operation("invlpg").has_value());
        EXPECT_FALSE(insn::find_operation("").has_value());
    }

    TEST(OperationsTest, OnlySegmentBaseAccessNeedsCallerVerification)
    {
        for (const auto &op : insn::operations)
        {
            const bool segment_base = op.mnemonic.ends_with("sbase");
            const bool verified = op.safety == insn::safety::caller_verified;
            EXPECT_EQ(segment_base, verified) << op.name;
        }
    }

    TEST(OperationsTest, InlineOnlyOperationsAreTheCallSiteDependentOnes)
    {
        for (const auto &op : insn::operations)
        {
            const bool call_site = op.name == "read_rip" || op.name == "bochs_breakpoint";
            EXPECT_EQ(op.inline_only, call_site) << op.name;
        }

        static_assert(!insn::backend::inline_only_backend<insn::backend::stub>);
    }

    TEST(OperationsTest, InputsAndOutputsFitInOneRegister)
    {
        for (const auto &op : insn::operations)
        {
            if (op.effect == insn::effect::feature_query)
                continue;
            EXPECT_LE(op.inputs, 1u) << op.name;
            EXPECT_FALSE(op.inputs == 1 && op.has_output) << op.name;
        }
    }

    TEST(OperationsTest, HaltIsTheOnlySuspendingOperation)
    {
        std::size_t count = 0;
        for (const auto &op : insn::operations)
        {
            if (op.effect == insn::effect::suspend)
            {
                EXPECT_EQ(op.name, "halt");
                count++;
            }
        }
        EXPECT_EQ(count, 1u);
    }
} // namespace
