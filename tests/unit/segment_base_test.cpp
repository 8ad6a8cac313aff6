// Copyright (C) 2026  hwinstr contributors

#include <gtest/gtest.h>

#include <arch/x86_64/instructions.hpp>
#include <system/cpu/features.hpp>
#include <system/cpu/segment_base.hpp>

#include <cstdint>

namespace insn = x86_64::instructions;
namespace sb = cpu::segment_base;

namespace
{
    // canonical, page aligned, never dereferenced
    constexpr std::uint64_t test_base = 0x00007F0012345000;

    struct fake_enablement final : sb::enablement
    {
        bool enabled;
        std::size_t queries = 0;

        explicit fake_enablement(bool enabled) : enabled { enabled } { }

        bool fsgsbase_enabled() override
        {
            queries++;
            return enabled;
        }
    };

    class SegmentBaseTest : public ::testing::Test
    {
        protected:
        sb::hosted_enablement hosted;

        void SetUp() override
        {
            if (!cpu::features::fsgsbase())
                GTEST_SKIP() << "cpu does not implement fsgsbase";
            if (!hosted.fsgsbase_enabled())
                GTEST_SKIP() << "kernel did not set CR4.FSGSBASE";
        }
    };

    // =========================================================================
    // unsafe instructions
    // =========================================================================

    // nothing between the write and the restore may touch thread locals
    TEST_F(SegmentBaseTest, FsWriteThenReadReturnsValue)
    {
        const auto original = insn::unsafe::fs::read_base();
        insn::unsafe::fs::write_base(test_base);
        const auto seen = insn::unsafe::fs::read_base();
        insn::unsafe::fs::write_base(original);

        EXPECT_EQ(seen, test_base);
        EXPECT_EQ(insn::unsafe::fs::read_base(), original);
    }

    TEST_F(SegmentBaseTest, GsWriteThenReadReturnsValue)
    {
        const auto original = insn::unsafe::gs::read_base();
        insn::unsafe::gs::write_base(test_base);
        const auto seen = insn::unsafe::gs::read_base();
        insn::unsafe::gs::write_base(original);

        EXPECT_EQ(seen, test_base);
    }

    TEST_F(SegmentBaseTest, TaggedFormsMatchSegmentForms)
    {
        EXPECT_EQ(insn::unsafe::read_segment_base(insn::segment::fs), insn::unsafe::fs::read_base());

        const auto original = insn::unsafe::read_segment_base(insn::segment::gs);
        insn::unsafe::write_segment_base(insn::segment::gs, test_base + 0x1000);
        const auto seen = insn::unsafe::gs::read_base();
        insn::unsafe::write_segment_base(insn::segment::gs, original);

        EXPECT_EQ(seen, test_base + 0x1000);
    }

    TEST_F(SegmentBaseTest, FsBaseIsTheThreadPointer)
    {
        // x86_64 sysv tls: %fs:0 holds the thread pointer itself
        std::uint64_t self;
        asm volatile ("mov %%fs:0, %0" : "=r"(self));
        EXPECT_EQ(insn::unsafe::fs::read_base(), self);
    }

    // =========================================================================
    // checked wrapper
    // =========================================================================

    TEST_F(SegmentBaseTest, CheckedReadMatchesUnsafeRead)
    {
        const auto ret = sb::read(hosted, sb::segment::fs);
        ASSERT_TRUE(ret.has_value());
        EXPECT_EQ(ret.value(), insn::unsafe::fs::read_base());
    }

    TEST_F(SegmentBaseTest, CheckedWriteChangesTheBase)
    {
        const auto original = insn::unsafe::gs::read_base();
        const auto ret = sb::write(hosted, sb::segment::gs, test_base);
        const auto seen = insn::unsafe::gs::read_base();
        insn::unsafe::gs::write_base(original);

        ASSERT_TRUE(ret.has_value());
        EXPECT_EQ(seen, test_base);
    }

    TEST_F(SegmentBaseTest, DisabledSourceRefusesWithoutExecuting)
    {
        fake_enablement disabled { false };
        const auto original = insn::unsafe::gs::read_base();

        const auto wret = sb::write(disabled, sb::segment::gs, test_base);
        const auto seen = insn::unsafe::gs::read_base();
        insn::unsafe::gs::write_base(original);

        ASSERT_FALSE(wret.has_value());
        EXPECT_EQ(wret.error(), sb::error::disabled);
        EXPECT_EQ(seen, original);

        const auto rret = sb::read(disabled, sb::segment::fs);
        ASSERT_FALSE(rret.has_value());
        EXPECT_EQ(rret.error(), sb::error::disabled);
        EXPECT_EQ(disabled.queries, 2u);
    }

    TEST_F(SegmentBaseTest, EnabledSourceIsConsultedOnEveryCall)
    {
        fake_enablement enabled { true };
        EXPECT_TRUE(sb::usable(enabled).has_value());
        EXPECT_TRUE(sb::read(enabled, sb::segment::gs).has_value());
        EXPECT_EQ(enabled.queries, 2u);
    }

    // runs everywhere, supported cpu or not
    TEST(SegmentBaseErrorTest, UnsupportedCpuWinsOverEnablement)
    {
        fake_enablement enabled { true };
        const auto ret = sb::usable(enabled);
        if (cpu::features::fsgsbase())
        {
            EXPECT_TRUE(ret.has_value());
            EXPECT_EQ(enabled.queries, 1u);
        }
        else
        {
            ASSERT_FALSE(ret.has_value());
            EXPECT_EQ(ret.error(), sb::error::unsupported);
            EXPECT_EQ(enabled.queries, 0u);
        }
    }
} // namespace
