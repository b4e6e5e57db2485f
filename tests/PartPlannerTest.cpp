#include <gtest/gtest.h>

#include "core/PartPlanner.h"

#include <stdexcept>

namespace {

constexpr std::uint64_t MB = 1024 * 1024;

void expectValidPlan(std::uint64_t total, std::uint64_t partSize) {
    auto parts = PartPlanner(partSize).plan(total);

    const std::uint64_t expectedCount = (total + partSize - 1) / partSize;
    ASSERT_EQ(expectedCount, parts.size()) << "S=" << total << " P=" << partSize;

    std::uint64_t offset = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        EXPECT_EQ(i, parts[i].index);
        EXPECT_EQ(offset, parts[i].offset);
        EXPECT_GT(parts[i].length, 0u);
        EXPECT_EQ(PartState::Pending, parts[i].state);
        if (i + 1 < parts.size())
            EXPECT_EQ(partSize, parts[i].length);
        offset += parts[i].length;
    }
    EXPECT_EQ(total, offset);
}

TEST(PartPlanner, HundredMegabytesInThirtyMegabyteParts)
{
    auto parts = PartPlanner(30 * MB).plan(100 * MB);

    ASSERT_EQ(4u, parts.size());
    EXPECT_EQ(30 * MB, parts[0].length);
    EXPECT_EQ(30 * MB, parts[1].length);
    EXPECT_EQ(30 * MB, parts[2].length);
    EXPECT_EQ(10 * MB, parts[3].length);
    EXPECT_EQ(90 * MB, parts[3].offset);
}

TEST(PartPlanner, EmptyFileHasNoParts)
{
    EXPECT_TRUE(PartPlanner(30 * MB).plan(0).empty());
}

TEST(PartPlanner, EvenDivisionKeepsFullLastPart)
{
    auto parts = PartPlanner(25).plan(100);
    ASSERT_EQ(4u, parts.size());
    EXPECT_EQ(25u, parts.back().length);
}

TEST(PartPlanner, SmallerThanOnePart)
{
    auto parts = PartPlanner(30 * MB).plan(7);
    ASSERT_EQ(1u, parts.size());
    EXPECT_EQ(7u, parts[0].length);
}

TEST(PartPlanner, LayoutPropertiesHold)
{
    const std::uint64_t sizes[] = { 1, 2, 3, 10, 99, 100, 101, 4096, 65537, 1000003 };
    const std::uint64_t partSizes[] = { 1, 3, 7, 100, 4096, 1 << 20 };

    for (auto s : sizes) {
        for (auto p : partSizes)
            expectValidPlan(s, p);
    }
}

TEST(PartPlanner, PlanIsDeterministic)
{
    PartPlanner planner(4096);
    auto a = planner.plan(123457);
    auto b = planner.plan(123457);

    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].offset, b[i].offset);
        EXPECT_EQ(a[i].length, b[i].length);
    }
}

TEST(PartPlanner, ZeroPartSizeIsRejected)
{
    EXPECT_THROW(PartPlanner(0), std::invalid_argument);
}

} // namespace
