#include "aqua/EnergyTracker.hpp"

#include <gtest/gtest.h>

using namespace aqua;

TEST(EnergyTracker, SplitsGainsAndBurnsBySource)
{
    EnergyTracker t;
    t.recordEnergyDelta(1, "food", 12.0);
    t.recordEnergyDelta(2, "food", 3.0);
    t.recordEnergyDelta(1, "metabolism", -0.5);
    t.recordEnergyDelta(1, "noop", 0.0);

    const EnergyBreakdown &b = t.cumulative();
    ASSERT_EQ(b.gains.size(), 1u);
    EXPECT_DOUBLE_EQ(b.gains.at("food"), 15.0);
    EXPECT_DOUBLE_EQ(b.burns.at("metabolism"), 0.5);
    EXPECT_EQ(b.burns.count("noop"), 0u);
    EXPECT_DOUBLE_EQ(t.netFlow(), 14.5);
    EXPECT_EQ(t.recordCount(), 4u);
}

TEST(EnergyTracker, RecentWindowOnlyCoversRequestedTicks)
{
    EnergyTracker t;
    t.recordEnergyDelta(1, "food", 10.0);
    t.advanceTick();
    t.recordEnergyDelta(1, "food", 1.0);
    t.advanceTick();
    t.recordEnergyDelta(1, "food", 0.5);

    EXPECT_DOUBLE_EQ(t.recentBreakdown(0).totalGain(), 0.5);
    EXPECT_DOUBLE_EQ(t.recentBreakdown(1).totalGain(), 1.5);
    EXPECT_DOUBLE_EQ(t.recentBreakdown(100).totalGain(), 11.5);
    EXPECT_DOUBLE_EQ(t.cumulative().totalGain(), 11.5);
}

TEST(EnergyTracker, OldBucketsFallOutOfTheWindow)
{
    EnergyTracker t(2);
    for (int i = 0; i < 5; ++i)
    {
        t.recordEnergyDelta(1, "metabolism", -1.0);
        t.advanceTick();
    }

    EXPECT_DOUBLE_EQ(t.recentBreakdown(10).totalBurn(), 2.0);
    EXPECT_DOUBLE_EQ(t.cumulative().totalBurn(), 5.0);
}

TEST(EnergyTracker, ResetClearsEverything)
{
    EnergyTracker t;
    t.recordEnergyDelta(1, "food", 4.0);
    t.advanceTick();
    t.reset();

    EXPECT_EQ(t.recordCount(), 0u);
    EXPECT_DOUBLE_EQ(t.netFlow(), 0.0);
    EXPECT_TRUE(t.recentBreakdown(10).gains.empty());
}
