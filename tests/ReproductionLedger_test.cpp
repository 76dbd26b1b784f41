#include "aqua/ReproductionLedger.hpp"

#include <gtest/gtest.h>

using namespace aqua;

TEST(ReproductionLedgerTest, BankRespectsCap)
{
    ReproductionConfig cfg;
    ReproductionLedger r(cfg);

    EXPECT_DOUBLE_EQ(r.bankOverflow(140.0, 150.0), 140.0);
    EXPECT_DOUBLE_EQ(r.bankOverflow(30.0, 150.0), 10.0);
    EXPECT_DOUBLE_EQ(r.overflowBank(), 150.0);
    EXPECT_DOUBLE_EQ(r.bankOverflow(5.0, 150.0), 0.0);
    EXPECT_DOUBLE_EQ(r.bankOverflow(-5.0, 150.0), 0.0);
}

TEST(ReproductionLedgerTest, ConsumeBankWithdrawsAtMostBalance)
{
    ReproductionConfig cfg;
    ReproductionLedger r(cfg);
    r.bankOverflow(50.0, 450.0);

    EXPECT_DOUBLE_EQ(r.consumeBank(0.0), 0.0);
    EXPECT_DOUBLE_EQ(r.consumeBank(20.0), 20.0);
    EXPECT_DOUBLE_EQ(r.consumeBank(100.0), 30.0);
    EXPECT_DOUBLE_EQ(r.overflowBank(), 0.0);
}

TEST(ReproductionLedgerTest, AsexualBoundary)
{
    ReproductionConfig cfg;
    ReproductionLedger r(cfg);

    EXPECT_TRUE(r.canAsexuallyReproduce(LifeStage::Adult, 95.0, 100.0));
    EXPECT_FALSE(r.canAsexuallyReproduce(LifeStage::Adult, 94.9, 100.0));
    EXPECT_TRUE(r.canReproduce(LifeStage::Adult, 94.9, 100.0));
    EXPECT_TRUE(r.canReproduce(LifeStage::Adult, 90.0, 100.0));
    EXPECT_FALSE(r.canReproduce(LifeStage::Adult, 89.9, 100.0));
}

TEST(ReproductionLedgerTest, OnlyAdultsOffCooldownReproduce)
{
    ReproductionConfig cfg;
    ReproductionLedger r(cfg);

    EXPECT_FALSE(r.canReproduce(LifeStage::Juvenile, 100.0, 100.0));
    EXPECT_FALSE(r.canReproduce(LifeStage::Elder, 100.0, 100.0));

    r.setCooldownAtLeast(2);
    EXPECT_FALSE(r.canReproduce(LifeStage::Adult, 100.0, 100.0));
    r.tickCooldown();
    r.tickCooldown();
    r.tickCooldown();
    EXPECT_EQ(r.cooldown(), 0);
    EXPECT_TRUE(r.canReproduce(LifeStage::Adult, 100.0, 100.0));
}

TEST(ReproductionLedgerTest, TriggerAsexualStartsCooldown)
{
    ReproductionConfig cfg;
    ReproductionLedger r(cfg);
    TraitGenetics      genetics;
    Rng                rng(7);

    Genome parent;
    parent.species = "guppy";

    const AsexualOffspring off = r.triggerAsexual(parent, genetics, rng);
    EXPECT_EQ(r.cooldown(), 300);
    EXPECT_EQ(off.genome.species, "guppy");
    EXPECT_DOUBLE_EQ(off.energyTransferFraction, 0.30);
    EXPECT_EQ(r.stateLabel(), "Cooldown (300 ticks)");

    r.setCooldownAtLeast(100);
    EXPECT_EQ(r.cooldown(), 300);
}

TEST(ReproductionLedgerTest, Credits)
{
    ReproductionConfig cfg;
    ReproductionLedger r(cfg);

    EXPECT_EQ(r.stateLabel(), "Ready to reproduce");
    EXPECT_DOUBLE_EQ(r.addReproCredits(-1.0), 0.0);
    EXPECT_DOUBLE_EQ(r.addReproCredits(3.0), 3.0);
    EXPECT_TRUE(r.hasReproCredits(3.0));
    EXPECT_FALSE(r.hasReproCredits(3.5));
    EXPECT_DOUBLE_EQ(r.consumeReproCredits(2.0), 2.0);
    EXPECT_DOUBLE_EQ(r.consumeReproCredits(2.0), 1.0);
    EXPECT_DOUBLE_EQ(r.reproCredits(), 0.0);
}
