#include "aqua/Reproduction.hpp"

#include <gtest/gtest.h>
#include <memory>

#include "TestWorld.hpp"

using namespace aqua;
using namespace aqua::test;

namespace
{
    struct ReproductionFixture : ::testing::Test
    {
        TankConfig    cfg;
        FakeWorld     world;
        Rng           rng{99};
        TraitGenetics genetics;

        std::unique_ptr<EnergyRouter>             router;
        std::unique_ptr<ReproductionOrchestrator> orch;

        // Call after adjusting cfg.
        ReproductionOrchestrator &orchestrator()
        {
            if (!orch)
            {
                router = std::make_unique<EnergyRouter>(cfg.energy, world, world, rng);
                orch   = std::make_unique<ReproductionOrchestrator>(cfg, world, world, *router, genetics, rng);
            }
            return *orch;
        }

        Genome neverAsexual(const std::string &species = "tetra")
        {
            Genome g;
            g.species       = species;
            g.asexualChance = 0.f;
            return g;
        }

        Genome alwaysAsexual()
        {
            Genome g;
            g.asexualChance = 1.f;
            return g;
        }

        // No emergency spawns unless the test asks for them.
        void quietEmergencies()
        {
            cfg.ecosystem.criticalPopulation = 0;
            cfg.ecosystem.emergencySpawnScale = 0.f;
        }
    };
} // namespace

TEST_F(ReproductionFixture, ExtinctionSpawnsExactlyOneAgent)
{
    auto &o = orchestrator();

    const ReproductionTickStats stats = o.update(1, {});
    EXPECT_EQ(stats.emergencySpawns, 1);
    EXPECT_EQ(stats.total(), 1);
    ASSERT_EQ(world.spawns.size(), 1u);
    EXPECT_EQ(world.spawns[0].second, SpawnReason::Emergency);
    EXPECT_TRUE(world.spawns[0].first->lifecycle()->isBaby());
    ASSERT_TRUE(o.debugInfo().lastEmergencyTick);
    EXPECT_EQ(*o.debugInfo().lastEmergencyTick, 1u);
}

TEST_F(ReproductionFixture, ExtinctionIgnoresEmergencyCooldown)
{
    auto &o = orchestrator();
    o.update(1, {});
    world.spawns.clear();

    const ReproductionTickStats stats = o.update(2, {});
    EXPECT_EQ(stats.emergencySpawns, 1);
    EXPECT_EQ(world.spawns.size(), 1u);
}

TEST_F(ReproductionFixture, EmergencySpawnLandsInsideMargin)
{
    auto &o = orchestrator();
    for (uint64_t t = 1; t <= 20; ++t)
        o.update(t, {});

    const auto margin = static_cast<float>(cfg.ecosystem.spawnMargin);
    for (const auto &[a, reason] : world.spawns)
    {
        EXPECT_GE(a->position().x, world.world.min.x + margin);
        EXPECT_LE(a->position().x, world.world.max.x - margin);
        EXPECT_GE(a->position().y, world.world.min.y + margin);
        EXPECT_LE(a->position().y, world.world.max.y - margin);
    }
}

TEST_F(ReproductionFixture, ExtinctionClonesTheLastHealthyTemplate)
{
    auto &o = orchestrator();

    Agent &weak   = world.add(makeAdult(1, cfg, 100.0, 20.0, {100.f, 100.f}, neverAsexual("tetra")));
    Agent &strong = world.add(makeAdult(2, cfg, 100.0, 80.0, {200.f, 100.f}, neverAsexual("guppy")));
    o.update(1, {&weak, &strong});
    ASSERT_TRUE(o.emergencyTemplate());
    EXPECT_EQ(o.emergencyTemplate()->species, "guppy");

    world.agents.clear();
    world.spawns.clear();
    o.update(2, {});
    ASSERT_EQ(world.spawns.size(), 1u);
    EXPECT_EQ(world.spawns[0].first->species(), "guppy");
}

TEST_F(ReproductionFixture, BelowCriticalAlwaysSpawnsAfterCooldown)
{
    auto  &o   = orchestrator();
    Agent &kid = world.add(Agent::makeFish(1, cfg, neverAsexual(), {300.f, 300.f}));

    EXPECT_EQ(o.update(1, {&kid}).emergencySpawns, 1);
    EXPECT_EQ(o.update(2, {&kid}).emergencySpawns, 0);
    EXPECT_EQ(o.update(90, {&kid}).emergencySpawns, 0);
    EXPECT_EQ(o.update(91, {&kid}).emergencySpawns, 1);
}

TEST_F(ReproductionFixture, BankedEnergyFundsBaby)
{
    quietEmergencies();
    auto  &o      = orchestrator();
    Agent &parent = world.add(makeAdult(1, cfg, 150.0, 100.0, {100.f, 100.f}, neverAsexual()));
    parent.reproduction()->bankOverflow(100.0, 450.0);

    const ReproductionTickStats stats = o.update(1, {&parent});
    EXPECT_EQ(stats.bankedAsexual, 1);
    ASSERT_EQ(world.spawnsOf(SpawnReason::BankedAsexual), 1u);

    const Agent &baby = *world.spawns[0].first;
    EXPECT_DOUBLE_EQ(parent.reproduction()->overflowBank(), 100.0 - baby.energy()->current());
    EXPECT_LE(baby.energy()->current(), baby.energy()->max());
    EXPECT_DOUBLE_EQ(baby.energy()->current(), babyCapacity(cfg, baby.genome()));
    ASSERT_TRUE(baby.parentId());
    EXPECT_EQ(*baby.parentId(), parent.id());
    EXPECT_EQ(baby.generation(), parent.generation() + 1);
    EXPECT_EQ(parent.reproduction()->cooldown(), cfg.reproduction.cooldownTicks);
    EXPECT_DOUBLE_EQ(parent.energy()->current(), 100.0);
}

TEST_F(ReproductionFixture, SmallBankIsNotEnough)
{
    quietEmergencies();
    auto  &o      = orchestrator();
    Agent &parent = world.add(makeAdult(1, cfg, 150.0, 100.0, {100.f, 100.f}, neverAsexual()));
    parent.reproduction()->bankOverflow(74.0, 450.0);

    EXPECT_EQ(o.update(1, {&parent}).total(), 0);
    EXPECT_DOUBLE_EQ(parent.reproduction()->overflowBank(), 74.0);
}

TEST_F(ReproductionFixture, RejectedBankedSpawnIsRefunded)
{
    quietEmergencies();
    world.rejectSpawns = true;
    auto  &o           = orchestrator();
    Agent &parent      = world.add(makeAdult(1, cfg, 150.0, 100.0, {100.f, 100.f}, neverAsexual()));
    parent.reproduction()->bankOverflow(100.0, 450.0);

    EXPECT_EQ(o.update(1, {&parent}).bankedAsexual, 0);
    EXPECT_DOUBLE_EQ(parent.reproduction()->overflowBank(), 100.0);
    EXPECT_EQ(parent.reproduction()->cooldown(), 0);
    EXPECT_GE(o.debugInfo().rejectedSpawns, 1u);
}

TEST_F(ReproductionFixture, ThrowingSpawnIsRefunded)
{
    quietEmergencies();
    world.throwOnSpawn = true;
    auto  &o           = orchestrator();
    Agent &parent      = world.add(makeAdult(1, cfg, 100.0, 96.0, {100.f, 100.f}, alwaysAsexual()));

    EXPECT_NO_THROW(o.update(1, {&parent}));
    EXPECT_NEAR(parent.energy()->current(), 96.0, 1e-9);
    EXPECT_TRUE(world.spawns.empty());
}

TEST_F(ReproductionFixture, TraitAsexualIsSelfFunded)
{
    quietEmergencies();
    auto  &o      = orchestrator();
    Agent &parent = world.add(makeAdult(1, cfg, 100.0, 96.0, {100.f, 100.f}, alwaysAsexual()));

    const ReproductionTickStats stats = o.update(1, {&parent});
    EXPECT_EQ(stats.traitAsexual, 1);
    ASSERT_EQ(world.spawnsOf(SpawnReason::TraitAsexual), 1u);

    const Agent &baby = *world.spawns[0].first;
    EXPECT_NEAR(parent.energy()->current() + baby.energy()->current(), 96.0, 1e-9);
    EXPECT_LE(baby.energy()->current(), babyCapacity(cfg, baby.genome()) + 1e-9);
    EXPECT_EQ(parent.reproduction()->cooldown(), cfg.reproduction.cooldownTicks);
}

TEST_F(ReproductionFixture, TraitAsexualNeedsNinetyFivePercent)
{
    quietEmergencies();
    auto  &o      = orchestrator();
    Agent &parent = world.add(makeAdult(1, cfg, 100.0, 94.9, {100.f, 100.f}, alwaysAsexual()));

    EXPECT_EQ(o.update(1, {&parent}).traitAsexual, 0);
    EXPECT_DOUBLE_EQ(parent.energy()->current(), 94.9);
}

TEST_F(ReproductionFixture, RejectedTraitSpawnRefundsParent)
{
    quietEmergencies();
    world.rejectSpawns = true;
    auto  &o           = orchestrator();
    Agent &parent      = world.add(makeAdult(1, cfg, 100.0, 96.0, {100.f, 100.f}, alwaysAsexual()));

    EXPECT_EQ(o.update(1, {&parent}).traitAsexual, 0);
    EXPECT_NEAR(parent.energy()->current(), 96.0, 1e-9);
}

TEST_F(ReproductionFixture, PopulationCapIsRespected)
{
    cfg.ecosystem.maxPopulation      = 3;
    cfg.ecosystem.criticalPopulation = 1;
    auto &o                          = orchestrator();

    std::vector<Agent *> snapshot;
    for (AgentId id = 1; id <= 2; ++id)
    {
        Agent &a = world.add(makeAdult(id, cfg, 150.0, 100.0, {100.f * static_cast<float>(id), 100.f},
                                       alwaysAsexual()));
        a.reproduction()->bankOverflow(200.0, 450.0);
        snapshot.push_back(&a);
    }

    for (uint64_t t = 1; t <= 400; ++t)
    {
        o.update(t, snapshot);
        EXPECT_LE(world.population(), 3u);
    }
    EXPECT_EQ(world.spawns.size(), 1u);
}

TEST_F(ReproductionFixture, FullTankGetsNoSpawns)
{
    cfg.ecosystem.maxPopulation      = 2;
    cfg.ecosystem.criticalPopulation = 1;
    auto &o                          = orchestrator();

    Agent &a = world.add(makeAdult(1, cfg, 100.0, 99.0, {100.f, 100.f}, alwaysAsexual()));
    Agent &b = world.add(makeAdult(2, cfg, 100.0, 99.0, {120.f, 100.f}, alwaysAsexual()));
    a.reproduction()->bankOverflow(200.0, 300.0);

    EXPECT_EQ(o.update(1, {&a, &b}).total(), 0);
    EXPECT_TRUE(world.spawns.empty());

    InteractionOutcome outcome{{1, 2}, 1, false};
    EXPECT_FALSE(o.handleInteractionOutcome(outcome));
    EXPECT_FALSE(o.handleSoloWin(1));
}

TEST_F(ReproductionFixture, CreditsGateReproduction)
{
    quietEmergencies();
    cfg.reproduction.reproCreditRequired = 2.0;
    auto  &o                             = orchestrator();
    Agent &parent = world.add(makeAdult(1, cfg, 150.0, 100.0, {100.f, 100.f}, neverAsexual()));
    parent.reproduction()->bankOverflow(100.0, 450.0);

    EXPECT_EQ(o.update(1, {&parent}).total(), 0);

    parent.reproduction()->addReproCredits(3.0);
    EXPECT_EQ(o.update(2, {&parent}).bankedAsexual, 1);
    EXPECT_DOUBLE_EQ(parent.reproduction()->reproCredits(), 1.0);
}

TEST_F(ReproductionFixture, InteractionWinnerBreedsWithNearbyMate)
{
    quietEmergencies();
    auto  &o      = orchestrator();
    Agent &winner = world.add(makeAdult(1, cfg, 100.0, 80.0, {100.f, 100.f}, neverAsexual()));
    Agent &mate   = world.add(makeAdult(2, cfg, 100.0, 90.0, {150.f, 100.f}, neverAsexual()));
    mate.setLineage(4, std::nullopt);

    const auto baby = o.handleInteractionOutcome({{1, 2}, 1, false});
    ASSERT_TRUE(baby);
    ASSERT_EQ(world.spawnsOf(SpawnReason::Sexual), 1u);

    const Agent &b = *world.spawns[0].first;
    EXPECT_EQ(b.id(), *baby);
    ASSERT_TRUE(b.parentId());
    EXPECT_EQ(*b.parentId(), winner.id());
    EXPECT_EQ(b.generation(), 5u);
    EXPECT_NEAR(winner.energy()->current() + mate.energy()->current() + b.energy()->current(), 170.0, 1e-9);
    EXPECT_NEAR(b.energy()->current(), 0.15 * 80.0 + 0.15 * 90.0, 1e-9);
    EXPECT_EQ(winner.reproduction()->cooldown(), cfg.reproduction.cooldownTicks);
    EXPECT_EQ(mate.reproduction()->cooldown(), cfg.reproduction.cooldownTicks);
    EXPECT_NEAR(b.position().x, 125.f, ReproductionOrchestrator::MateJitter);
}

TEST_F(ReproductionFixture, ParentContributionIsScaledToBabyCapacity)
{
    quietEmergencies();
    auto  &o = orchestrator();
    world.add(makeAdult(1, cfg, 400.0, 400.0, {100.f, 100.f}, neverAsexual()));
    world.add(makeAdult(2, cfg, 400.0, 400.0, {110.f, 100.f}, neverAsexual()));

    ASSERT_TRUE(o.handleInteractionOutcome({{1, 2}, 1, false}));
    const Agent &b = *world.spawns[0].first;
    EXPECT_NEAR(b.energy()->current(), babyCapacity(cfg, b.genome()), 1e-9);
    EXPECT_NEAR(world.findAgent(1)->energy()->current(), world.findAgent(2)->energy()->current(), 1e-9);
}

TEST_F(ReproductionFixture, InteractionGates)
{
    quietEmergencies();
    auto &o = orchestrator();
    world.add(makeAdult(1, cfg, 100.0, 80.0, {100.f, 100.f}, neverAsexual()));
    world.add(makeAdult(2, cfg, 100.0, 80.0, {500.f, 100.f}, neverAsexual()));           // too far
    world.add(makeAdult(3, cfg, 100.0, 80.0, {120.f, 100.f}, neverAsexual("guppy")));   // other species
    world.add(makeAdult(4, cfg, 100.0, 60.0, {110.f, 100.f}, neverAsexual()));           // too hungry

    EXPECT_FALSE(o.handleInteractionOutcome({{1, 2}, 1, true}));
    EXPECT_FALSE(o.handleInteractionOutcome({{1}, 1, false}));
    EXPECT_FALSE(o.handleInteractionOutcome({{1, 2}, std::nullopt, false}));
    EXPECT_FALSE(o.handleInteractionOutcome({{1, 2, 3, 4}, 1, false}));
    EXPECT_FALSE(o.handleInteractionOutcome({{4, 1}, 4, false}));
    EXPECT_TRUE(world.spawns.empty());
}

TEST_F(ReproductionFixture, RejectedSexualSpawnRefundsBothParents)
{
    quietEmergencies();
    world.rejectSpawns = true;
    auto  &o           = orchestrator();
    Agent &winner      = world.add(makeAdult(1, cfg, 100.0, 80.0, {100.f, 100.f}, neverAsexual()));
    Agent &mate        = world.add(makeAdult(2, cfg, 100.0, 90.0, {150.f, 100.f}, neverAsexual()));

    EXPECT_FALSE(o.handleInteractionOutcome({{1, 2}, 1, false}));
    EXPECT_NEAR(winner.energy()->current(), 80.0, 1e-9);
    EXPECT_NEAR(mate.energy()->current(), 90.0, 1e-9);
    EXPECT_EQ(winner.reproduction()->cooldown(), 0);
}

TEST_F(ReproductionFixture, SoloWinBreedsAsexually)
{
    quietEmergencies();
    auto  &o      = orchestrator();
    Agent &winner = world.add(makeAdult(1, cfg, 100.0, 97.0, {100.f, 100.f}, neverAsexual()));

    const auto baby = o.handleSoloWin(1);
    ASSERT_TRUE(baby);
    EXPECT_EQ(world.spawnsOf(SpawnReason::SoloWin), 1u);
    EXPECT_EQ(o.debugInfo().soloSpawns, 1u);
    EXPECT_EQ(winner.reproduction()->cooldown(), cfg.reproduction.cooldownTicks);

    EXPECT_FALSE(o.handleSoloWin(1));
    EXPECT_FALSE(o.handleSoloWin(42));
}

TEST_F(ReproductionFixture, EmergencyCloneKeepsTemplateGeneration)
{
    auto  &o       = orchestrator();
    Agent &veteran = world.add(makeAdult(1, cfg, 100.0, 80.0, {100.f, 100.f}, neverAsexual("guppy")));
    veteran.setLineage(7, 3);
    o.update(1, {&veteran});
    EXPECT_EQ(o.templateGeneration(), 7u);

    world.agents.clear();
    world.spawns.clear();
    o.update(2, {});
    ASSERT_EQ(world.spawns.size(), 1u);
    const Agent &clone = *world.spawns[0].first;
    EXPECT_EQ(clone.generation(), 7u);
    EXPECT_EQ(clone.species(), "guppy");

    o.reset();
    world.spawns.clear();
    o.update(3, {});
    ASSERT_EQ(world.spawns.size(), 1u);
    EXPECT_EQ(world.spawns[0].first->generation(), 0u);
}

TEST_F(ReproductionFixture, AsexualChecksCountOnlyEligibleParents)
{
    quietEmergencies();
    auto  &o      = orchestrator();
    Agent &parent = world.add(makeAdult(1, cfg, 100.0, 80.0, {100.f, 100.f}, alwaysAsexual()));

    o.update(1, {&parent});
    EXPECT_EQ(o.debugInfo().asexualChecks, 0u);

    parent.energy()->setCurrent(96.0);
    o.update(2, {&parent});
    EXPECT_EQ(o.debugInfo().asexualChecks, 1u);
    EXPECT_EQ(o.debugInfo().asexualTriggered, 1u);
}
