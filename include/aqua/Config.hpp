#pragma once
#include <cstdint>

namespace aqua
{
    struct EnergyConfig
    {
        // Per-tick costs
        double existenceCost         = 0.06;
        double existenceSizeExponent = 1.3;
        double movementCost          = 0.10;
        double movementSizeExponent  = 1.5;
        double sprintThreshold       = 0.70; // fraction of max speed
        double sprintCost            = 0.25; // cubic above threshold

        double babyMultiplier  = 0.5;
        double elderMultiplier = 1.5;

        // Status thresholds, as ratios of max energy
        double starvationRatio = 0.10;
        double criticalRatio   = 0.10;
        double lowRatio        = 0.20;
        double safeRatio       = 0.40;

        double maxEnergyDefault   = 150.0; // baseline adult capacity at size 1.0
        double initialEnergyRatio = 0.5;
        double bankMultiplier     = 3.0; // overflow bank cap = max energy * this
        double baseMetabolism     = 0.04;
    };

    struct LifecycleConfig
    {
        int64_t babyMaxAge     = 600;
        int64_t juvenileMaxAge = 900;
        int64_t adultMaxAge    = 3600;
        int64_t baseLifespan   = 5400;

        float babySize  = 0.5f;
        float adultSize = 1.0f;

        bool trackHistory = false;
    };

    struct ReproductionConfig
    {
        double reproduceEnergyRatio = 0.90;
        double asexualEnergyRatio   = 0.95;
        int    cooldownTicks        = 300;
        double energyTransferToBaby = 0.30;

        float asexualMutationRate     = 0.1f;
        float asexualMutationStrength = 0.1f;

        // Post-interaction sexual path
        double sexualEnergyRatio     = 0.70;
        float  matingDistance        = 80.f;
        float  crossoverWinnerWeight = 0.7f;
        double parentContribution    = 0.15;
        float  sexualMutationRate    = 0.1f;
        float  sexualMutationStrength = 0.1f;

        // 0 disables the credit gate
        double reproCreditRequired = 0.0;
    };

    struct EcosystemConfig
    {
        int   maxPopulation           = 60;
        int   criticalPopulation      = 5;
        int   emergencySpawnCooldown  = 90;
        float emergencySpawnScale     = 0.3f;
        int   spawnMargin             = 50;
        int   predatorEncounterWindow = 150;

        float tankWidth  = 1088.f;
        float tankHeight = 612.f;

        float foodEatRadius = 24.f;
        float maxSpeed      = 2.2f;
        float wanderJitter  = 0.3f;

        // Feeder
        float  foodSpawnChance = 0.35f; // per tick
        double foodEnergy      = 12.0;
        int    maxFood         = 80;
    };

    struct TankConfig
    {
        EnergyConfig       energy;
        LifecycleConfig    lifecycle;
        ReproductionConfig reproduction;
        EcosystemConfig    ecosystem;

        // Throws std::invalid_argument on an inconsistent configuration.
        void validate() const;
    };
} // namespace aqua
