#include "aqua/Config.hpp"

#include <stdexcept>
#include <string>

namespace aqua
{
    namespace
    {
        void require(const bool cond, const char *what)
        {
            if (!cond)
                throw std::invalid_argument(std::string("invalid tank config: ") + what);
        }
    } // namespace

    void TankConfig::validate() const
    {
        require(energy.maxEnergyDefault > 0.0, "maxEnergyDefault must be > 0");
        require(energy.bankMultiplier >= 0.0, "bankMultiplier must be >= 0");
        require(energy.initialEnergyRatio > 0.0 && energy.initialEnergyRatio <= 1.0,
                "initialEnergyRatio must be in (0, 1]");
        require(energy.sprintThreshold > 0.0 && energy.sprintThreshold < 1.0, "sprintThreshold must be in (0, 1)");

        require(lifecycle.babyMaxAge > 0 && lifecycle.babyMaxAge < lifecycle.juvenileMaxAge &&
                lifecycle.juvenileMaxAge < lifecycle.adultMaxAge,
                "stage age thresholds must be strictly increasing");
        require(lifecycle.baseLifespan > 0, "baseLifespan must be > 0");
        require(lifecycle.babySize > 0.f && lifecycle.babySize <= lifecycle.adultSize, "babySize must be in (0, adultSize]");

        require(reproduction.cooldownTicks >= 0, "cooldownTicks must be >= 0");
        require(reproduction.reproduceEnergyRatio <= reproduction.asexualEnergyRatio,
                "asexual threshold must not be below the reproduction threshold");
        require(reproduction.energyTransferToBaby > 0.0 && reproduction.energyTransferToBaby < 1.0,
                "energyTransferToBaby must be in (0, 1)");
        require(reproduction.reproCreditRequired >= 0.0, "reproCreditRequired must be >= 0");

        require(ecosystem.maxPopulation > 0, "maxPopulation must be > 0");
        require(ecosystem.criticalPopulation >= 0 && ecosystem.criticalPopulation < ecosystem.maxPopulation,
                "criticalPopulation must be in [0, maxPopulation)");
        require(ecosystem.emergencySpawnCooldown >= 0, "emergencySpawnCooldown must be >= 0");
        require(ecosystem.tankWidth > 2.f * static_cast<float>(ecosystem.spawnMargin) &&
                ecosystem.tankHeight > 2.f * static_cast<float>(ecosystem.spawnMargin),
                "tank must be larger than twice the spawn margin");
        require(ecosystem.maxSpeed > 0.f, "maxSpeed must be > 0");
        require(ecosystem.foodEnergy > 0.0 && ecosystem.maxFood >= 0, "feeder settings out of range");
    }
} // namespace aqua
