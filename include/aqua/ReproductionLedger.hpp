#pragma once
#include <string>

#include "Config.hpp"
#include "Genetics.hpp"
#include "Lifecycle.hpp"

namespace aqua
{
    struct AsexualOffspring
    {
        Genome genome;
        double energyTransferFraction = 0.0;
    };

    // Cooldown, overflow bank and reproduction credits of one agent.
    class ReproductionLedger
    {
        public:
            explicit ReproductionLedger(const ReproductionConfig &cfg): m_cfg(cfg)
            {
            }

            // Deposits up to the remaining room under maxBank. Returns the amount banked.
            double bankOverflow(double amount, double maxBank);
            // Withdraws up to maxAmount. Returns the amount withdrawn.
            double consumeBank(double maxAmount);

            [[nodiscard]] bool canReproduce(LifeStage stage, double energy, double maxEnergy) const;
            [[nodiscard]] bool canAsexuallyReproduce(LifeStage stage, double energy, double maxEnergy) const;

            // Starts the cooldown and builds the mutated clone genome.
            AsexualOffspring triggerAsexual(const Genome &parent, const Genetics &genetics, Rng &rng);

            void tickCooldown()
            {
                if (m_cooldown > 0)
                    --m_cooldown;
            }

            void setCooldownAtLeast(int ticks);

            double addReproCredits(double amount);
            double consumeReproCredits(double amount);

            [[nodiscard]] bool hasReproCredits(const double required) const
            {
                return m_credits >= required;
            }

            [[nodiscard]] int cooldown() const
            {
                return m_cooldown;
            }

            [[nodiscard]] double overflowBank() const
            {
                return m_bank;
            }

            [[nodiscard]] double reproCredits() const
            {
                return m_credits;
            }

            [[nodiscard]] std::string stateLabel() const;

            // Restore path only.
            void restore(int cooldown, double bank, double credits);

        private:
            ReproductionConfig m_cfg;
            int                m_cooldown = 0;
            double             m_bank     = 0.0;
            double             m_credits  = 0.0;
    };
} // namespace aqua
