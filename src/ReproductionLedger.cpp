#include "aqua/ReproductionLedger.hpp"

#include <algorithm>

namespace aqua
{
    double ReproductionLedger::bankOverflow(const double amount, const double maxBank)
    {
        if (amount <= 0.0)
            return 0.0;
        const double room   = std::max(0.0, maxBank - m_bank);
        const double banked = std::min(amount, room);
        m_bank += banked;
        return banked;
    }

    double ReproductionLedger::consumeBank(const double maxAmount)
    {
        if (maxAmount <= 0.0)
            return 0.0;
        const double used = std::min(m_bank, maxAmount);
        m_bank -= used;
        return used;
    }

    bool ReproductionLedger::canReproduce(const LifeStage stage, const double energy, const double maxEnergy) const
    {
        return stage == LifeStage::Adult && m_cooldown == 0 && energy >= maxEnergy * m_cfg.reproduceEnergyRatio;
    }

    bool ReproductionLedger::canAsexuallyReproduce(const LifeStage stage, const double energy,
                                                   const double maxEnergy) const
    {
        return canReproduce(stage, energy, maxEnergy) && energy >= maxEnergy * m_cfg.asexualEnergyRatio;
    }

    AsexualOffspring ReproductionLedger::triggerAsexual(const Genome &parent, const Genetics &genetics, Rng &rng)
    {
        m_cooldown = m_cfg.cooldownTicks;
        return AsexualOffspring{
            genetics.mutate(parent, m_cfg.asexualMutationRate, m_cfg.asexualMutationStrength, rng),
            m_cfg.energyTransferToBaby,
        };
    }

    void ReproductionLedger::setCooldownAtLeast(const int ticks)
    {
        m_cooldown = std::max(m_cooldown, ticks);
    }

    double ReproductionLedger::addReproCredits(const double amount)
    {
        if (amount <= 0.0)
            return 0.0;
        m_credits += amount;
        return amount;
    }

    double ReproductionLedger::consumeReproCredits(const double amount)
    {
        if (amount <= 0.0)
            return 0.0;
        const double used = std::min(m_credits, amount);
        m_credits -= used;
        return used;
    }

    std::string ReproductionLedger::stateLabel() const
    {
        if (m_cooldown > 0)
            return "Cooldown (" + std::to_string(m_cooldown) + " ticks)";
        return "Ready to reproduce";
    }

    void ReproductionLedger::restore(const int cooldown, const double bank, const double credits)
    {
        m_cooldown = std::max(0, cooldown);
        m_bank     = std::max(0.0, bank);
        m_credits  = std::max(0.0, credits);
    }
} // namespace aqua
