#include "aqua/EnergyLedger.hpp"

#include <algorithm>
#include <cmath>

namespace aqua
{
    EnergyLedger::EnergyLedger(const EnergyConfig &cfg, const double maxEnergy, const double baseMetabolism)
        : EnergyLedger(cfg, maxEnergy, baseMetabolism, maxEnergy * cfg.initialEnergyRatio)
    {
    }

    EnergyLedger::EnergyLedger(const EnergyConfig &cfg, const double maxEnergy, const double baseMetabolism,
                               const double initialEnergy)
        : m_cfg(cfg), m_max(std::max(0.0, maxEnergy)), m_baseMetabolism(std::max(0.0, baseMetabolism)),
          m_current(std::clamp(initialEnergy, 0.0, std::max(0.0, maxEnergy)))
    {
    }

    EnergyBurn EnergyLedger::calculateBurn(const Vec2 &velocity, const float maxSpeed, const LifeStage stage,
                                           const double timeModifier, const double size) const
    {
        double stageMul = 1.0;
        if (stage == LifeStage::Baby)
            stageMul = m_cfg.babyMultiplier;
        else if (stage == LifeStage::Elder)
            stageMul = m_cfg.elderMultiplier;

        const double s = std::max(0.0, size);

        EnergyBurn b;
        b.existence = m_cfg.existenceCost * timeModifier * std::pow(s, m_cfg.existenceSizeExponent) * stageMul;

        if (const double v = len(velocity); v > 0.0 && maxSpeed > 0.f)
        {
            const double ratio      = v / static_cast<double>(maxSpeed);
            const double sizeFactor = std::pow(s, m_cfg.movementSizeExponent);

            b.movement = m_cfg.movementCost * ratio * sizeFactor * stageMul;
            if (ratio > m_cfg.sprintThreshold)
            {
                const double excess = ratio - m_cfg.sprintThreshold;
                b.movement += m_cfg.sprintCost * excess * excess * excess * sizeFactor * stageMul;
            }
        }

        b.metabolism = m_baseMetabolism * timeModifier * stageMul;
        b.total      = b.existence + b.metabolism + b.movement;
        return b;
    }

    bool EnergyLedger::isStarving() const
    {
        return ratio() < m_cfg.starvationRatio;
    }

    bool EnergyLedger::isCritical() const
    {
        return ratio() < m_cfg.criticalRatio;
    }

    bool EnergyLedger::isLow() const
    {
        return ratio() < m_cfg.lowRatio;
    }

    bool EnergyLedger::isSafe() const
    {
        return ratio() >= m_cfg.safeRatio;
    }

    std::string_view EnergyLedger::statusLabel() const
    {
        if (isStarving())
            return "Starving";
        if (isCritical())
            return "Critical Energy";
        if (isLow())
            return "Low Energy";
        if (isSafe())
            return "Safe Energy";
        return "Moderate Energy";
    }

    void EnergyLedger::setCurrent(const double v)
    {
        m_current = std::clamp(v, 0.0, m_max);
    }

    double EnergyLedger::setMax(const double newMax)
    {
        m_max = std::max(0.0, newMax);
        if (m_current <= m_max)
            return 0.0;
        const double excess = m_current - m_max;
        m_current           = m_max;
        return excess;
    }
} // namespace aqua
