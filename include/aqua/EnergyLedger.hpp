#pragma once
#include <string_view>

#include "Config.hpp"
#include "Lifecycle.hpp"
#include "Math.hpp"

namespace aqua
{
    struct EnergyBurn
    {
        double existence  = 0.0;
        double metabolism = 0.0;
        double movement   = 0.0; // includes the sprint penalty
        double total      = 0.0;
    };

    // Current/max energy of one agent. Mutated only through EnergyRouter, which
    // keeps current within [0, max] at every observable point.
    class EnergyLedger
    {
        public:
            EnergyLedger(const EnergyConfig &cfg, double maxEnergy, double baseMetabolism);
            EnergyLedger(const EnergyConfig &cfg, double maxEnergy, double baseMetabolism, double initialEnergy);

            // Pure: the caller applies -total through the router.
            [[nodiscard]] EnergyBurn calculateBurn(const Vec2 &velocity, float maxSpeed, LifeStage stage,
                                                   double timeModifier = 1.0, double size = 1.0) const;

            [[nodiscard]] double current() const
            {
                return m_current;
            }

            [[nodiscard]] double max() const
            {
                return m_max;
            }

            [[nodiscard]] double baseMetabolism() const
            {
                return m_baseMetabolism;
            }

            [[nodiscard]] double ratio() const
            {
                return m_max > 0.0 ? m_current / m_max : 0.0;
            }

            [[nodiscard]] double percentage() const
            {
                return ratio() * 100.0;
            }

            [[nodiscard]] bool hasEnough(const double threshold) const
            {
                return m_current >= threshold;
            }

            [[nodiscard]] bool isStarving() const;
            [[nodiscard]] bool isCritical() const;
            [[nodiscard]] bool isLow() const;
            [[nodiscard]] bool isSafe() const;

            [[nodiscard]] std::string_view statusLabel() const;

            void setCurrent(double v);
            // Returns the energy that no longer fits under the new max.
            double setMax(double newMax);

        private:
            friend class EnergyRouter;

            EnergyConfig m_cfg;
            double       m_max;
            double       m_baseMetabolism;
            double       m_current;
    };
} // namespace aqua
