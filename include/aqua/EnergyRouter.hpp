#pragma once
#include <cstdint>
#include <string_view>
#include <utility>

#include "Agent.hpp"
#include "Collaborators.hpp"
#include "Config.hpp"
#include "Random.hpp"

namespace aqua
{
    // How the latest gain (or capacity shrink) was split.
    // banked + spilled + committed == requested.
    struct OverflowReceipt
    {
        double requested = 0.0;
        double committed = 0.0;
        double banked    = 0.0;
        double spilled   = 0.0;
    };

    // The single entry point for energy changes. Keeps every ledger inside
    // [0, max], banks or spills surplus, and raises mortality events.
    class EnergyRouter
    {
        public:
            static constexpr float SpillJitter = 20.f;

            EnergyRouter(const EnergyConfig &cfg, EntityLifecycle &lifecycle, const SpatialWorld &world, Rng &rng,
                         EnergyAccounting *accounting = nullptr);

            // Returns the delta actually applied to current energy.
            double modifyEnergy(Agent &agent, double amount, std::string_view source);

            // Resizes max energy. Energy above the new max is banked or spilled. Returns that excess.
            // Only the part that could not be banked or spilled is reported to accounting.
            double syncCapacity(Agent &agent, double newMax, std::string_view source);

            void setTick(const uint64_t tick)
            {
                m_tick = tick;
            }

            void setAccounting(EnergyAccounting *accounting)
            {
                m_accounting = accounting;
            }

            [[nodiscard]] const OverflowReceipt &lastOverflow() const
            {
                return m_lastOverflow;
            }

            // Spill that could not be turned into food.
            [[nodiscard]] double lostEnergy() const
            {
                return m_lost;
            }

            void resetLostEnergy()
            {
                m_lost = 0.0;
            }

        private:
            EnergyConfig      m_cfg;
            EntityLifecycle  &m_lifecycle;
            const SpatialWorld &m_world;
            Rng              &m_rng;
            EnergyAccounting *m_accounting;

            uint64_t        m_tick = 0;
            OverflowReceipt m_lastOverflow;
            double          m_lost = 0.0;

            // Banks what fits and spills the rest. Returns {banked, spilled}.
            std::pair<double, double> routeExcess(Agent &agent, double excess);
            void                      spill(Agent &agent, double amount);
            void                      notifyMortality(Agent &agent);
            void                      report(AgentId id, std::string_view source, double delta);
    };
} // namespace aqua
