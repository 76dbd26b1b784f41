#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "Collaborators.hpp"

namespace aqua
{
    struct EnergyBreakdown
    {
        std::map<std::string, double, std::less<>> gains; // source -> total gained
        std::map<std::string, double, std::less<>> burns; // source -> total burned (positive)

        [[nodiscard]] double totalGain() const;
        [[nodiscard]] double totalBurn() const;

        [[nodiscard]] double net() const
        {
            return totalGain() - totalBurn();
        }
    };

    // Tank-wide energy flow by source. Cumulative totals plus a rolling window of per-tick buckets.
    class EnergyTracker final : public EnergyAccounting
    {
        public:
            static constexpr std::size_t DefaultWindow = 600;

            explicit EnergyTracker(std::size_t window = DefaultWindow);

            void recordEnergyDelta(AgentId id, std::string_view source, double delta) override;

            // Closes the current bucket.
            void advanceTick();

            [[nodiscard]] const EnergyBreakdown &cumulative() const
            {
                return m_total;
            }

            // Sum of the last `ticks` closed buckets plus the open one.
            [[nodiscard]] EnergyBreakdown recentBreakdown(std::size_t ticks) const;

            [[nodiscard]] double netFlow() const
            {
                return m_total.net();
            }

            [[nodiscard]] uint64_t recordCount() const
            {
                return m_records;
            }

            void reset();

        private:
            std::size_t                 m_window;
            EnergyBreakdown             m_total;
            EnergyBreakdown             m_current;
            std::deque<EnergyBreakdown> m_history;
            uint64_t                    m_records = 0;
    };
} // namespace aqua
