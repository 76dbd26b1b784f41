#include "aqua/EnergyTracker.hpp"

#include <algorithm>

namespace aqua
{
    namespace
    {
        void add(EnergyBreakdown &b, const std::string_view source, const double delta)
        {
            if (delta > 0.0)
                b.gains[std::string(source)] += delta;
            else if (delta < 0.0)
                b.burns[std::string(source)] += -delta;
        }

        void merge(EnergyBreakdown &into, const EnergyBreakdown &from)
        {
            for (const auto &[k, v] : from.gains)
                into.gains[k] += v;
            for (const auto &[k, v] : from.burns)
                into.burns[k] += v;
        }

        double sum(const std::map<std::string, double, std::less<>> &m)
        {
            double s = 0.0;
            for (const auto &[k, v] : m)
                s += v;
            return s;
        }
    } // namespace

    double EnergyBreakdown::totalGain() const
    {
        return sum(gains);
    }

    double EnergyBreakdown::totalBurn() const
    {
        return sum(burns);
    }

    EnergyTracker::EnergyTracker(const std::size_t window): m_window(std::max<std::size_t>(1, window))
    {
    }

    void EnergyTracker::recordEnergyDelta(AgentId, const std::string_view source, const double delta)
    {
        add(m_total, source, delta);
        add(m_current, source, delta);
        ++m_records;
    }

    void EnergyTracker::advanceTick()
    {
        m_history.push_back(std::move(m_current));
        m_current = {};
        while (m_history.size() > m_window)
            m_history.pop_front();
    }

    EnergyBreakdown EnergyTracker::recentBreakdown(const std::size_t ticks) const
    {
        EnergyBreakdown out = m_current;
        const std::size_t n = std::min(ticks, m_history.size());
        for (std::size_t i = m_history.size() - n; i < m_history.size(); ++i)
            merge(out, m_history[i]);
        return out;
    }

    void EnergyTracker::reset()
    {
        m_total   = {};
        m_current = {};
        m_history.clear();
        m_records = 0;
    }
} // namespace aqua
