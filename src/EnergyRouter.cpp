#include "aqua/EnergyRouter.hpp"
#include "aqua/Log.hpp"

#include <algorithm>
#include <exception>
#include <tuple>

namespace aqua
{
    EnergyRouter::EnergyRouter(const EnergyConfig &cfg, EntityLifecycle &lifecycle, const SpatialWorld &world,
                               Rng &rng, EnergyAccounting *accounting)
        : m_cfg(cfg), m_lifecycle(lifecycle), m_world(world), m_rng(rng), m_accounting(accounting)
    {
    }

    double EnergyRouter::modifyEnergy(Agent &agent, const double amount, const std::string_view source)
    {
        EnergyLedger *ledger = agent.energy();
        if (!ledger)
        {
            logger()->debug("agent {} has no energy ledger, ignoring {} from {}", agent.id(), amount, source);
            return 0.0;
        }

        const double before = ledger->current();
        double       delta  = 0.0;

        if (amount > 0.0)
        {
            const double room      = std::max(0.0, ledger->max() - before);
            const double committed = std::min(amount, room);
            const double excess    = amount - committed;

            ledger->setCurrent(before + committed);
            delta = ledger->current() - before;

            OverflowReceipt receipt{amount, delta, 0.0, 0.0};
            if (excess > 0.0)
                std::tie(receipt.banked, receipt.spilled) = routeExcess(agent, excess);
            m_lastOverflow = receipt;
        }
        else
        {
            ledger->setCurrent(std::max(0.0, before + amount));
            delta = ledger->current() - before;
        }

        notifyMortality(agent);
        report(agent.id(), source, delta);
        return delta;
    }

    double EnergyRouter::syncCapacity(Agent &agent, const double newMax, const std::string_view source)
    {
        EnergyLedger *ledger = agent.energy();
        if (!ledger)
            return 0.0;

        const double excess = ledger->setMax(newMax);
        if (excess <= 0.0)
            return 0.0;

        const double    lostBefore = m_lost;
        OverflowReceipt receipt{excess, 0.0, 0.0, 0.0};
        std::tie(receipt.banked, receipt.spilled) = routeExcess(agent, excess);
        m_lastOverflow = receipt;

        // Banked and spilled energy stays in the tank; only what was lost leaves it.
        if (const double lost = m_lost - lostBefore; lost > 0.0)
            report(agent.id(), source, -lost);
        return excess;
    }

    std::pair<double, double> EnergyRouter::routeExcess(Agent &agent, const double excess)
    {
        double banked = 0.0;
        if (ReproductionLedger *repro = agent.reproduction())
        {
            const double maxBank = agent.energy()->max() * m_cfg.bankMultiplier;
            banked               = repro->bankOverflow(excess, maxBank);
        }

        const double spilled = excess - banked;
        if (spilled > 0.0)
            spill(agent, spilled);
        return {banked, spilled};
    }

    void EnergyRouter::spill(Agent &agent, const double amount)
    {
        const Vec2 jitter{m_rng.uniform(-SpillJitter, SpillJitter), m_rng.uniform(-SpillJitter, SpillJitter)};
        const Food food{m_world.clamp(agent.position() + jitter), amount, agent.id()};

        try
        {
            if (m_lifecycle.requestSpawnFood(food, SpawnReason::Overflow))
                return;
            logger()->debug("overflow food from agent {} rejected, {:.2f} energy lost", agent.id(), amount);
        }
        catch (const std::exception &e)
        {
            logger()->warn("overflow food spawn failed for agent {}: {}", agent.id(), e.what());
        }
        m_lost += amount;
    }

    void EnergyRouter::notifyMortality(Agent &agent)
    {
        Mortality *mortality = agent.mortality();
        if (!mortality || !mortality->isActive())
            return;

        if (agent.energy()->current() <= 0.0)
            mortality->handle(EnergyDepleted{m_tick});
        else if (mortality->cachedDead())
            mortality->handle(EnergyRestored{m_tick});
    }

    void EnergyRouter::report(const AgentId id, const std::string_view source, const double delta)
    {
        if (!m_accounting)
            return;
        try
        {
            m_accounting->recordEnergyDelta(id, source, delta);
        }
        catch (const std::exception &e)
        {
            logger()->warn("energy accounting failed for agent {} ({}): {}", id, source, e.what());
        }
    }
} // namespace aqua
