#include "aqua/Agent.hpp"

#include <cmath>

namespace aqua
{
    std::string_view toString(const AgentKind k)
    {
        switch (k)
        {
            case AgentKind::Fish:
                return "fish";
            case AgentKind::Microbe:
                return "microbe";
        }
        return "?";
    }

    double capacityForSize(const EnergyConfig &cfg, const double size)
    {
        return cfg.maxEnergyDefault * size;
    }

    double babyCapacity(const TankConfig &cfg, const Genome &g)
    {
        return capacityForSize(cfg.energy, static_cast<double>(cfg.lifecycle.babySize) *
                                               static_cast<double>(g.sizeModifier));
    }

    Agent::Agent(const AgentId id, const AgentKind kind, Genome genome, const Vec2 position)
        : m_id(id), m_kind(kind), m_genome(std::move(genome)), m_position(position)
    {
    }

    std::unique_ptr<Agent> Agent::makeFish(const AgentId id, const TankConfig &cfg, const Genome &genome,
                                           const Vec2 position, const std::optional<double> initialEnergy,
                                           const uint32_t generation, const std::optional<AgentId> parent)
    {
        auto a = std::make_unique<Agent>(id, AgentKind::Fish, genome, position);
        a->setLineage(generation, parent);

        const auto maxAge = static_cast<int64_t>(std::llround(static_cast<double>(cfg.lifecycle.baseLifespan) *
                                                              static_cast<double>(genome.lifespanModifier)));
        a->attach(LifecycleStateMachine(cfg.lifecycle, maxAge, genome.sizeModifier));

        const double capacity   = capacityForSize(cfg.energy, a->lifecycle()->size());
        const double metabolism = cfg.energy.baseMetabolism * static_cast<double>(genome.metabolismModifier);
        if (initialEnergy)
            a->attach(EnergyLedger(cfg.energy, capacity, metabolism, *initialEnergy));
        else
            a->attach(EnergyLedger(cfg.energy, capacity, metabolism));

        a->attach(ReproductionLedger(cfg.reproduction));
        a->attach(Mortality(cfg.ecosystem.predatorEncounterWindow, cfg.lifecycle.trackHistory));
        return a;
    }

    std::unique_ptr<Agent> Agent::makeMicrobe(const AgentId id, const TankConfig &cfg, const Vec2 position,
                                              const double maxEnergy, const double initialEnergy)
    {
        Genome g;
        g.species = "microbe";
        auto a    = std::make_unique<Agent>(id, AgentKind::Microbe, g, position);
        a->attach(EnergyLedger(cfg.energy, maxEnergy, cfg.energy.baseMetabolism, initialEnergy));
        a->attach(Mortality(cfg.ecosystem.predatorEncounterWindow, cfg.lifecycle.trackHistory));
        return a;
    }
} // namespace aqua
