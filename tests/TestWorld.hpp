#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "aqua/Agent.hpp"
#include "aqua/Collaborators.hpp"
#include "aqua/Config.hpp"

namespace aqua::test
{
    // In-memory EntityLifecycle/SpatialWorld. Spawns stay pending so tests can inspect them.
    class FakeWorld final : public EntityLifecycle, public SpatialWorld
    {
        public:
            std::vector<std::unique_ptr<Agent>>                         agents;
            std::vector<std::pair<std::unique_ptr<Agent>, SpawnReason>> spawns;
            std::vector<Food>                                           food;
            std::vector<std::pair<AgentId, DeathCause>>                 removals;

            bool rejectSpawns = false;
            bool throwOnSpawn = false;
            bool rejectFood   = false;
            bool throwOnFood  = false;

            AgentId nextId = 1000;
            Bounds  world{{0.f, 0.f}, {1000.f, 600.f}};

            Agent &add(std::unique_ptr<Agent> a)
            {
                agents.push_back(std::move(a));
                return *agents.back();
            }

            [[nodiscard]] std::size_t spawnsOf(const SpawnReason reason) const
            {
                std::size_t n = 0;
                for (const auto &[a, r] : spawns)
                    if (r == reason)
                        ++n;
                return n;
            }

            bool requestSpawn(std::unique_ptr<Agent> agent, const SpawnReason reason) override
            {
                if (throwOnSpawn)
                    throw std::runtime_error("spawn backend down");
                if (rejectSpawns)
                    return false;
                spawns.emplace_back(std::move(agent), reason);
                return true;
            }

            bool requestSpawnFood(const Food &f, SpawnReason) override
            {
                if (throwOnFood)
                    throw std::runtime_error("food backend down");
                if (rejectFood)
                    return false;
                food.push_back(f);
                return true;
            }

            bool requestRemove(const AgentId id, const DeathCause cause) override
            {
                removals.emplace_back(id, cause);
                return true;
            }

            std::vector<Agent *> liveAgents() override
            {
                std::vector<Agent *> out;
                for (const auto &a : agents)
                    if (a->isActive())
                        out.push_back(a.get());
                return out;
            }

            Agent *findAgent(const AgentId id) override
            {
                for (const auto &a : agents)
                    if (a->id() == id)
                        return a.get();
                return nullptr;
            }

            [[nodiscard]] std::size_t population() const override
            {
                std::size_t n = spawns.size();
                for (const auto &a : agents)
                    if (a->isActive())
                        ++n;
                return n;
            }

            AgentId nextAgentId() override
            {
                return nextId++;
            }

            [[nodiscard]] Bounds bounds() const override
            {
                return world;
            }
    };

    class RecordingAccounting final : public EnergyAccounting
    {
        public:
            std::vector<std::tuple<AgentId, std::string, double>> records;

            void recordEnergyDelta(const AgentId id, const std::string_view source, const double delta) override
            {
                records.emplace_back(id, std::string(source), delta);
            }
    };

    class ThrowingAccounting final : public EnergyAccounting
    {
        public:
            void recordEnergyDelta(AgentId, std::string_view, double) override
            {
                throw std::runtime_error("accounting unavailable");
            }
    };

    // A fish already past the juvenile stage, with an explicit ledger.
    inline std::unique_ptr<Agent> makeAdult(const AgentId id, const TankConfig &cfg, const double maxEnergy,
                                            const double energy, const Vec2 pos = {100.f, 100.f},
                                            Genome genome = {})
    {
        auto a = std::make_unique<Agent>(id, AgentKind::Fish, std::move(genome), pos);

        LifecycleStateMachine life(cfg.lifecycle, cfg.lifecycle.baseLifespan);
        life.advance(cfg.lifecycle.juvenileMaxAge);
        a->attach(std::move(life));
        a->attach(EnergyLedger(cfg.energy, maxEnergy, cfg.energy.baseMetabolism, energy));
        a->attach(ReproductionLedger(cfg.reproduction));
        a->attach(Mortality(cfg.ecosystem.predatorEncounterWindow));
        return a;
    }
} // namespace aqua::test
