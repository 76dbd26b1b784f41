#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Agent.hpp"
#include "Collaborators.hpp"
#include "Config.hpp"
#include "Diagnostics.hpp"
#include "EnergyRouter.hpp"
#include "EnergyTracker.hpp"
#include "Genetics.hpp"
#include "Random.hpp"
#include "Reproduction.hpp"

namespace aqua
{
    struct TankStats
    {
        uint64_t    tick       = 0;
        std::size_t population = 0; // Active agents
        std::size_t fish       = 0;
        std::size_t microbes   = 0;
        std::size_t food       = 0;

        double agentEnergy  = 0.0;
        double bankedEnergy = 0.0;
        double foodEnergy   = 0.0;
        double lostEnergy   = 0.0;

        uint64_t                births = 0;
        uint64_t                deaths = 0;
        std::array<uint64_t, 5> deathsByCause{}; // indexed by DeathCause

        ReproductionTickStats lastReproduction;
    };

    // One fish tank: agent registry, food, and the per-tick loop.
    class Tank final : public EntityLifecycle, public SpatialWorld
    {
        public:
            explicit Tank(const TankConfig &cfg = {}, uint64_t seed = 1234567ULL);

            Tank(const Tank &)            = delete;
            Tank &operator=(const Tank &) = delete;

            void seedInitial(int n);
            void step();

            std::optional<AgentId> applyInteraction(const InteractionOutcome &outcome);
            std::optional<AgentId> applySoloWin(AgentId winner);

            bool grantReproCredits(AgentId id, double amount);
            bool markPredatorEncounter(AgentId id);
            bool migrate(AgentId id);
            bool addFood(Vec2 position, double energy);
            // Adds an agent immediately, outside the tick batch.
            Agent &insert(std::unique_ptr<Agent> agent);

            [[nodiscard]] TankStats stats() const;

            void reset(uint64_t seed, int n);

            [[nodiscard]] bool save(const std::string &path) const;
            bool               load(const std::string &path);

            // EntityLifecycle
            bool requestSpawn(std::unique_ptr<Agent> agent, SpawnReason reason) override;
            bool requestSpawnFood(const Food &food, SpawnReason reason) override;
            bool requestRemove(AgentId id, DeathCause cause) override;

            std::vector<Agent *>      liveAgents() override;
            Agent                    *findAgent(AgentId id) override;
            [[nodiscard]] std::size_t population() const override;
            AgentId                   nextAgentId() override;

            // SpatialWorld
            [[nodiscard]] Bounds bounds() const override;

            [[nodiscard]] const TankConfig &config() const
            {
                return m_cfg;
            }

            [[nodiscard]] uint64_t tick() const
            {
                return m_tick;
            }

            [[nodiscard]] const std::vector<std::unique_ptr<Agent>> &agents() const
            {
                return m_agents;
            }

            [[nodiscard]] const std::vector<Food> &food() const
            {
                return m_food;
            }

            [[nodiscard]] std::size_t pendingSpawns() const
            {
                return m_pendingSpawns.size();
            }

            [[nodiscard]] const EnergyTracker &tracker() const
            {
                return m_tracker;
            }

            [[nodiscard]] const Diagnostics &diagnostics() const
            {
                return m_diagnostics;
            }

            [[nodiscard]] const ReproductionOrchestrator &reproduction() const
            {
                return m_reproduction;
            }

            EnergyRouter &router()
            {
                return m_router;
            }

            Rng &rng()
            {
                return m_rng;
            }

        private:
            TankConfig               m_cfg;
            Rng                      m_rng;
            TraitGenetics            m_genetics;
            EnergyTracker            m_tracker;
            Diagnostics              m_diagnostics;
            EnergyRouter             m_router;
            ReproductionOrchestrator m_reproduction;

            std::vector<std::unique_ptr<Agent>> m_agents;
            std::vector<Food>                   m_food;

            std::vector<std::pair<std::unique_ptr<Agent>, SpawnReason>> m_pendingSpawns;
            std::vector<Food>                                           m_pendingFood;
            std::vector<std::pair<AgentId, DeathCause>>                 m_pendingRemovals;

            uint64_t m_tick   = 0;
            AgentId  m_nextId = 1;

            uint64_t                m_births = 0;
            uint64_t                m_deaths = 0;
            std::array<uint64_t, 5> m_deathsByCause{};
            ReproductionTickStats   m_lastReproduction;

            [[nodiscard]] Vec2 randomPosition(float margin);

            // Drops agents, food, queues and every per-run counter.
            void clearRun(uint64_t tick);

            void updateAgent(Agent &a);
            void move(Agent &a);
            void feed(Agent &a);
            void runFeeder();
            void flush();
    };
} // namespace aqua
