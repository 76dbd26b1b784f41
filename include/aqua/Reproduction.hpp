#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "Agent.hpp"
#include "Collaborators.hpp"
#include "Config.hpp"
#include "EnergyRouter.hpp"
#include "Genetics.hpp"
#include "Random.hpp"

namespace aqua
{
    struct ReproductionTickStats
    {
        int bankedAsexual   = 0;
        int traitAsexual    = 0;
        int emergencySpawns = 0;

        [[nodiscard]] int total() const
        {
            return bankedAsexual + traitAsexual + emergencySpawns;
        }
    };

    // Result of a competitive interaction (minigame, fight) between agents.
    struct InteractionOutcome
    {
        std::vector<AgentId>   participants;
        std::optional<AgentId> winner;
        bool                   tie = false;
    };

    struct ReproductionDebugInfo
    {
        uint64_t asexualChecks      = 0;
        uint64_t asexualTriggered   = 0;
        uint64_t bankedSpawns       = 0;
        uint64_t emergencySpawns    = 0;
        uint64_t sexualSpawns       = 0;
        uint64_t soloSpawns         = 0;
        uint64_t rejectedSpawns     = 0;
        std::optional<uint64_t> lastEmergencyTick;
    };

    // Resolves all reproduction paths once per tick under the population cap.
    // Never touches the registry directly; every birth is an EntityLifecycle request.
    class ReproductionOrchestrator
    {
        public:
            static constexpr float OffspringJitter = 20.f;
            static constexpr float MateJitter      = 30.f;

            ReproductionOrchestrator(const TankConfig &cfg, EntityLifecycle &lifecycle, const SpatialWorld &world,
                                     EnergyRouter &router, const Genetics &genetics, Rng &rng);

            // snapshot: the Active agents fixed at the start of the tick.
            ReproductionTickStats update(uint64_t tick, const std::vector<Agent *> &snapshot);

            // Sexual reproduction after a decisive interaction. Returns the baby id when one was requested.
            std::optional<AgentId> handleInteractionOutcome(const InteractionOutcome &outcome);

            // Asexual birth for a winner that played alone.
            std::optional<AgentId> handleSoloWin(AgentId winnerId);

            [[nodiscard]] const ReproductionDebugInfo &debugInfo() const
            {
                return m_debug;
            }

            [[nodiscard]] const std::optional<Genome> &emergencyTemplate() const
            {
                return m_template;
            }

            // Generation inherited by emergency clones of the template.
            [[nodiscard]] uint32_t templateGeneration() const
            {
                return m_templateGeneration;
            }

            void reset();

        private:
            TankConfig          m_cfg;
            EntityLifecycle    &m_lifecycle;
            const SpatialWorld &m_world;
            EnergyRouter       &m_router;
            const Genetics     &m_genetics;
            Rng                &m_rng;

            std::optional<Genome> m_template;
            uint32_t              m_templateGeneration = 0;
            ReproductionDebugInfo m_debug;

            [[nodiscard]] double babyCost() const;
            [[nodiscard]] bool   hasCredits(const Agent &a) const;
            [[nodiscard]] bool   belowCap(std::size_t count) const;
            [[nodiscard]] bool   isValidMate(const Agent &a) const;
            [[nodiscard]] Vec2   jitterAround(Vec2 p, float jitter);

            void registerTemplate(const std::vector<Agent *> &snapshot);

            bool tryBankedAsexual(Agent &parent);
            bool tryTraitAsexual(Agent &parent);
            std::optional<AgentId> spawnSelfFunded(Agent &parent, SpawnReason reason);
            bool trySpawnEmergency(uint64_t tick, std::size_t count);
            bool spawnEmergency(uint64_t tick);

            bool submit(std::unique_ptr<Agent> baby, SpawnReason reason);
    };
} // namespace aqua
