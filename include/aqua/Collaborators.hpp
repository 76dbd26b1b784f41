#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "Agent.hpp"
#include "Math.hpp"

namespace aqua
{
    enum class SpawnReason : uint8_t
    {
        Initial,
        BankedAsexual,
        TraitAsexual,
        Sexual,
        SoloWin,
        Emergency,
        Overflow,
        Feeder,
        Restore
    };

    std::string_view toString(SpawnReason r);

    struct Food
    {
        Vec2                   position;
        double                 energy = 0.0;
        std::optional<AgentId> source; // agent whose overflow produced it
    };

    // Owner of the agent registry. All requests are applied in one batch at end of tick.
    class EntityLifecycle
    {
        public:
            virtual ~EntityLifecycle() = default;

            virtual bool requestSpawn(std::unique_ptr<Agent> agent, SpawnReason reason) = 0;
            virtual bool requestSpawnFood(const Food &food, SpawnReason reason) = 0;
            virtual bool requestRemove(AgentId id, DeathCause cause) = 0;

            virtual std::vector<Agent *> liveAgents() = 0;
            virtual Agent               *findAgent(AgentId id) = 0;
            // Live Active agents plus pending agent spawns.
            [[nodiscard]] virtual std::size_t population() const = 0;
            virtual AgentId                   nextAgentId() = 0;
    };

    class SpatialWorld
    {
        public:
            virtual ~SpatialWorld() = default;

            [[nodiscard]] virtual Bounds bounds() const = 0;

            [[nodiscard]] Vec2 clamp(const Vec2 p) const
            {
                return bounds().clamp(p);
            }
    };

    // Best effort. Implementations may throw; the router logs and carries on.
    class EnergyAccounting
    {
        public:
            virtual ~EnergyAccounting() = default;

            virtual void recordEnergyDelta(AgentId id, std::string_view source, double delta) = 0;
    };
} // namespace aqua
