#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "Config.hpp"
#include "EnergyLedger.hpp"
#include "Genetics.hpp"
#include "Lifecycle.hpp"
#include "Math.hpp"
#include "Mortality.hpp"
#include "ReproductionLedger.hpp"

namespace aqua
{
    using AgentId = uint64_t;

    enum class AgentKind : uint8_t
    {
        Fish,   // energy, lifecycle, reproduction, mortality
        Microbe // energy, mortality
    };

    std::string_view toString(AgentKind k);

    // Capacity of a body of the given size.
    double capacityForSize(const EnergyConfig &cfg, double size);
    // Capacity of a newborn carrying genome g.
    double babyCapacity(const TankConfig &cfg, const Genome &g);

    class Agent
    {
        public:
            Agent(AgentId id, AgentKind kind, Genome genome, Vec2 position);

            // A newborn fish. Without initialEnergy it starts at the configured ratio of its capacity.
            static std::unique_ptr<Agent> makeFish(AgentId id, const TankConfig &cfg, const Genome &genome,
                                                   Vec2 position, std::optional<double> initialEnergy = {},
                                                   uint32_t generation = 0, std::optional<AgentId> parent = {});

            static std::unique_ptr<Agent> makeMicrobe(AgentId id, const TankConfig &cfg, Vec2 position,
                                                      double maxEnergy, double initialEnergy);

            [[nodiscard]] AgentId id() const
            {
                return m_id;
            }

            [[nodiscard]] AgentKind kind() const
            {
                return m_kind;
            }

            [[nodiscard]] const Genome &genome() const
            {
                return m_genome;
            }

            [[nodiscard]] const std::string &species() const
            {
                return m_genome.species;
            }

            [[nodiscard]] uint32_t generation() const
            {
                return m_generation;
            }

            [[nodiscard]] std::optional<AgentId> parentId() const
            {
                return m_parent;
            }

            void setLineage(const uint32_t generation, const std::optional<AgentId> parent)
            {
                m_generation = generation;
                m_parent     = parent;
            }

            [[nodiscard]] Vec2 position() const
            {
                return m_position;
            }

            void setPosition(const Vec2 p)
            {
                m_position = p;
            }

            [[nodiscard]] Vec2 velocity() const
            {
                return m_velocity;
            }

            void setVelocity(const Vec2 v)
            {
                m_velocity = v;
            }

            // Capability queries. nullptr when the agent does not carry the component.
            EnergyLedger *energy()
            {
                return m_energy ? &*m_energy : nullptr;
            }

            [[nodiscard]] const EnergyLedger *energy() const
            {
                return m_energy ? &*m_energy : nullptr;
            }

            LifecycleStateMachine *lifecycle()
            {
                return m_lifecycle ? &*m_lifecycle : nullptr;
            }

            [[nodiscard]] const LifecycleStateMachine *lifecycle() const
            {
                return m_lifecycle ? &*m_lifecycle : nullptr;
            }

            ReproductionLedger *reproduction()
            {
                return m_reproduction ? &*m_reproduction : nullptr;
            }

            [[nodiscard]] const ReproductionLedger *reproduction() const
            {
                return m_reproduction ? &*m_reproduction : nullptr;
            }

            Mortality *mortality()
            {
                return m_mortality ? &*m_mortality : nullptr;
            }

            [[nodiscard]] const Mortality *mortality() const
            {
                return m_mortality ? &*m_mortality : nullptr;
            }

            [[nodiscard]] bool isActive() const
            {
                return !m_mortality || m_mortality->isActive();
            }

            [[nodiscard]] float size() const
            {
                return m_lifecycle ? m_lifecycle->size() : 1.f;
            }

            // Component assembly, used by the factories and by restore.
            void attach(EnergyLedger ledger)
            {
                m_energy.emplace(std::move(ledger));
            }

            void attach(LifecycleStateMachine lifecycle)
            {
                m_lifecycle.emplace(std::move(lifecycle));
            }

            void attach(ReproductionLedger ledger)
            {
                m_reproduction.emplace(std::move(ledger));
            }

            void attach(Mortality mortality)
            {
                m_mortality.emplace(std::move(mortality));
            }

        private:
            AgentId                m_id;
            AgentKind              m_kind;
            Genome                 m_genome;
            uint32_t               m_generation = 0;
            std::optional<AgentId> m_parent;

            Vec2 m_position;
            Vec2 m_velocity{};

            std::optional<EnergyLedger>          m_energy;
            std::optional<LifecycleStateMachine> m_lifecycle;
            std::optional<ReproductionLedger>    m_reproduction;
            std::optional<Mortality>             m_mortality;
    };
} // namespace aqua
