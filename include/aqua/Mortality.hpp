#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "StateMachine.hpp"

namespace aqua
{
    enum class MortalState : uint8_t
    {
        Active,
        Dead,
        Removed
    };

    enum class DeathCause : uint8_t
    {
        None,
        Starvation,
        OldAge,
        Predation,
        Migration
    };

    std::string_view toString(MortalState s);
    std::string_view toString(DeathCause c);

    // Active -> Dead | Removed. Both are terminal.
    const TransitionTable<MortalState> &mortalStateTransitions();

    // Emitted by the energy router.
    struct EnergyDepleted
    {
        uint64_t tick = 0;
    };

    struct EnergyRestored
    {
        uint64_t tick = 0;
    };

    // What an observer knows about an agent when labelling a death.
    struct DeathContext
    {
        double   energy         = 0.0;
        bool     reachedMaxAge  = false;
        uint64_t tick           = 0;
    };

    class Mortality
    {
        public:
            explicit Mortality(int predatorEncounterWindow = 150, bool trackHistory = false);

            void handle(const EnergyDepleted &e);
            void handle(const EnergyRestored &e);

            // Returns false if the agent is no longer Active.
            bool dieOfOldAge(uint64_t tick);
            // Active -> Removed(cause). Returns false if the agent is not Active.
            bool remove(DeathCause cause, uint64_t tick);

            void markPredatorEncounter(const uint64_t tick)
            {
                m_lastPredatorEncounter = tick;
                m_hasPredatorEncounter  = true;
            }

            [[nodiscard]] MortalState state() const
            {
                return m_machine.state();
            }

            [[nodiscard]] bool isActive() const
            {
                return state() == MortalState::Active;
            }

            [[nodiscard]] bool isDead() const
            {
                return state() == MortalState::Dead;
            }

            [[nodiscard]] DeathCause cause() const
            {
                return m_cause;
            }

            [[nodiscard]] bool cachedDead() const
            {
                return m_cachedDead;
            }

            [[nodiscard]] bool hasPredatorEncounter() const
            {
                return m_hasPredatorEncounter;
            }

            [[nodiscard]] uint64_t lastPredatorEncounter() const
            {
                return m_lastPredatorEncounter;
            }

            [[nodiscard]] bool recentPredatorEncounter(uint64_t tick) const;

            // Recorded cause, else inferred from ctx. "unknown_<tags>" means a bookkeeping bug.
            [[nodiscard]] std::string deathLabel(const DeathContext &ctx) const;

            [[nodiscard]] const std::deque<TransitionRecord<MortalState>> &history() const
            {
                return m_machine.history();
            }

            // Restore/testing only. Does not touch the cached-dead flag.
            void forceState(MortalState state, DeathCause cause, uint64_t tick = 0,
                            const std::string &reason = "forced");

        private:
            int                       m_window;
            StateMachine<MortalState> m_machine;
            DeathCause                m_cause                 = DeathCause::None;
            bool                      m_cachedDead            = false;
            bool                      m_hasPredatorEncounter  = false;
            uint64_t                  m_lastPredatorEncounter = 0;
    };
} // namespace aqua
