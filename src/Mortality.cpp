#include "aqua/Mortality.hpp"
#include "aqua/Log.hpp"

namespace aqua
{
    std::string_view toString(const MortalState s)
    {
        switch (s)
        {
            case MortalState::Active:
                return "Active";
            case MortalState::Dead:
                return "Dead";
            case MortalState::Removed:
                return "Removed";
        }
        return "?";
    }

    std::string_view toString(const DeathCause c)
    {
        switch (c)
        {
            case DeathCause::None:
                return "none";
            case DeathCause::Starvation:
                return "starvation";
            case DeathCause::OldAge:
                return "old_age";
            case DeathCause::Predation:
                return "predation";
            case DeathCause::Migration:
                return "migration";
        }
        return "?";
    }

    const TransitionTable<MortalState> &mortalStateTransitions()
    {
        static const TransitionTable<MortalState> table = {
            {MortalState::Active, {MortalState::Dead, MortalState::Removed}},
            {MortalState::Dead, {}},
            {MortalState::Removed, {}},
        };
        return table;
    }

    Mortality::Mortality(const int predatorEncounterWindow, const bool trackHistory)
        : m_window(predatorEncounterWindow), m_machine(MortalState::Active, mortalStateTransitions(), trackHistory)
    {
    }

    bool Mortality::recentPredatorEncounter(const uint64_t tick) const
    {
        return m_hasPredatorEncounter && tick >= m_lastPredatorEncounter &&
               tick - m_lastPredatorEncounter <= static_cast<uint64_t>(m_window);
    }

    void Mortality::handle(const EnergyDepleted &e)
    {
        m_cachedDead = true;
        if (!isActive())
            return;

        const DeathCause cause = recentPredatorEncounter(e.tick) ? DeathCause::Predation : DeathCause::Starvation;
        if (auto r = m_machine.tryTransition(MortalState::Dead, e.tick, std::string(toString(cause))); !r)
        {
            logger()->warn("death transition rejected: {}", r.error());
            return;
        }
        m_cause = cause;
    }

    void Mortality::handle(const EnergyRestored &)
    {
        if (isActive())
            m_cachedDead = false;
    }

    bool Mortality::dieOfOldAge(const uint64_t tick)
    {
        if (!isActive())
            return false;
        m_machine.transition(MortalState::Dead, tick, "old_age");
        m_cause = DeathCause::OldAge;
        return true;
    }

    bool Mortality::remove(const DeathCause cause, const uint64_t tick)
    {
        if (auto r = m_machine.tryTransition(MortalState::Removed, tick, std::string(toString(cause))); !r)
        {
            logger()->debug("remove skipped: {}", r.error());
            return false;
        }
        m_cause = cause;
        return true;
    }

    std::string Mortality::deathLabel(const DeathContext &ctx) const
    {
        if (m_cause != DeathCause::None)
            return std::string(toString(m_cause));

        if (ctx.energy <= 0.0)
            return std::string(toString(recentPredatorEncounter(ctx.tick) ? DeathCause::Predation
                                                                            : DeathCause::Starvation));
        if (ctx.reachedMaxAge)
            return std::string(toString(DeathCause::OldAge));

        std::string label = "unknown_";
        label += toString(state());
        if (m_cachedDead)
            label += "_cached";
        if (m_hasPredatorEncounter)
            label += "_predator";
        return label;
    }

    void Mortality::forceState(const MortalState state, const DeathCause cause, const uint64_t tick,
                               const std::string &reason)
    {
        logger()->debug("forcing mortal state {} -> {} ({})", toString(m_machine.state()), toString(state), reason);
        m_machine.forceState(state, tick, reason);
        m_cause = state == MortalState::Active ? DeathCause::None : cause;
    }
} // namespace aqua
