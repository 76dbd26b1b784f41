#include "aqua/Lifecycle.hpp"
#include "aqua/Log.hpp"
#include "aqua/Math.hpp"

#include <algorithm>

namespace aqua
{
    std::string_view toString(const LifeStage s)
    {
        switch (s)
        {
            case LifeStage::Baby:
                return "Baby";
            case LifeStage::Juvenile:
                return "Juvenile";
            case LifeStage::Adult:
                return "Adult";
            case LifeStage::Elder:
                return "Elder";
        }
        return "?";
    }

    const TransitionTable<LifeStage> &lifeStageTransitions()
    {
        static const TransitionTable<LifeStage> table = {
            {LifeStage::Baby, {LifeStage::Juvenile}},
            {LifeStage::Juvenile, {LifeStage::Adult}},
            {LifeStage::Adult, {LifeStage::Elder}},
            {LifeStage::Elder, {}},
        };
        return table;
    }

    LifecycleStateMachine::LifecycleStateMachine(const LifecycleConfig &cfg, const int64_t maxAge,
                                                 const float geneticSizeModifier)
        : m_cfg(cfg), m_maxAge(maxAge), m_geneticSizeModifier(geneticSizeModifier),
          m_size(cfg.babySize * geneticSizeModifier),
          m_machine(LifeStage::Baby, lifeStageTransitions(), cfg.trackHistory)
    {
    }

    LifeStage LifecycleStateMachine::targetStageFor(const int64_t age) const
    {
        if (age < m_cfg.babyMaxAge)
            return LifeStage::Baby;
        if (age < m_cfg.juvenileMaxAge)
            return LifeStage::Juvenile;
        if (age < m_cfg.adultMaxAge)
            return LifeStage::Adult;
        return LifeStage::Elder;
    }

    void LifecycleStateMachine::incrementAge(const uint64_t tick)
    {
        advance(m_age + 1, tick);
    }

    void LifecycleStateMachine::advance(const int64_t age, const uint64_t tick)
    {
        // Age never runs backwards.
        m_age = std::max(m_age, age);

        const LifeStage target = targetStageFor(m_age);
        for (int step = 0; step < MaxAdvanceSteps && stage() < target; ++step)
        {
            const auto next = static_cast<LifeStage>(static_cast<uint8_t>(stage()) + 1);
            auto       r    = m_machine.tryTransition(next, tick, "aged to " + std::to_string(m_age) + " ticks");
            if (!r)
            {
                logger()->warn("lifecycle transition failed: {}", r.error());
                break;
            }
        }

        recomputeSize();
    }

    void LifecycleStateMachine::forceStage(const LifeStage stage, const uint64_t tick, const std::string &reason)
    {
        if (stage < this->stage())
            logger()->warn("forcing life stage backwards {} -> {} ({})", toString(this->stage()), toString(stage),
                           reason);
        else
            logger()->debug("forcing life stage {} -> {} ({})", toString(this->stage()), toString(stage), reason);

        m_machine.forceState(stage, tick, reason);
        recomputeSize();
    }

    void LifecycleStateMachine::recomputeSize()
    {
        float base = m_cfg.adultSize;
        if (stage() == LifeStage::Baby)
        {
            const float t = m_cfg.babyMaxAge > 0
                                ? clampf(static_cast<float>(m_age) / static_cast<float>(m_cfg.babyMaxAge), 0.f, 1.f)
                                : 1.f;
            base = lerpf(m_cfg.babySize, m_cfg.adultSize, t);
        }
        m_size = base * m_geneticSizeModifier;
    }
} // namespace aqua
