#pragma once
#include <cstdint>
#include <string_view>
#include <vector>

#include "Config.hpp"
#include "StateMachine.hpp"

namespace aqua
{
    enum class LifeStage : uint8_t
    {
        Baby,
        Juvenile,
        Adult,
        Elder
    };

    std::string_view toString(LifeStage s);

    // Forward-only: Baby -> Juvenile -> Adult -> Elder. Death lives in Mortality.
    const TransitionTable<LifeStage> &lifeStageTransitions();

    class LifecycleStateMachine
    {
        public:
            static constexpr int MaxAdvanceSteps = 3;

            LifecycleStateMachine(const LifecycleConfig &cfg, int64_t maxAge, float geneticSizeModifier = 1.f);

            // One tick older, then advance().
            void incrementAge(uint64_t tick = 0);

            // Walks the stage forward to the one implied by `age`, one adjacent step at a time.
            void advance(int64_t age, uint64_t tick = 0);

            // Bypasses the table (restore/testing). Logged; recorded as forced.
            void forceStage(LifeStage stage, uint64_t tick = 0, const std::string &reason = "forced");

            [[nodiscard]] LifeStage stage() const
            {
                return m_machine.state();
            }

            [[nodiscard]] int64_t age() const
            {
                return m_age;
            }

            [[nodiscard]] int64_t maxAge() const
            {
                return m_maxAge;
            }

            [[nodiscard]] float size() const
            {
                return m_size;
            }

            [[nodiscard]] float geneticSizeModifier() const
            {
                return m_geneticSizeModifier;
            }

            [[nodiscard]] bool isBaby() const
            {
                return stage() == LifeStage::Baby;
            }

            [[nodiscard]] bool isJuvenile() const
            {
                return stage() == LifeStage::Juvenile;
            }

            [[nodiscard]] bool isAdult() const
            {
                return stage() == LifeStage::Adult;
            }

            [[nodiscard]] bool isElder() const
            {
                return stage() == LifeStage::Elder;
            }

            [[nodiscard]] bool isDyingOfOldAge() const
            {
                return m_age >= m_maxAge;
            }

            [[nodiscard]] double ageRatio() const
            {
                return m_maxAge > 0 ? static_cast<double>(m_age) / static_cast<double>(m_maxAge) : 0.0;
            }

            [[nodiscard]] std::string_view stageName() const
            {
                return toString(stage());
            }

            [[nodiscard]] std::vector<LifeStage> validNextStages() const
            {
                return m_machine.validTargets();
            }

            [[nodiscard]] const std::deque<TransitionRecord<LifeStage>> &history() const
            {
                return m_machine.history();
            }

            [[nodiscard]] LifeStage targetStageFor(int64_t age) const;

        private:
            LifecycleConfig         m_cfg;
            int64_t                 m_age = 0;
            int64_t                 m_maxAge;
            float                   m_geneticSizeModifier;
            float                   m_size;
            StateMachine<LifeStage> m_machine;

            void recomputeSize();
    };
} // namespace aqua
