#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace aqua
{
    // State enums used with StateMachine provide an ADL-visible toString(S).

    template <typename S>
    using TransitionTable = std::map<S, std::vector<S>>;

    template <typename S>
    struct TransitionRecord
    {
        S           from{};
        S           to{};
        uint64_t    tick   = 0;
        std::string reason;
        bool        forced = false;
    };

    class InvalidTransition : public std::logic_error
    {
        public:
            using std::logic_error::logic_error;
    };

    template <typename S>
    class TransitionResult
    {
        public:
            static TransitionResult ok(const S state)
            {
                TransitionResult r;
                r.m_ok    = true;
                r.m_state = state;
                return r;
            }

            static TransitionResult err(std::string message)
            {
                TransitionResult r;
                r.m_error = std::move(message);
                return r;
            }

            explicit operator bool() const
            {
                return m_ok;
            }

            [[nodiscard]] bool isOk() const
            {
                return m_ok;
            }

            [[nodiscard]] S value() const
            {
                return m_state;
            }

            [[nodiscard]] const std::string &error() const
            {
                return m_error;
            }

        private:
            bool        m_ok = false;
            S           m_state{};
            std::string m_error;
    };

    template <typename S>
    class StateMachine
    {
        public:
            static constexpr std::size_t DefaultHistory = 100;

            StateMachine(const S initial, TransitionTable<S> table, const bool trackHistory = false,
                         const std::size_t maxHistory = DefaultHistory)
                : m_state(initial), m_table(std::move(table)), m_trackHistory(trackHistory),
                  m_maxHistory(std::max<std::size_t>(1, maxHistory))
            {
                if (!m_table.contains(initial))
                    throw std::invalid_argument("initial state " + std::string(toString(initial)) +
                                                " is not in the transition table");
            }

            [[nodiscard]] S state() const
            {
                return m_state;
            }

            [[nodiscard]] bool canTransition(const S target) const
            {
                const auto it = m_table.find(m_state);
                if (it == m_table.end())
                    return false;
                return std::find(it->second.begin(), it->second.end(), target) != it->second.end();
            }

            TransitionResult<S> tryTransition(const S target, const uint64_t tick = 0, const std::string &reason = {})
            {
                if (!canTransition(target))
                {
                    std::string msg = "Invalid transition: " + std::string(toString(m_state)) + " -> " +
                                      std::string(toString(target)) + ". Valid targets from " +
                                      std::string(toString(m_state)) + ": [";
                    const auto targets = validTargets();
                    for (std::size_t i = 0; i < targets.size(); ++i)
                    {
                        if (i > 0)
                            msg += ", ";
                        msg += toString(targets[i]);
                    }
                    msg += "]";
                    return TransitionResult<S>::err(std::move(msg));
                }

                const S from = m_state;
                m_state      = target;
                record(from, target, tick, reason, false);
                return TransitionResult<S>::ok(target);
            }

            // Throwing variant. Only for call sites where a rejected transition is a bug.
            S transition(const S target, const uint64_t tick = 0, const std::string &reason = {})
            {
                auto r = tryTransition(target, tick, reason);
                if (!r)
                    throw InvalidTransition(r.error());
                return r.value();
            }

            void forceState(const S state, const uint64_t tick = 0, const std::string &reason = "forced")
            {
                const S from = m_state;
                m_state      = state;
                record(from, state, tick, "[forced] " + reason, true);
            }

            [[nodiscard]] std::vector<S> validTargets() const
            {
                const auto it = m_table.find(m_state);
                return it == m_table.end() ? std::vector<S>{} : it->second;
            }

            [[nodiscard]] const std::deque<TransitionRecord<S>> &history() const
            {
                return m_history;
            }

            [[nodiscard]] bool tracksHistory() const
            {
                return m_trackHistory;
            }

        private:
            S                                 m_state;
            TransitionTable<S>                m_table;
            bool                              m_trackHistory;
            std::size_t                       m_maxHistory;
            std::deque<TransitionRecord<S>>   m_history;

            void record(const S from, const S to, const uint64_t tick, std::string reason, const bool forced)
            {
                if (!m_trackHistory)
                    return;
                m_history.push_back(TransitionRecord<S>{from, to, tick, std::move(reason), forced});
                while (m_history.size() > m_maxHistory)
                    m_history.pop_front();
            }
    };
} // namespace aqua
