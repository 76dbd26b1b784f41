#pragma once
#include <algorithm>
#include <cstdint>

namespace aqua
{
    // Per-run movement statistics. Owned by the tank and reset with it.
    class Diagnostics
    {
        public:
            void recordVelocity(const float speed)
            {
                ++m_samples;
                m_sum += speed;
                m_max = std::max(m_max, speed);
                if (speed <= 0.f)
                    ++m_stationary;
            }

            [[nodiscard]] uint64_t samples() const
            {
                return m_samples;
            }

            [[nodiscard]] double meanSpeed() const
            {
                return m_samples ? m_sum / static_cast<double>(m_samples) : 0.0;
            }

            [[nodiscard]] float maxSpeed() const
            {
                return m_max;
            }

            [[nodiscard]] uint64_t stationarySamples() const
            {
                return m_stationary;
            }

            void reset()
            {
                *this = Diagnostics{};
            }

        private:
            uint64_t m_samples    = 0;
            uint64_t m_stationary = 0;
            double   m_sum        = 0.0;
            float    m_max        = 0.f;
    };
} // namespace aqua
