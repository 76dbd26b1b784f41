#pragma once
#include <cstdint>
#include <random>

namespace aqua
{
    // The single stochastic stream of a simulation run. Passed explicitly to
    // every consumer so a fixed seed reproduces the whole run.
    class Rng
    {
        public:
            explicit Rng(const uint64_t seed = 1234567ULL): m_rng(seed)
            {
            }

            void seed(const uint64_t s)
            {
                m_rng.seed(s);
            }

            float uniform(const float a = 0.f, const float b = 1.f)
            {
                std::uniform_real_distribution d(a, b);
                return d(m_rng);
            }

            int uniformInt(const int a, const int b)
            {
                std::uniform_int_distribution d(a, b);
                return d(m_rng);
            }

            bool chance(const float p)
            {
                return uniform() < p;
            }

            float gaussian(const float mean, const float stddev)
            {
                std::normal_distribution d(mean, stddev);
                return d(m_rng);
            }

        private:
            std::mt19937_64 m_rng;
    };
} // namespace aqua
