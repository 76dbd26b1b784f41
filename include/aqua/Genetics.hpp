#pragma once
#include <string>

#include "Random.hpp"

namespace aqua
{
    // Heritable traits. Only their effect on the economy is modelled here.
    struct Genome
    {
        std::string species = "tetra";

        float sizeModifier       = 1.0f;  // scales body size and max energy
        float lifespanModifier   = 1.0f;  // scales base lifespan
        float metabolismModifier = 1.0f;  // scales base metabolism
        float asexualChance      = 0.02f; // per-tick roll when asexually eligible
    };

    struct TraitRange
    {
        float min;
        float max;
    };

    inline constexpr TraitRange SizeModifierRange{0.7f, 1.3f};
    inline constexpr TraitRange LifespanModifierRange{0.8f, 1.2f};
    inline constexpr TraitRange MetabolismModifierRange{0.7f, 1.3f};
    inline constexpr TraitRange AsexualChanceRange{0.0f, 0.1f};

    // Genome construction used by reproduction and emergency spawns.
    class Genetics
    {
        public:
            virtual ~Genetics() = default;

            virtual Genome randomGenome(Rng &rng) const = 0;
            virtual Genome mutate(const Genome &parent, float rate, float strength, Rng &rng) const = 0;
            // weightA is the chance each trait is inherited from a.
            virtual Genome crossover(const Genome &a, float weightA, const Genome &b, Rng &rng) const = 0;
    };

    class TraitGenetics final : public Genetics
    {
        public:
            Genome randomGenome(Rng &rng) const override;
            Genome mutate(const Genome &parent, float rate, float strength, Rng &rng) const override;
            Genome crossover(const Genome &a, float weightA, const Genome &b, Rng &rng) const override;
    };

    // Clamps every trait into its range.
    Genome clampGenome(Genome g);
} // namespace aqua
