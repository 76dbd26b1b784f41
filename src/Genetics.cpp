#include "aqua/Genetics.hpp"
#include "aqua/Math.hpp"

namespace aqua
{
    namespace
    {
        float mutateTrait(const float v, const TraitRange r, const float rate, const float strength, Rng &rng)
        {
            if (!rng.chance(rate))
                return v;
            // strength is relative to the width of the trait range
            const float sd = strength * (r.max - r.min);
            if (sd <= 0.f)
                return v;
            return clampf(v + rng.gaussian(0.f, sd), r.min, r.max);
        }

        float pick(const float a, const float b, const float weightA, Rng &rng)
        {
            return rng.chance(weightA) ? a : b;
        }
    } // namespace

    Genome clampGenome(Genome g)
    {
        g.sizeModifier       = clampf(g.sizeModifier, SizeModifierRange.min, SizeModifierRange.max);
        g.lifespanModifier   = clampf(g.lifespanModifier, LifespanModifierRange.min, LifespanModifierRange.max);
        g.metabolismModifier = clampf(g.metabolismModifier, MetabolismModifierRange.min, MetabolismModifierRange.max);
        g.asexualChance      = clampf(g.asexualChance, AsexualChanceRange.min, AsexualChanceRange.max);
        return g;
    }

    Genome TraitGenetics::randomGenome(Rng &rng) const
    {
        Genome g;
        g.sizeModifier       = rng.uniform(SizeModifierRange.min, SizeModifierRange.max);
        g.lifespanModifier   = rng.uniform(LifespanModifierRange.min, LifespanModifierRange.max);
        g.metabolismModifier = rng.uniform(MetabolismModifierRange.min, MetabolismModifierRange.max);
        g.asexualChance      = rng.uniform(AsexualChanceRange.min, AsexualChanceRange.max);
        return g;
    }

    Genome TraitGenetics::mutate(const Genome &parent, const float rate, const float strength, Rng &rng) const
    {
        Genome g             = parent;
        g.sizeModifier       = mutateTrait(g.sizeModifier, SizeModifierRange, rate, strength, rng);
        g.lifespanModifier   = mutateTrait(g.lifespanModifier, LifespanModifierRange, rate, strength, rng);
        g.metabolismModifier = mutateTrait(g.metabolismModifier, MetabolismModifierRange, rate, strength, rng);
        g.asexualChance      = mutateTrait(g.asexualChance, AsexualChanceRange, rate, strength, rng);
        return clampGenome(g);
    }

    Genome TraitGenetics::crossover(const Genome &a, const float weightA, const Genome &b, Rng &rng) const
    {
        Genome g;
        g.species            = a.species;
        g.sizeModifier       = pick(a.sizeModifier, b.sizeModifier, weightA, rng);
        g.lifespanModifier   = pick(a.lifespanModifier, b.lifespanModifier, weightA, rng);
        g.metabolismModifier = pick(a.metabolismModifier, b.metabolismModifier, weightA, rng);
        g.asexualChance      = pick(a.asexualChance, b.asexualChance, weightA, rng);
        return clampGenome(g);
    }
} // namespace aqua
