#include "aqua/Reproduction.hpp"
#include "aqua/Log.hpp"

#include <algorithm>
#include <exception>

namespace aqua
{
    ReproductionOrchestrator::ReproductionOrchestrator(const TankConfig &cfg, EntityLifecycle &lifecycle,
                                                       const SpatialWorld &world, EnergyRouter &router,
                                                       const Genetics &genetics, Rng &rng)
        : m_cfg(cfg), m_lifecycle(lifecycle), m_world(world), m_router(router), m_genetics(genetics), m_rng(rng)
    {
    }

    ReproductionTickStats ReproductionOrchestrator::update(const uint64_t tick, const std::vector<Agent *> &snapshot)
    {
        for (Agent *a : snapshot)
            if (ReproductionLedger *r = a->reproduction())
                r->tickCooldown();

        ReproductionTickStats stats;
        std::size_t           count = m_lifecycle.population();

        for (Agent *a : snapshot)
        {
            if (!belowCap(count))
                break;
            if (tryBankedAsexual(*a))
            {
                ++count;
                ++stats.bankedAsexual;
            }
        }

        for (Agent *a : snapshot)
        {
            if (!belowCap(count))
                break;
            if (tryTraitAsexual(*a))
            {
                ++count;
                ++stats.traitAsexual;
            }
        }

        if (trySpawnEmergency(tick, count))
            ++stats.emergencySpawns;

        // The template used by the next extinction comes from this tick's survivors.
        registerTemplate(snapshot);
        return stats;
    }

    double ReproductionOrchestrator::babyCost() const
    {
        return capacityForSize(m_cfg.energy, m_cfg.lifecycle.babySize);
    }

    bool ReproductionOrchestrator::hasCredits(const Agent &a) const
    {
        const double required = m_cfg.reproduction.reproCreditRequired;
        if (required <= 0.0)
            return true;
        const ReproductionLedger *r = a.reproduction();
        return r && r->hasReproCredits(required);
    }

    bool ReproductionOrchestrator::belowCap(const std::size_t count) const
    {
        return count < static_cast<std::size_t>(m_cfg.ecosystem.maxPopulation);
    }

    bool ReproductionOrchestrator::isValidMate(const Agent &a) const
    {
        const auto *e = a.energy();
        const auto *l = a.lifecycle();
        const auto *r = a.reproduction();
        if (!e || !l || !r || !a.isActive())
            return false;
        return l->isAdult() && r->cooldown() == 0 && e->ratio() >= m_cfg.reproduction.sexualEnergyRatio;
    }

    Vec2 ReproductionOrchestrator::jitterAround(const Vec2 p, const float jitter)
    {
        return m_world.clamp(p + Vec2{m_rng.uniform(-jitter, jitter), m_rng.uniform(-jitter, jitter)});
    }

    void ReproductionOrchestrator::registerTemplate(const std::vector<Agent *> &snapshot)
    {
        const Agent *best      = nullptr;
        double       bestRatio = -1.0;
        for (const Agent *a : snapshot)
        {
            if (a->kind() != AgentKind::Fish || !a->isActive() || !a->energy())
                continue;
            if (const double r = a->energy()->ratio(); r > bestRatio)
            {
                best      = a;
                bestRatio = r;
            }
        }
        if (best)
        {
            m_template           = best->genome();
            m_templateGeneration = best->generation();
        }
    }

    bool ReproductionOrchestrator::tryBankedAsexual(Agent &parent)
    {
        ReproductionLedger    *repro = parent.reproduction();
        LifecycleStateMachine *life  = parent.lifecycle();
        EnergyLedger          *energy = parent.energy();
        if (!repro || !life || !energy || !parent.isActive())
            return false;
        if (!life->isAdult() || repro->cooldown() > 0 || repro->overflowBank() < babyCost() || !hasCredits(parent))
            return false;

        const Genome genome = m_genetics.mutate(parent.genome(), m_cfg.reproduction.asexualMutationRate,
                                                m_cfg.reproduction.asexualMutationStrength, m_rng);
        const double funded = repro->consumeBank(babyCapacity(m_cfg, genome));
        const AgentId id    = m_lifecycle.nextAgentId();

        auto baby = Agent::makeFish(id, m_cfg, genome, jitterAround(parent.position(), OffspringJitter), funded,
                                    parent.generation() + 1, parent.id());
        if (!submit(std::move(baby), SpawnReason::BankedAsexual))
        {
            repro->bankOverflow(funded, energy->max() * m_cfg.energy.bankMultiplier);
            return false;
        }

        repro->consumeReproCredits(m_cfg.reproduction.reproCreditRequired);
        repro->setCooldownAtLeast(m_cfg.reproduction.cooldownTicks);
        ++m_debug.bankedSpawns;
        logger()->debug("agent {} spent {:.1f} banked energy on baby {}", parent.id(), funded, id);
        return true;
    }

    bool ReproductionOrchestrator::tryTraitAsexual(Agent &parent)
    {
        const ReproductionLedger    *repro  = parent.reproduction();
        const LifecycleStateMachine *life   = parent.lifecycle();
        const EnergyLedger          *energy = parent.energy();
        if (!repro || !life || !energy || !parent.isActive())
            return false;

        if (!repro->canAsexuallyReproduce(life->stage(), energy->current(), energy->max()) || !hasCredits(parent))
            return false;
        ++m_debug.asexualChecks;
        if (!m_rng.chance(parent.genome().asexualChance))
            return false;

        return spawnSelfFunded(parent, SpawnReason::TraitAsexual).has_value();
    }

    std::optional<AgentId> ReproductionOrchestrator::spawnSelfFunded(Agent &parent, const SpawnReason reason)
    {
        ReproductionLedger *repro = parent.reproduction();

        const AsexualOffspring offspring = repro->triggerAsexual(parent.genome(), m_genetics, m_rng);
        ++m_debug.asexualTriggered;

        const double wanted = std::min(parent.energy()->current() * offspring.energyTransferFraction,
                                       babyCapacity(m_cfg, offspring.genome));
        const double paid   = -m_router.modifyEnergy(parent, -wanted, "asexual_reproduction");
        const AgentId id    = m_lifecycle.nextAgentId();

        auto baby = Agent::makeFish(id, m_cfg, offspring.genome, jitterAround(parent.position(), OffspringJitter), paid,
                                    parent.generation() + 1, parent.id());
        if (!submit(std::move(baby), reason))
        {
            m_router.modifyEnergy(parent, paid, "asexual_reproduction_refund");
            return std::nullopt;
        }

        repro->consumeReproCredits(m_cfg.reproduction.reproCreditRequired);
        logger()->debug("agent {} reproduced asexually ({}), baby {}", parent.id(), toString(reason), id);
        return id;
    }

    bool ReproductionOrchestrator::trySpawnEmergency(const uint64_t tick, const std::size_t count)
    {
        if (count == 0)
        {
            logger()->info("population extinct at tick {}, spawning from {}", tick,
                           m_template ? "template" : "random genome");
            return spawnEmergency(tick);
        }
        if (!belowCap(count))
            return false;
        if (m_debug.lastEmergencyTick &&
            tick - *m_debug.lastEmergencyTick < static_cast<uint64_t>(m_cfg.ecosystem.emergencySpawnCooldown))
            return false;

        const auto critical = static_cast<std::size_t>(m_cfg.ecosystem.criticalPopulation);
        double     p        = 1.0;
        if (count >= critical)
        {
            const double ratio = static_cast<double>(count - critical) /
                                 static_cast<double>(m_cfg.ecosystem.maxPopulation - m_cfg.ecosystem.criticalPopulation);
            p = (1.0 - ratio) * (1.0 - ratio) * static_cast<double>(m_cfg.ecosystem.emergencySpawnScale);
        }
        if (!m_rng.chance(static_cast<float>(p)))
            return false;
        return spawnEmergency(tick);
    }

    bool ReproductionOrchestrator::spawnEmergency(const uint64_t tick)
    {
        const Genome genome = m_template ? m_genetics.mutate(*m_template, m_cfg.reproduction.asexualMutationRate,
                                                             m_cfg.reproduction.asexualMutationStrength, m_rng)
                                         : m_genetics.randomGenome(m_rng);

        const Bounds b      = m_world.bounds();
        const auto   margin = static_cast<float>(m_cfg.ecosystem.spawnMargin);
        const Vec2   pos{m_rng.uniform(b.min.x + margin, b.max.x - margin),
                       m_rng.uniform(b.min.y + margin, b.max.y - margin)};

        const AgentId id = m_lifecycle.nextAgentId();
        const uint32_t generation = m_template ? m_templateGeneration : 0;
        if (!submit(Agent::makeFish(id, m_cfg, genome, pos, std::nullopt, generation), SpawnReason::Emergency))
            return false;

        ++m_debug.emergencySpawns;
        m_debug.lastEmergencyTick = tick;
        logger()->info("emergency spawn: agent {} at tick {}", id, tick);
        return true;
    }

    std::optional<AgentId> ReproductionOrchestrator::handleInteractionOutcome(const InteractionOutcome &outcome)
    {
        if (outcome.tie || outcome.participants.size() < 2 || !outcome.winner)
            return std::nullopt;

        Agent *winner = m_lifecycle.findAgent(*outcome.winner);
        if (!winner || !isValidMate(*winner) || !hasCredits(*winner))
            return std::nullopt;
        if (!belowCap(m_lifecycle.population()))
        {
            logger()->debug("population cap reached, no offspring for agent {}", winner->id());
            return std::nullopt;
        }

        std::vector<Agent *> mates;
        for (const AgentId pid : outcome.participants)
        {
            if (pid == winner->id())
                continue;
            Agent *m = m_lifecycle.findAgent(pid);
            if (!m || m->species() != winner->species() || !isValidMate(*m))
                continue;
            if (len(m->position() - winner->position()) > m_cfg.reproduction.matingDistance)
                continue;
            mates.push_back(m);
        }
        if (mates.empty())
            return std::nullopt;

        Agent &mate = *mates[static_cast<std::size_t>(m_rng.uniformInt(0, static_cast<int>(mates.size()) - 1))];

        const ReproductionConfig &rc     = m_cfg.reproduction;
        const Genome              genome = m_genetics.mutate(
            m_genetics.crossover(winner->genome(), rc.crossoverWinnerWeight, mate.genome(), m_rng),
            rc.sexualMutationRate, rc.sexualMutationStrength, m_rng);

        double       fromWinner = winner->energy()->current() * rc.parentContribution;
        double       fromMate   = mate.energy()->current() * rc.parentContribution;
        const double capacity   = babyCapacity(m_cfg, genome);
        if (const double total = fromWinner + fromMate; total > capacity && total > 0.0)
        {
            const double scale = capacity / total;
            fromWinner *= scale;
            fromMate *= scale;
        }

        const double paidWinner = -m_router.modifyEnergy(*winner, -fromWinner, "sexual_reproduction");
        const double paidMate   = -m_router.modifyEnergy(mate, -fromMate, "sexual_reproduction");

        const Vec2    mid = (winner->position() + mate.position()) * 0.5f;
        const AgentId id  = m_lifecycle.nextAgentId();
        auto          baby = Agent::makeFish(id, m_cfg, genome, jitterAround(mid, MateJitter), paidWinner + paidMate,
                                             std::max(winner->generation(), mate.generation()) + 1, winner->id());

        if (!submit(std::move(baby), SpawnReason::Sexual))
        {
            m_router.modifyEnergy(*winner, paidWinner, "sexual_reproduction_refund");
            m_router.modifyEnergy(mate, paidMate, "sexual_reproduction_refund");
            return std::nullopt;
        }

        winner->reproduction()->consumeReproCredits(rc.reproCreditRequired);
        winner->reproduction()->setCooldownAtLeast(rc.cooldownTicks);
        mate.reproduction()->setCooldownAtLeast(rc.cooldownTicks);
        ++m_debug.sexualSpawns;
        logger()->debug("agents {} and {} produced baby {}", winner->id(), mate.id(), id);
        return id;
    }

    std::optional<AgentId> ReproductionOrchestrator::handleSoloWin(const AgentId winnerId)
    {
        Agent *winner = m_lifecycle.findAgent(winnerId);
        if (!winner || !winner->isActive() || !winner->reproduction() || !winner->lifecycle() || !winner->energy())
            return std::nullopt;

        const EnergyLedger *e = winner->energy();
        if (!winner->reproduction()->canAsexuallyReproduce(winner->lifecycle()->stage(), e->current(), e->max()) ||
            !hasCredits(*winner) || !belowCap(m_lifecycle.population()))
            return std::nullopt;

        auto id = spawnSelfFunded(*winner, SpawnReason::SoloWin);
        if (id)
            ++m_debug.soloSpawns;
        return id;
    }

    bool ReproductionOrchestrator::submit(std::unique_ptr<Agent> baby, const SpawnReason reason)
    {
        const AgentId id = baby->id();
        try
        {
            if (m_lifecycle.requestSpawn(std::move(baby), reason))
                return true;
            logger()->debug("spawn of agent {} ({}) rejected", id, toString(reason));
        }
        catch (const std::exception &e)
        {
            logger()->warn("spawn of agent {} ({}) failed: {}", id, toString(reason), e.what());
        }
        ++m_debug.rejectedSpawns;
        return false;
    }

    void ReproductionOrchestrator::reset()
    {
        m_template.reset();
        m_templateGeneration = 0;
        m_debug = {};
    }
} // namespace aqua
