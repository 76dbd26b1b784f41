#include "aqua/Tank.hpp"
#include "aqua/Log.hpp"
#include "aqua/Persistence.hpp"

#include <algorithm>
#include <cmath>

namespace aqua
{
    Tank::Tank(const TankConfig &cfg, const uint64_t seed)
        : m_cfg(cfg), m_rng(seed), m_router(m_cfg.energy, *this, *this, m_rng, &m_tracker),
          m_reproduction(m_cfg, *this, *this, m_router, m_genetics, m_rng)
    {
        m_cfg.validate();
    }

    Vec2 Tank::randomPosition(const float margin)
    {
        const Bounds b = bounds();
        return {m_rng.uniform(b.min.x + margin, b.max.x - margin), m_rng.uniform(b.min.y + margin, b.max.y - margin)};
    }

    void Tank::seedInitial(const int n)
    {
        m_agents.reserve(m_agents.size() + static_cast<std::size_t>(std::max(0, n)));
        const auto margin = static_cast<float>(m_cfg.ecosystem.spawnMargin);

        for (int i = 0; i < n; ++i)
        {
            Agent &a = insert(Agent::makeFish(nextAgentId(), m_cfg, m_genetics.randomGenome(m_rng),
                                              randomPosition(margin)));
            const float s = m_cfg.ecosystem.maxSpeed * 0.3f;
            a.setVelocity({m_rng.uniform(-s, s), m_rng.uniform(-s, s)});

            // Mixed ages so the first generation does not move in lockstep.
            a.lifecycle()->advance(m_rng.uniformInt(0, static_cast<int>(m_cfg.lifecycle.adultMaxAge / 2)));
            m_router.syncCapacity(a, capacityForSize(m_cfg.energy, a.size()), "growth");

            const double target = a.energy()->max() * m_cfg.energy.initialEnergyRatio;
            m_router.modifyEnergy(a, target - a.energy()->current(), "seed");
        }
        logger()->info("seeded {} fish", n);
    }

    Agent &Tank::insert(std::unique_ptr<Agent> agent)
    {
        m_nextId = std::max(m_nextId, agent->id() + 1);
        m_agents.push_back(std::move(agent));
        return *m_agents.back();
    }

    void Tank::step()
    {
        ++m_tick;
        m_router.setTick(m_tick);

        const std::vector<Agent *> snapshot = liveAgents();
        for (Agent *a : snapshot)
            updateAgent(*a);

        for (Agent *a : snapshot)
        {
            if (const Mortality *m = a->mortality(); m && m->isDead())
                requestRemove(a->id(), m->cause());
        }

        m_lastReproduction = m_reproduction.update(m_tick, snapshot);
        runFeeder();

        m_tracker.advanceTick();
        flush();
    }

    void Tank::updateAgent(Agent &a)
    {
        if (!a.isActive())
            return;

        if (LifecycleStateMachine *life = a.lifecycle())
        {
            life->incrementAge(m_tick);
            if (const EnergyLedger *e = a.energy())
            {
                if (const double cap = capacityForSize(m_cfg.energy, life->size()); cap != e->max())
                    m_router.syncCapacity(a, cap, "growth");
            }

            if (life->isDyingOfOldAge())
            {
                if (Mortality *m = a.mortality())
                {
                    m->dieOfOldAge(m_tick);
                    return;
                }
                // Without a mortality component nothing can record the death.
                logger()->debug("agent {} outlived max age {} without mortality", a.id(), life->maxAge());
            }
        }

        move(a);

        if (const EnergyLedger *e = a.energy())
        {
            feed(a);

            const LifeStage  stage = a.lifecycle() ? a.lifecycle()->stage() : LifeStage::Adult;
            const EnergyBurn burn  = e->calculateBurn(a.velocity(), m_cfg.ecosystem.maxSpeed, stage, 1.0, a.size());
            m_router.modifyEnergy(a, -burn.total, "metabolism");
        }

        m_diagnostics.recordVelocity(len(a.velocity()));
    }

    void Tank::move(Agent &a)
    {
        const float j = m_cfg.ecosystem.wanderJitter;
        Vec2 v = clampVec(a.velocity() + Vec2{m_rng.gaussian(0.f, j), m_rng.gaussian(0.f, j)},
                          m_cfg.ecosystem.maxSpeed);

        const Vec2 wanted  = a.position() + v;
        const Vec2 clamped = clamp(wanted);
        if (clamped.x != wanted.x)
            v.x = -v.x;
        if (clamped.y != wanted.y)
            v.y = -v.y;

        a.setPosition(clamped);
        a.setVelocity(v);
    }

    void Tank::feed(Agent &a)
    {
        const float r2 = m_cfg.ecosystem.foodEatRadius * m_cfg.ecosystem.foodEatRadius;
        for (auto &f : m_food)
        {
            if (f.energy <= 0.0 || len2(f.position - a.position()) > r2)
                continue;
            const double e = f.energy;
            f.energy       = 0.0;
            m_router.modifyEnergy(a, e, "food");
            return;
        }
    }

    void Tank::runFeeder()
    {
        if (m_food.size() + m_pendingFood.size() >= static_cast<std::size_t>(m_cfg.ecosystem.maxFood))
            return;
        if (!m_rng.chance(m_cfg.ecosystem.foodSpawnChance))
            return;
        requestSpawnFood(Food{randomPosition(0.f), m_cfg.ecosystem.foodEnergy, std::nullopt}, SpawnReason::Feeder);
    }

    void Tank::flush()
    {
        for (const auto &[id, cause] : m_pendingRemovals)
        {
            const auto it = std::find_if(m_agents.begin(), m_agents.end(),
                                         [id](const auto &a) { return a->id() == id; });
            if (it == m_agents.end())
                continue;

            std::string label(toString(cause));
            if (const Mortality *m = (*it)->mortality())
            {
                const EnergyLedger *e = (*it)->energy();
                const auto         *l = (*it)->lifecycle();
                label = m->deathLabel({e ? e->current() : 0.0, l && l->isDyingOfOldAge(), m_tick});
            }
            logger()->debug("agent {} removed at tick {}: {}", id, m_tick, label);

            ++m_deaths;
            ++m_deathsByCause[static_cast<std::size_t>(cause)];
            m_agents.erase(it);
        }
        m_pendingRemovals.clear();

        for (auto &[agent, reason] : m_pendingSpawns)
        {
            logger()->trace("agent {} born ({})", agent->id(), toString(reason));
            m_agents.push_back(std::move(agent));
            ++m_births;
        }
        m_pendingSpawns.clear();

        std::erase_if(m_food, [](const Food &f) { return f.energy <= 0.0; });
        m_food.insert(m_food.end(), m_pendingFood.begin(), m_pendingFood.end());
        m_pendingFood.clear();
    }

    std::optional<AgentId> Tank::applyInteraction(const InteractionOutcome &outcome)
    {
        return m_reproduction.handleInteractionOutcome(outcome);
    }

    std::optional<AgentId> Tank::applySoloWin(const AgentId winner)
    {
        return m_reproduction.handleSoloWin(winner);
    }

    bool Tank::grantReproCredits(const AgentId id, const double amount)
    {
        Agent *a = findAgent(id);
        if (!a || !a->reproduction())
            return false;
        return a->reproduction()->addReproCredits(amount) > 0.0;
    }

    bool Tank::markPredatorEncounter(const AgentId id)
    {
        Agent *a = findAgent(id);
        if (!a || !a->mortality())
            return false;
        a->mortality()->markPredatorEncounter(m_tick);
        return true;
    }

    bool Tank::migrate(const AgentId id)
    {
        Agent *a = findAgent(id);
        if (!a || !a->mortality() || !a->mortality()->remove(DeathCause::Migration, m_tick))
            return false;
        return requestRemove(id, DeathCause::Migration);
    }

    bool Tank::addFood(const Vec2 position, const double energy)
    {
        return requestSpawnFood(Food{clamp(position), energy, std::nullopt}, SpawnReason::Feeder);
    }

    TankStats Tank::stats() const
    {
        TankStats s;
        s.tick = m_tick;
        for (const auto &a : m_agents)
        {
            if (!a->isActive())
                continue;
            ++s.population;
            if (a->kind() == AgentKind::Fish)
                ++s.fish;
            else
                ++s.microbes;
            if (const EnergyLedger *e = a->energy())
                s.agentEnergy += e->current();
            if (const ReproductionLedger *r = a->reproduction())
                s.bankedEnergy += r->overflowBank();
        }
        s.food = m_food.size();
        for (const auto &f : m_food)
            s.foodEnergy += f.energy;
        s.lostEnergy       = m_router.lostEnergy();
        s.births           = m_births;
        s.deaths           = m_deaths;
        s.deathsByCause    = m_deathsByCause;
        s.lastReproduction = m_lastReproduction;
        return s;
    }

    void Tank::clearRun(const uint64_t tick)
    {
        m_agents.clear();
        m_food.clear();
        m_pendingSpawns.clear();
        m_pendingFood.clear();
        m_pendingRemovals.clear();

        m_tick   = tick;
        m_nextId = 1;
        m_births = 0;
        m_deaths = 0;
        m_deathsByCause.fill(0);
        m_lastReproduction = {};

        m_router.setTick(tick);
        m_router.resetLostEnergy();
        m_tracker.reset();
        m_diagnostics.reset();
        m_reproduction.reset();
    }

    void Tank::reset(const uint64_t seed, const int n)
    {
        clearRun(0);
        m_rng.seed(seed);
        seedInitial(n);
    }

    bool Tank::save(const std::string &path) const
    {
        std::vector<AgentRecord> records;
        records.reserve(m_agents.size());
        for (const auto &a : m_agents)
            records.push_back(makeRecord(*a));
        return saveRecords(records, path, m_tick);
    }

    bool Tank::load(const std::string &path)
    {
        std::vector<AgentRecord> records;
        uint64_t                 tick = 0;
        if (!loadRecords(path, records, &tick))
            return false;

        clearRun(tick);
        for (const auto &r : records)
            insert(restoreAgent(r, m_cfg));

        logger()->info("loaded {} agents at tick {} from {}", records.size(), tick, path);
        return true;
    }

    bool Tank::requestSpawn(std::unique_ptr<Agent> agent, const SpawnReason reason)
    {
        if (!agent)
            return false;
        if (population() >= static_cast<std::size_t>(m_cfg.ecosystem.maxPopulation))
        {
            logger()->debug("spawn ({}) rejected: population cap {}", toString(reason),
                            m_cfg.ecosystem.maxPopulation);
            return false;
        }
        m_nextId = std::max(m_nextId, agent->id() + 1);
        m_pendingSpawns.emplace_back(std::move(agent), reason);
        return true;
    }

    bool Tank::requestSpawnFood(const Food &food, SpawnReason)
    {
        if (food.energy <= 0.0)
            return false;
        m_pendingFood.push_back(Food{clamp(food.position), food.energy, food.source});
        return true;
    }

    bool Tank::requestRemove(const AgentId id, const DeathCause cause)
    {
        if (!findAgent(id))
            return false;
        const bool pending = std::any_of(m_pendingRemovals.begin(), m_pendingRemovals.end(),
                                         [id](const auto &p) { return p.first == id; });
        if (pending)
            return false;
        m_pendingRemovals.emplace_back(id, cause);
        return true;
    }

    std::vector<Agent *> Tank::liveAgents()
    {
        std::vector<Agent *> out;
        out.reserve(m_agents.size());
        for (const auto &a : m_agents)
            if (a->isActive())
                out.push_back(a.get());
        return out;
    }

    Agent *Tank::findAgent(const AgentId id)
    {
        for (const auto &a : m_agents)
            if (a->id() == id)
                return a.get();
        return nullptr;
    }

    std::size_t Tank::population() const
    {
        const auto active = std::count_if(m_agents.begin(), m_agents.end(),
                                          [](const auto &a) { return a->isActive(); });
        return static_cast<std::size_t>(active) + m_pendingSpawns.size();
    }

    AgentId Tank::nextAgentId()
    {
        return m_nextId++;
    }

    Bounds Tank::bounds() const
    {
        return Bounds{{0.f, 0.f}, {m_cfg.ecosystem.tankWidth, m_cfg.ecosystem.tankHeight}};
    }
} // namespace aqua
