#include "aqua/Persistence.hpp"
#include "aqua/Hash.hpp"
#include "aqua/Log.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace aqua
{
    namespace
    {
        template <typename E>
        E enumFrom(const std::string &val, const E last)
        {
            const int v = std::stoi(val);
            if (v < 0 || v > static_cast<int>(last))
                throw std::out_of_range("enum value out of range: " + val);
            return static_cast<E>(v);
        }

        template <typename E>
        int enumTo(const E e)
        {
            return static_cast<int>(e);
        }

        void writeRecord(std::ostream &f, const AgentRecord &r)
        {
            f << "[agent]\n";
            f << "id=" << r.id << "\n";
            f << "kind=" << enumTo(r.kind) << "\n";
            f << "generation=" << r.generation << "\n";
            if (r.parentId)
                f << "parent=" << *r.parentId << "\n";
            f << "species=" << r.genome.species << "\n";
            f << "gene_size=" << r.genome.sizeModifier << "\n";
            f << "gene_lifespan=" << r.genome.lifespanModifier << "\n";
            f << "gene_metabolism=" << r.genome.metabolismModifier << "\n";
            f << "gene_asexual=" << r.genome.asexualChance << "\n";
            f << "energy=" << r.energy << "\n";
            f << "max_energy=" << r.maxEnergy << "\n";
            f << "base_metabolism=" << r.baseMetabolism << "\n";
            f << "age=" << r.age << "\n";
            f << "max_age=" << r.maxAge << "\n";
            f << "stage=" << enumTo(r.stage) << "\n";
            f << "cooldown=" << r.cooldown << "\n";
            f << "bank=" << r.overflowBank << "\n";
            f << "credits=" << r.reproCredits << "\n";
            f << "mortal=" << enumTo(r.mortalState) << "\n";
            f << "cause=" << enumTo(r.deathCause) << "\n";
            if (r.lastPredatorEncounter)
                f << "predator_tick=" << *r.lastPredatorEncounter << "\n";
            f << "x=" << r.position.x << "\n";
            f << "y=" << r.position.y << "\n";
            f << "[end]\n";
        }

        void readField(AgentRecord &r, const std::string &key, const std::string &val)
        {
            if (key == "id") r.id = std::stoull(val);
            else if (key == "kind") r.kind = enumFrom(val, AgentKind::Microbe);
            else if (key == "generation") r.generation = static_cast<uint32_t>(std::stoul(val));
            else if (key == "parent") r.parentId = std::stoull(val);
            else if (key == "species") r.genome.species = val;
            else if (key == "gene_size") r.genome.sizeModifier = std::stof(val);
            else if (key == "gene_lifespan") r.genome.lifespanModifier = std::stof(val);
            else if (key == "gene_metabolism") r.genome.metabolismModifier = std::stof(val);
            else if (key == "gene_asexual") r.genome.asexualChance = std::stof(val);
            else if (key == "energy") r.energy = std::stod(val);
            else if (key == "max_energy") r.maxEnergy = std::stod(val);
            else if (key == "base_metabolism") r.baseMetabolism = std::stod(val);
            else if (key == "age") r.age = std::stoll(val);
            else if (key == "max_age") r.maxAge = std::stoll(val);
            else if (key == "stage") r.stage = enumFrom(val, LifeStage::Elder);
            else if (key == "cooldown") r.cooldown = std::stoi(val);
            else if (key == "bank") r.overflowBank = std::stod(val);
            else if (key == "credits") r.reproCredits = std::stod(val);
            else if (key == "mortal") r.mortalState = enumFrom(val, MortalState::Removed);
            else if (key == "cause") r.deathCause = enumFrom(val, DeathCause::Migration);
            else if (key == "predator_tick") r.lastPredatorEncounter = std::stoull(val);
            else if (key == "x") r.position.x = std::stof(val);
            else if (key == "y") r.position.y = std::stof(val);
            // unknown keys are skipped so newer writers stay readable
        }

        std::string hex(const uint64_t h)
        {
            std::ostringstream oss;
            oss << std::hex << std::setw(16) << std::setfill('0') << h;
            return oss.str();
        }
    } // namespace

    AgentRecord makeRecord(const Agent &agent)
    {
        AgentRecord r;
        r.id         = agent.id();
        r.kind       = agent.kind();
        r.generation = agent.generation();
        r.parentId   = agent.parentId();
        r.genome     = agent.genome();
        r.position   = agent.position();

        if (const EnergyLedger *e = agent.energy())
        {
            r.energy         = e->current();
            r.maxEnergy      = e->max();
            r.baseMetabolism = e->baseMetabolism();
        }
        if (const LifecycleStateMachine *l = agent.lifecycle())
        {
            r.age    = l->age();
            r.maxAge = l->maxAge();
            r.stage  = l->stage();
        }
        if (const ReproductionLedger *rep = agent.reproduction())
        {
            r.cooldown     = rep->cooldown();
            r.overflowBank = rep->overflowBank();
            r.reproCredits = rep->reproCredits();
        }
        if (const Mortality *m = agent.mortality())
        {
            r.mortalState = m->state();
            r.deathCause  = m->cause();
            if (m->hasPredatorEncounter())
                r.lastPredatorEncounter = m->lastPredatorEncounter();
        }
        return r;
    }

    std::unique_ptr<Agent> restoreAgent(const AgentRecord &record, const TankConfig &cfg)
    {
        auto a = std::make_unique<Agent>(record.id, record.kind, record.genome, record.position);
        a->setLineage(record.generation, record.parentId);

        if (record.kind == AgentKind::Fish)
        {
            LifecycleStateMachine life(cfg.lifecycle, record.maxAge, record.genome.sizeModifier);
            life.forceStage(record.stage, 0, "restore");
            life.advance(record.age);
            a->attach(std::move(life));

            ReproductionLedger repro(cfg.reproduction);
            repro.restore(record.cooldown, record.overflowBank, record.reproCredits);
            a->attach(std::move(repro));
        }

        a->attach(EnergyLedger(cfg.energy, record.maxEnergy, record.baseMetabolism, record.energy));

        Mortality mortality(cfg.ecosystem.predatorEncounterWindow, cfg.lifecycle.trackHistory);
        if (record.lastPredatorEncounter)
            mortality.markPredatorEncounter(*record.lastPredatorEncounter);
        if (record.mortalState != MortalState::Active)
            mortality.forceState(record.mortalState, record.deathCause, 0, "restore");
        a->attach(std::move(mortality));
        return a;
    }

    bool saveRecords(const std::vector<AgentRecord> &records, std::ostream &out, const uint64_t tick)
    {
        std::ostringstream body;
        body << std::setprecision(std::numeric_limits<double>::max_digits10);
        body << "format=" << RecordFormatName << "\n";
        body << "version=" << RecordFormatVersion << "\n";
        body << "tick=" << tick << "\n";
        body << "count=" << records.size() << "\n";
        for (const auto &r : records)
            writeRecord(body, r);

        const std::string text = body.str();
        out << text << "checksum=" << hex(fnv1a64(text)) << "\n";
        return static_cast<bool>(out);
    }

    bool loadRecords(std::istream &in, std::vector<AgentRecord> &records, uint64_t *tick)
    {
        std::string body;
        std::string checksum;
        std::string line;
        while (std::getline(in, line))
        {
            if (line.rfind("checksum=", 0) == 0)
            {
                checksum = line.substr(9);
                break;
            }
            body += line;
            body += '\n';
        }
        if (checksum.empty() || checksum != hex(fnv1a64(body)))
        {
            logger()->warn("agent records rejected: checksum mismatch");
            return false;
        }

        std::vector<AgentRecord> tmp; // in case of partial read
        uint64_t                 tmpTick  = 0;
        std::size_t              expected = 0;
        bool                     formatOk = false;
        bool                     inAgent  = false;

        try
        {
            std::istringstream lines(body);
            while (std::getline(lines, line))
            {
                if (line == "[agent]")
                {
                    if (inAgent)
                        return false;
                    tmp.emplace_back();
                    inAgent = true;
                    continue;
                }
                if (line == "[end]")
                {
                    if (!inAgent)
                        return false;
                    inAgent = false;
                    continue;
                }

                const auto pos = line.find('=');
                if (pos == std::string::npos)
                    continue;
                const std::string key = line.substr(0, pos);
                const std::string val = line.substr(pos + 1);

                if (inAgent)
                    readField(tmp.back(), key, val);
                else if (key == "format")
                    formatOk = val == RecordFormatName;
                else if (key == "version" && std::stoi(val) != RecordFormatVersion)
                {
                    logger()->warn("agent records rejected: unsupported version {}", val);
                    return false;
                }
                else if (key == "tick")
                    tmpTick = std::stoull(val);
                else if (key == "count")
                    expected = std::stoull(val);
            }
        }
        catch (const std::exception &e)
        {
            logger()->warn("agent records rejected: {}", e.what());
            return false;
        }

        if (!formatOk || inAgent || tmp.size() != expected)
            return false;

        records = std::move(tmp);
        if (tick)
            *tick = tmpTick;
        return true;
    }

    bool saveRecords(const std::vector<AgentRecord> &records, const std::string &path, const uint64_t tick)
    {
        std::ofstream f(path);
        if (!f)
            return false;
        return saveRecords(records, static_cast<std::ostream &>(f), tick);
    }

    bool loadRecords(const std::string &path, std::vector<AgentRecord> &records, uint64_t *tick)
    {
        std::ifstream f(path);
        if (!f)
            return false;
        return loadRecords(static_cast<std::istream &>(f), records, tick);
    }
} // namespace aqua
