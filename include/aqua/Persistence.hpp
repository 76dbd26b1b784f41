#pragma once
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Agent.hpp"
#include "Config.hpp"

namespace aqua
{
    inline constexpr int         RecordFormatVersion = 1;
    inline constexpr const char *RecordFormatName    = "aqua-agents";

    // Flat snapshot of one agent. Enough to rebuild every ledger without replay.
    struct AgentRecord
    {
        int                    version = RecordFormatVersion;
        AgentId                id      = 0;
        AgentKind              kind    = AgentKind::Fish;
        uint32_t               generation = 0;
        std::optional<AgentId> parentId;
        Genome                 genome;

        double energy         = 0.0;
        double maxEnergy      = 0.0;
        double baseMetabolism = 0.0;

        int64_t   age    = 0;
        int64_t   maxAge = 0;
        LifeStage stage  = LifeStage::Baby;

        int    cooldown     = 0;
        double overflowBank = 0.0;
        double reproCredits = 0.0;

        MortalState             mortalState = MortalState::Active;
        DeathCause              deathCause  = DeathCause::None;
        std::optional<uint64_t> lastPredatorEncounter;

        Vec2 position;
    };

    AgentRecord            makeRecord(const Agent &agent);
    std::unique_ptr<Agent> restoreAgent(const AgentRecord &record, const TankConfig &cfg);

    bool saveRecords(const std::vector<AgentRecord> &records, std::ostream &out, uint64_t tick = 0);
    // Leaves records and tick untouched unless the whole stream parses and its checksum matches.
    bool loadRecords(std::istream &in, std::vector<AgentRecord> &records, uint64_t *tick = nullptr);

    bool saveRecords(const std::vector<AgentRecord> &records, const std::string &path, uint64_t tick = 0);
    bool loadRecords(const std::string &path, std::vector<AgentRecord> &records, uint64_t *tick = nullptr);
} // namespace aqua
