#include "aqua/Collaborators.hpp"

namespace aqua
{
    std::string_view toString(const SpawnReason r)
    {
        switch (r)
        {
            case SpawnReason::Initial:
                return "initial";
            case SpawnReason::BankedAsexual:
                return "banked_asexual";
            case SpawnReason::TraitAsexual:
                return "trait_asexual";
            case SpawnReason::Sexual:
                return "sexual";
            case SpawnReason::SoloWin:
                return "solo_win";
            case SpawnReason::Emergency:
                return "emergency";
            case SpawnReason::Overflow:
                return "overflow";
            case SpawnReason::Feeder:
                return "feeder";
            case SpawnReason::Restore:
                return "restore";
        }
        return "?";
    }
} // namespace aqua
