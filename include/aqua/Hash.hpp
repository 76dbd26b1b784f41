#pragma once
#include <cstdint>
#include <string_view>

namespace aqua
{
    inline uint64_t fnv1a64(const std::string_view s, uint64_t h = 1469598103934665603ULL)
    {
        for (const unsigned char c : s)
        {
            h ^= static_cast<uint64_t>(c);
            h *= 1099511628211ULL;
        }
        return h;
    }
} // namespace aqua
