#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace aqua
{
    // Shared "aqua" logger. Level comes from AQUA_LOG_LEVEL (trace..off), info by default.
    std::shared_ptr<spdlog::logger> logger();
} // namespace aqua
