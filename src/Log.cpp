#include "aqua/Log.hpp"

#include <cstdlib>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace aqua
{
    std::shared_ptr<spdlog::logger> logger()
    {
        static std::shared_ptr<spdlog::logger> instance = []
        {
            auto l = spdlog::get("aqua");
            if (!l)
                l = spdlog::stdout_color_mt("aqua");

            l->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
            if (const char *env = std::getenv("AQUA_LOG_LEVEL"))
                l->set_level(spdlog::level::from_str(env));
            else
                l->set_level(spdlog::level::info);
            return l;
        }();
        return instance;
    }
} // namespace aqua
