#pragma once
#include "global/globals.hpp"

#include "spdlog/spdlog.h"
template <typename... Args>
inline void log_commands(spdlog::format_string_t<Args...> fmt, Args&&... args)
{
    if (config().log.commands)
        spdlog::info(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_events(spdlog::format_string_t<Args...> fmt, Args&&... args)
{
    if (config().log.events)
        spdlog::info(fmt, std::forward<Args>(args)...);
}
