//
// Created by LYS on 9/24/2026.
//

#include "Logger.hxx"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string& Name)
{
    if (auto Existing = spdlog::get(Name))
        return Existing;

    auto Logger = spdlog::stderr_color_mt(Name);
    Logger->set_level(spdlog::get_level());
    return Logger;
}

void ApplyLogLevel(const std::string& LevelName)
{
    const auto Level = spdlog::level::from_str(LevelName);
    if (Level == spdlog::level::off && LevelName != "off") {
        spdlog::warn("Unknown log level \"{}\", keeping {}", LevelName, spdlog::level::to_string_view(spdlog::get_level()));
        return;
    }

    spdlog::set_level(Level);
}
