//
// Created by LYS on 9/24/2026.
//

#pragma once

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

/// Returns the registered logger with this name, or registers a new colored stderr logger
std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string& Name);

/// Applies a spdlog level name ("trace", "debug", "info", ...) to every registered logger and the default one
void ApplyLogLevel(const std::string& LevelName);
