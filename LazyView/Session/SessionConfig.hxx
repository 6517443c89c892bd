//
// Created by LYS on 9/25/2026.
//

#pragma once

#include <LazyView/Prefetch/PrefetchPlanner.hxx>

#include <filesystem>
#include <string>
#include <string_view>

#include <glm/vec2.hpp>

struct SSessionConfig {

    // spdlog level name
    std::string LogLevel = "info";

    // Number of records the remote list holds
    std::size_t RowCount = 1000;

    SPrefetchPolicy Prefetch;

    // Skip ranges already requested when planning the next one
    bool TrackPendingRequests = true;

    // Pixel height of a single row, must be positive
    float RowHeight = 20;

    glm::vec2 ViewportSize { 800, 600 };

    /**
     *
     * Load from a YAML file, keys left out keep their default
     *
     * @param Path File to read
     * @return Parsed config
     */
    static SSessionConfig LoadFrom(const std::filesystem::path& Path);
    static SSessionConfig LoadFromString(std::string_view Yaml);

    void SaveTo(const std::filesystem::path& Path) const;
};
