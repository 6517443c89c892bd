//
// Created by LYS on 9/25/2026.
//

#include "SessionConfig.hxx"

#include <Util/Assertions.hxx>
#include <Util/Logger.hxx>

#include <spdlog/spdlog.h>

#include <yaml-cpp/yaml.h>

#include <fstream>

namespace {

SSessionConfig FromNode(const YAML::Node& Root)
{
    SSessionConfig Result;

    Result.LogLevel = Root["log_level"].as<std::string>(Result.LogLevel);

    if (const auto Dataset = Root["dataset"]) {
        Result.RowCount = Dataset["row_count"].as<std::size_t>(Result.RowCount);
    }

    if (const auto Prefetch = Root["prefetch"]) {
        Result.Prefetch.ExpandNumerator = Prefetch["expand_numerator"].as<std::size_t>(Result.Prefetch.ExpandNumerator);
        Result.Prefetch.ExpandDenominator = Prefetch["expand_denominator"].as<std::size_t>(Result.Prefetch.ExpandDenominator);
        Result.TrackPendingRequests = Prefetch["track_pending"].as<bool>(Result.TrackPendingRequests);
    }

    if (const auto Viewport = Root["viewport"]) {
        Result.RowHeight = Viewport["row_height"].as<float>(Result.RowHeight);
        if (const auto Size = Viewport["size"]; Size.IsSequence() && Size.size() == 2) {
            Result.ViewportSize = { Size[0].as<float>(), Size[1].as<float>() };
        } else if (Size.IsDefined()) {
            GetOrCreateLogger("Config")->warn("viewport.size must be [width, height], keeping {}x{}", Result.ViewportSize.x, Result.ViewportSize.y);
        }
    }

    LV_MAKE_SURE(Result.Prefetch.ExpandDenominator != 0, "prefetch.expand_denominator must be positive")
    LV_MAKE_SURE(Result.RowHeight > 0, "viewport.row_height must be positive")

    return Result;
}

}

SSessionConfig SSessionConfig::LoadFrom(const std::filesystem::path& Path)
{
    GetOrCreateLogger("Config")->info("Loading session config: {}", Path.string());

    return FromNode(YAML::LoadFile(Path.string()));
}

SSessionConfig SSessionConfig::LoadFromString(const std::string_view Yaml)
{
    return FromNode(YAML::Load(std::string { Yaml }));
}

void SSessionConfig::SaveTo(const std::filesystem::path& Path) const
{
    YAML::Node Root;

    Root["log_level"] = LogLevel;
    Root["dataset"]["row_count"] = RowCount;

    Root["prefetch"]["expand_numerator"] = Prefetch.ExpandNumerator;
    Root["prefetch"]["expand_denominator"] = Prefetch.ExpandDenominator;
    Root["prefetch"]["track_pending"] = TrackPendingRequests;

    Root["viewport"]["row_height"] = RowHeight;
    Root["viewport"]["size"].SetStyle(YAML::EmitterStyle::Flow);
    Root["viewport"]["size"].push_back(ViewportSize.x);
    Root["viewport"]["size"].push_back(ViewportSize.y);

    std::ofstream fout(Path);
    LV_MAKE_SURE(fout.good(), "Failed to open " + Path.string() + " for writing")
    fout << Root;
}
