//
// Created by LYS on 9/25/2026.
//

#include "SessionConfig.hxx"

#include <catch2/catch.hpp>

#include <yaml-cpp/exceptions.h>

#include <filesystem>

TEST_CASE("Config defaults")
{
    const auto Config = SSessionConfig::LoadFromString("");

    CHECK(Config.LogLevel == "info");
    CHECK(Config.RowCount == 1000);
    CHECK(Config.Prefetch.ExpandNumerator == 1);
    CHECK(Config.Prefetch.ExpandDenominator == 2);
    CHECK(Config.TrackPendingRequests);
    CHECK(Config.RowHeight == Approx(20));
    CHECK(Config.ViewportSize.x == Approx(800));
    CHECK(Config.ViewportSize.y == Approx(600));
}

TEST_CASE("Config from yaml")
{
    const auto Config = SSessionConfig::LoadFromString(R"(
log_level: debug
dataset:
  row_count: 250
prefetch:
  expand_numerator: 3
  expand_denominator: 4
  track_pending: false
viewport:
  row_height: 32.5
  size: [1024, 768]
)");

    CHECK(Config.LogLevel == "debug");
    CHECK(Config.RowCount == 250);
    CHECK(Config.Prefetch.ExpandNumerator == 3);
    CHECK(Config.Prefetch.ExpandDenominator == 4);
    CHECK_FALSE(Config.TrackPendingRequests);
    CHECK(Config.RowHeight == Approx(32.5));
    CHECK(Config.ViewportSize.x == Approx(1024));
    CHECK(Config.ViewportSize.y == Approx(768));
}

TEST_CASE("Config keeps defaults for missing keys")
{
    const auto Config = SSessionConfig::LoadFromString(R"(
prefetch:
  expand_numerator: 2
viewport:
  size: 12
)");

    CHECK(Config.Prefetch.ExpandNumerator == 2);
    CHECK(Config.Prefetch.ExpandDenominator == 2);
    CHECK(Config.ViewportSize.x == Approx(800));
    CHECK(Config.RowCount == 1000);
}

TEST_CASE("Config rejects invalid values")
{
    CHECK_THROWS_AS(SSessionConfig::LoadFromString("prefetch: { expand_denominator: 0 }"), std::runtime_error);
    CHECK_THROWS_AS(SSessionConfig::LoadFromString("viewport: { row_height: -3 }"), std::runtime_error);
    CHECK_THROWS_AS(SSessionConfig::LoadFromString("prefetch: [unclosed"), YAML::Exception);
}

TEST_CASE("Config ignores values of the wrong type")
{
    const auto Config = SSessionConfig::LoadFromString("dataset: { row_count: many }");
    CHECK(Config.RowCount == 1000);
}

TEST_CASE("Config survives a save and load")
{
    SSessionConfig Config;
    Config.LogLevel = "warn";
    Config.RowCount = 42;
    Config.Prefetch = { 1, 3 };
    Config.ViewportSize = { 320, 240 };

    const auto Path = std::filesystem::temp_directory_path() / "LazyViewConfigTest.yaml";
    Config.SaveTo(Path);

    const auto Loaded = SSessionConfig::LoadFrom(Path);
    std::filesystem::remove(Path);

    CHECK(Loaded.LogLevel == "warn");
    CHECK(Loaded.RowCount == 42);
    CHECK(Loaded.Prefetch.ExpandDenominator == 3);
    CHECK(Loaded.ViewportSize.y == Approx(240));
}

TEST_CASE("Config from missing file")
{
    CHECK_THROWS_AS(SSessionConfig::LoadFrom(std::filesystem::temp_directory_path() / "LazyViewDoesNotExist.yaml"), YAML::BadFile);
}
