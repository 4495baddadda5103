#include "tabula/config.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

namespace
{
std::filesystem::path temp_path(std::string_view stem)
{
    return std::filesystem::temp_directory_path() /
           std::filesystem::path(std::string(stem) + "-" +
                                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
}

std::filesystem::path write_temp_config(std::string_view contents)
{
    auto path = temp_path("tabula-config");
    path += ".json";
    std::ofstream file(path);
    file << contents;
    return path;
}
} // namespace

TEST(ConfigLoaderTests, ReturnsDefaultsWhenFileMissing)
{
    auto config = tabula::config::ConfigLoader::load_from_file("/nonexistent/tabula.json");
    EXPECT_EQ(config.tiles.corner, "+");
    EXPECT_EQ(config.tiles.label_width, 9);
    EXPECT_FALSE(config.fill.enabled);
    EXPECT_EQ(config.default_nature, "body");
}

TEST(ConfigLoaderTests, ParsesKnownKeys)
{
    auto path = write_temp_config(R"({
        "default_nature": "header",
        "drawing": {"corner": "*", "label_width": 5},
        "fill": {"enabled": true, "placeholder": "-", "nature": "filler"},
        "unknown": 42
    })");

    auto config = tabula::config::ConfigLoader::load_from_file(path);
    EXPECT_EQ(config.default_nature, "header");
    EXPECT_EQ(config.tiles.corner, "*");
    EXPECT_EQ(config.tiles.horizontal, "-");
    EXPECT_EQ(config.tiles.label_width, 5);
    EXPECT_TRUE(config.fill.enabled);
    EXPECT_EQ(config.fill.placeholder, "-");
    EXPECT_EQ(config.fill.nature, "filler");
    std::filesystem::remove(path);
}

TEST(ConfigLoaderTests, IgnoresWrongTypesAndMalformedFiles)
{
    auto path = write_temp_config(R"({"drawing": {"label_width": "wide", "vertical": 1}, "fill": true})");
    auto config = tabula::config::ConfigLoader::load_from_file(path);
    EXPECT_EQ(config.tiles.label_width, 9);
    EXPECT_EQ(config.tiles.vertical, "|");
    EXPECT_FALSE(config.fill.enabled);
    std::filesystem::remove(path);

    auto broken = write_temp_config("{ not json");
    EXPECT_EQ(tabula::config::ConfigLoader::load_from_file(broken).tiles.corner, "+");
    std::filesystem::remove(broken);
}

TEST(ConfigLoaderTests, SaveThenLoadKeepsValues)
{
    auto dir = temp_path("tabula-config-dir");
    auto path = dir / "nested" / "tabula.json";

    tabula::config::Config config;
    config.tiles.vertical = "!";
    config.fill.enabled = true;
    config.fill.placeholder = "n/a";
    ASSERT_TRUE(tabula::config::ConfigLoader::save_to_file(config, path));

    auto loaded = tabula::config::ConfigLoader::load_from_file(path);
    EXPECT_EQ(loaded.tiles.vertical, "!");
    EXPECT_TRUE(loaded.fill.enabled);
    EXPECT_EQ(loaded.fill.placeholder, "n/a");
    std::filesystem::remove_all(dir);
}

TEST(ConfigLoaderTests, DefaultPathFollowsXdgConfigHome)
{
    const char *previous = std::getenv("XDG_CONFIG_HOME");
    std::string saved = previous ? previous : "";

    setenv("XDG_CONFIG_HOME", "/tmp/tabula-xdg", 1);
    EXPECT_EQ(tabula::config::ConfigLoader::default_config_path(),
              std::filesystem::path("/tmp/tabula-xdg") / "tabula" / "tabula.json");

    if (previous)
        setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else
        unsetenv("XDG_CONFIG_HOME");
}
