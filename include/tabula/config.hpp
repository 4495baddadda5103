#pragma once

#include "tabula/drawing.hpp"
#include "tabula/styled.hpp"

#include <filesystem>
#include <string>

namespace tabula::config
{
struct FillConfig
{
    bool enabled = false;
    std::string placeholder;
    std::string nature = kBodyNature;
};

struct Config
{
    TileSet tiles;
    FillConfig fill;
    std::string default_nature = kBodyNature;
};

class ConfigLoader
{
public:
    static std::filesystem::path default_config_path();
    static Config load_from_file(const std::filesystem::path &path);
    static Config load_or_default();
    static bool save_to_file(const Config &config, const std::filesystem::path &path);
};
} // namespace tabula::config
