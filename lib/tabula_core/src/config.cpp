#include "tabula/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace tabula::config
{
namespace
{
using json = nlohmann::json;

void read_string(const json &object, const char *key, std::string &target)
{
    auto it = object.find(key);
    if (it != object.end() && it->is_string())
        target = it->get<std::string>();
}

void read_bool(const json &object, const char *key, bool &target)
{
    auto it = object.find(key);
    if (it != object.end() && it->is_boolean())
        target = it->get<bool>();
}

void read_width(const json &object, const char *key, int &target)
{
    auto it = object.find(key);
    if (it != object.end() && it->is_number_integer())
    {
        int value = it->get<int>();
        if (value > 0)
            target = value;
    }
}
} // namespace

std::filesystem::path ConfigLoader::default_config_path()
{
    std::filesystem::path config_home;
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        config_home = std::filesystem::path(xdg) / "tabula";
    else if (const char *home = std::getenv("HOME"); home && *home)
        config_home = std::filesystem::path(home) / ".config" / "tabula";
    else
        config_home = std::filesystem::current_path();

    return config_home / "tabula.json";
}

Config ConfigLoader::load_from_file(const std::filesystem::path &path)
{
    Config config;

    std::ifstream stream(path);
    if (!stream)
        return config;

    json root = json::parse(stream, nullptr, false);
    if (root.is_discarded() || !root.is_object())
        return config;

    read_string(root, "default_nature", config.default_nature);

    if (auto it = root.find("drawing"); it != root.end() && it->is_object())
    {
        read_string(*it, "corner", config.tiles.corner);
        read_string(*it, "horizontal", config.tiles.horizontal);
        read_string(*it, "vertical", config.tiles.vertical);
        read_width(*it, "label_width", config.tiles.label_width);
    }

    if (auto it = root.find("fill"); it != root.end() && it->is_object())
    {
        read_bool(*it, "enabled", config.fill.enabled);
        read_string(*it, "placeholder", config.fill.placeholder);
        read_string(*it, "nature", config.fill.nature);
    }

    return config;
}

Config ConfigLoader::load_or_default()
{
    return load_from_file(default_config_path());
}

bool ConfigLoader::save_to_file(const Config &config, const std::filesystem::path &path)
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return false;
    }

    std::ofstream out(path);
    if (!out.is_open())
        return false;

    json root = {
        {"default_nature", config.default_nature},
        {"drawing",
         {{"corner", config.tiles.corner},
          {"horizontal", config.tiles.horizontal},
          {"vertical", config.tiles.vertical},
          {"label_width", config.tiles.label_width}}},
        {"fill",
         {{"enabled", config.fill.enabled},
          {"placeholder", config.fill.placeholder},
          {"nature", config.fill.nature}}},
    };
    out << root.dump(2) << '\n';
    return static_cast<bool>(out);
}

} // namespace tabula::config
