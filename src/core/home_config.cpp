#include "core/home_config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace hearth::config
{
namespace
{
constexpr char kConfigFile[] = "assets/config/home.json";

int PositiveInt(const nlohmann::json& json, const char* key, int fallback)
{
    if (!json.contains(key))
    {
        return fallback;
    }
    const auto& value = json[key];
    constexpr auto kMax = static_cast<unsigned long long>(std::numeric_limits<int>::max());
    const bool inRange = value.is_number_unsigned()
                             ? value.get<unsigned long long>() > 0 && value.get<unsigned long long>() <= kMax
                             : value.is_number_integer() && value.get<long long>() > 0
                                   && static_cast<unsigned long long>(value.get<long long>()) <= kMax;
    if (!inRange)
    {
        throw std::runtime_error(std::string{"Config value "} + key + " must be a positive integer no larger than "
                                 + std::to_string(kMax) + ".");
    }
    return value.get<int>();
}

std::filesystem::path PathValue(const nlohmann::json& json, const char* key, const std::filesystem::path& fallback)
{
    if (!json.contains(key))
    {
        return fallback;
    }
    if (!json[key].is_string())
    {
        throw std::runtime_error(std::string{"Config value "} + key + " must be a string path.");
    }
    return std::filesystem::path{json[key].get<std::string>()};
}

void ParseWindow(const nlohmann::json& document, HomeConfig& config)
{
    if (!document.contains("window"))
    {
        return;
    }

    const auto& window = document["window"];
    if (!window.is_object())
    {
        throw std::runtime_error("Config section window must be an object.");
    }
    if (window.contains("title"))
    {
        if (!window["title"].is_string())
        {
            throw std::runtime_error("Config value title must be a string.");
        }
        config.window.title = window["title"].get<std::string>();
    }
    config.window.width = PositiveInt(window, "width", config.window.width);
    config.window.height = PositiveInt(window, "height", config.window.height);
}

void ParseGrid(const nlohmann::json& document, HomeConfig& config)
{
    if (!document.contains("grid"))
    {
        return;
    }

    const auto& grid = document["grid"];
    if (!grid.is_object())
    {
        throw std::runtime_error("Config section grid must be an object.");
    }

    auto readCount = [&grid](const char* key, std::size_t fallback) -> std::size_t {
        if (!grid.contains(key))
        {
            return fallback;
        }
        if (!grid[key].is_number_integer() || grid[key].get<long long>() < 0)
        {
            throw std::runtime_error(std::string{"Config value grid."} + key + " must be a non-negative integer.");
        }
        return grid[key].get<std::size_t>();
    };

    config.grid.columns = readCount("columns", config.grid.columns);
    config.grid.visibleRows = readCount("visibleRows", config.grid.visibleRows);
    if (grid.contains("contentPadding"))
    {
        if (!grid["contentPadding"].is_number())
        {
            throw std::runtime_error("Config value grid.contentPadding must be a number.");
        }
        config.grid.contentPadding = grid["contentPadding"].get<float>();
    }

    try
    {
        layout::Validate(config.grid);
    }
    catch (const std::invalid_argument& ex)
    {
        throw std::runtime_error(std::string{"Invalid grid configuration: "} + ex.what());
    }
}
} // namespace

HomeConfig Parse(const nlohmann::json& document)
{
    if (!document.is_object())
    {
        throw std::runtime_error("Config document must be a JSON object.");
    }

    HomeConfig config;
    ParseWindow(document, config);
    ParseGrid(document, config);
    config.libraryPath = PathValue(document, "library", config.libraryPath);
    config.backgroundPath = PathValue(document, "background", config.backgroundPath);
    config.fontPath = PathValue(document, "font", config.fontPath);
    config.fontSize = PositiveInt(document, "fontSize", config.fontSize);
    config.titleBarHeight = PositiveInt(document, "titleBarHeight", config.titleBarHeight);
    return config;
}

HomeConfig Load(const std::filesystem::path& path)
{
    std::error_code error;
    if (!std::filesystem::exists(path, error))
    {
        return HomeConfig{};
    }

    std::ifstream input{path};
    if (!input.is_open())
    {
        throw std::runtime_error("Unable to open config file: " + path.string());
    }

    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(input, nullptr, true, true);
    }
    catch (const nlohmann::json::parse_error& ex)
    {
        throw std::runtime_error("Failed to parse config file " + path.string() + ": " + ex.what());
    }

    return Parse(document);
}

std::filesystem::path DefaultPath()
{
    if (const char* envPath = std::getenv("HEARTH_CONFIG_PATH"); envPath != nullptr && *envPath != '\0')
    {
        return std::filesystem::path{envPath};
    }
    return std::filesystem::path{kConfigFile};
}

} // namespace hearth::config
