#include "core/game_library.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <string_view>
#include <utility>

namespace hearth
{
namespace
{
std::string DescribeEntry(std::size_t index, const nlohmann::json& json)
{
    if (json.is_object() && json.contains("uuid") && json["uuid"].is_string())
    {
        return "Game \"" + json["uuid"].get<std::string>() + "\"";
    }
    return "Game #" + std::to_string(index);
}

std::string RequireString(const std::string& entry, const nlohmann::json& json, const char* key)
{
    if (!json.contains(key) || !json[key].is_string() || json[key].get<std::string>().empty())
    {
        throw std::runtime_error(entry + " requires a non-empty " + key + ".");
    }
    return json[key].get<std::string>();
}

std::optional<std::string> OptionalString(const std::string& entry, const nlohmann::json& json, const char* key)
{
    if (!json.contains(key) || json[key].is_null())
    {
        return std::nullopt;
    }
    if (!json[key].is_string())
    {
        throw std::runtime_error(entry + " must declare " + key + " as a string.");
    }
    return json[key].get<std::string>();
}

std::vector<std::string> StringArray(const std::string& entry, const nlohmann::json& json, const char* key)
{
    std::vector<std::string> values;
    if (!json.contains(key))
    {
        return values;
    }
    if (!json[key].is_array())
    {
        throw std::runtime_error(entry + " must declare " + key + " as an array.");
    }
    for (const auto& value : json[key])
    {
        if (!value.is_string())
        {
            throw std::runtime_error(entry + " " + key + " must contain only strings.");
        }
        values.emplace_back(value.get<std::string>());
    }
    return values;
}

std::string ToLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::optional<std::chrono::year_month_day> ParseReleaseDate(const std::string& entry, const std::string& text)
{
    // YYYY-MM-DD
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    const char* const begin = text.data();
    const char* const end = text.data() + text.size();

    auto result = std::from_chars(begin, end, year);
    bool valid = result.ec == std::errc{} && result.ptr != end && *result.ptr == '-'
                 && year >= static_cast<int>(std::chrono::year::min())
                 && year <= static_cast<int>(std::chrono::year::max());
    if (valid)
    {
        result = std::from_chars(result.ptr + 1, end, month);
        valid = result.ec == std::errc{} && result.ptr != end && *result.ptr == '-';
    }
    if (valid)
    {
        result = std::from_chars(result.ptr + 1, end, day);
        valid = result.ec == std::errc{} && result.ptr == end;
    }

    const std::chrono::year_month_day date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!valid || !date.ok())
    {
        throw std::runtime_error(entry + " has an invalid releaseDate \"" + text + "\"; expected YYYY-MM-DD.");
    }
    return date;
}

std::optional<model::ImageSource> ParseImageSource(const std::string& entry, const nlohmann::json& json, const char* key)
{
    if (!json.contains(key) || json[key].is_null())
    {
        return std::nullopt;
    }

    const auto& image = json[key];
    if (!image.is_object())
    {
        throw std::runtime_error(entry + " must declare " + key + " as an object.");
    }

    const bool hasPath = image.contains("path");
    const bool hasBase64 = image.contains("base64");
    if (hasPath == hasBase64)
    {
        throw std::runtime_error(entry + " " + key + " requires exactly one of path or base64.");
    }

    if (hasPath)
    {
        if (!image["path"].is_string())
        {
            throw std::runtime_error(entry + " " + key + " path must be a string.");
        }
        return model::ImageSource{model::ImageFilePath{image["path"].get<std::string>()}};
    }

    if (!image["base64"].is_string())
    {
        throw std::runtime_error(entry + " " + key + " base64 must be a string.");
    }
    return model::ImageSource{model::ImageBase64{image["base64"].get<std::string>()}};
}
} // namespace

std::vector<model::GameMetadata> GameLibraryLoader::LoadFromFile(const std::string& filePath) const
{
    std::ifstream input{filePath};
    if (!input.is_open())
    {
        throw std::runtime_error("Failed to open game library: " + filePath);
    }

    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& ex)
    {
        throw std::runtime_error("Failed to parse game library " + filePath + ": " + ex.what());
    }

    return Parse(document);
}

std::vector<model::GameMetadata> GameLibraryLoader::Parse(const nlohmann::json& document) const
{
    if (!document.is_object())
    {
        throw std::runtime_error("Game library must be a JSON object.");
    }
    if (!document.contains("games"))
    {
        return {};
    }
    if (!document["games"].is_array())
    {
        throw std::runtime_error("Game library must declare games as an array.");
    }

    std::vector<model::GameMetadata> library;
    library.reserve(document["games"].size());
    std::size_t index = 0;
    for (const auto& gameJson : document["games"])
    {
        library.emplace_back(ParseGame(index++, gameJson));
    }
    return library;
}

model::GameMetadata GameLibraryLoader::ParseGame(std::size_t index, const nlohmann::json& json) const
{
    const std::string entry = DescribeEntry(index, json);
    if (!json.is_object())
    {
        throw std::runtime_error(entry + " is not an object.");
    }

    model::GameMetadata game;
    game.title = RequireString(entry, json, "title");
    game.uuid = RequireString(entry, json, "uuid");
    game.description = OptionalString(entry, json, "description");
    for (auto& genre : StringArray(entry, json, "genres"))
    {
        game.genres.emplace_back(ToLower(std::move(genre)));
    }
    if (const auto releaseDate = OptionalString(entry, json, "releaseDate"))
    {
        game.releaseDate = ParseReleaseDate(entry, *releaseDate);
    }
    game.developers = StringArray(entry, json, "developers");
    game.publishers = StringArray(entry, json, "publishers");
    game.platform = OptionalString(entry, json, "platform");
    game.links = StringArray(entry, json, "links");
    game.tags = StringArray(entry, json, "tags");
    game.coverArt = ParseImageSource(entry, json, "coverArt");
    game.backgroundArt = ParseImageSource(entry, json, "backgroundArt");

    if (json.contains("playtimeMinutes"))
    {
        if (!json["playtimeMinutes"].is_number_integer() || json["playtimeMinutes"].get<long long>() < 0)
        {
            throw std::runtime_error(entry + " must declare playtimeMinutes as a non-negative integer.");
        }
        game.playtime = std::chrono::minutes{json["playtimeMinutes"].get<long long>()};
    }

    if (json.contains("favorite"))
    {
        if (!json["favorite"].is_boolean())
        {
            throw std::runtime_error(entry + " must declare favorite as a boolean.");
        }
        game.favorite = json["favorite"].get<bool>();
    }

    game.installSource = OptionalString(entry, json, "installSource");
    game.launchOptions = StringArray(entry, json, "launchOptions");
    return game;
}

std::vector<model::GameMetadata> LoadGameLibrary(const std::string& filePath)
{
    return GameLibraryLoader{}.LoadFromFile(filePath);
}

} // namespace hearth
