#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hearth::model
{

//! What the home screen needs to show and address one game.
struct GameData
{
    std::string title;
    std::string uuid;

    bool operator==(const GameData&) const = default;
};

struct ImageFilePath
{
    std::string path;

    bool operator==(const ImageFilePath&) const = default;
};

struct ImageBase64
{
    std::string payload;

    bool operator==(const ImageBase64&) const = default;
};

using ImageSource = std::variant<ImageFilePath, ImageBase64>;

//! Full record of a library entry, e.g. sourced from igdb.com.
struct GameMetadata
{
    std::string title;
    std::optional<std::string> description;
    // Lower case.
    std::vector<std::string> genres;
    // Timezone unaware.
    std::optional<std::chrono::year_month_day> releaseDate;
    std::vector<std::string> developers;
    std::vector<std::string> publishers;
    std::optional<std::string> platform;
    std::vector<std::string> links;
    std::vector<std::string> tags;
    std::optional<ImageSource> coverArt;
    std::optional<ImageSource> backgroundArt;
    std::optional<std::chrono::minutes> playtime;
    bool favorite = false;
    // Required, assigned by the application.
    std::string uuid;
    std::optional<std::string> installSource;
    std::vector<std::string> launchOptions;

    [[nodiscard]] GameData ToGameData() const { return GameData{title, uuid}; }
};

[[nodiscard]] std::vector<GameData> ToGameData(const std::vector<GameMetadata>& library);
//! First entry with the uuid, or nullptr.
[[nodiscard]] const GameMetadata* FindGame(const std::vector<GameMetadata>& library, std::string_view uuid) noexcept;

//! Ordered list of games on screen. Order is display order; no sorting and
//! no de-duplication happen here.
class GameList
{
  public:
    using Callback = std::function<void(const std::vector<GameData>&)>;

    void Replace(std::vector<GameData> games);
    void OnChanged(Callback callback);

    [[nodiscard]] const std::vector<GameData>& Items() const noexcept { return games_; }
    [[nodiscard]] std::size_t Size() const noexcept { return games_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return games_.empty(); }

  private:
    std::vector<GameData> games_;
    std::vector<Callback> callbacks_;
};

} // namespace hearth::model
