#include "hearth/model/Game.hpp"

#include <algorithm>
#include <utility>

namespace hearth::model
{

std::vector<GameData> ToGameData(const std::vector<GameMetadata>& library)
{
    std::vector<GameData> games;
    games.reserve(library.size());
    for (const auto& entry : library)
    {
        games.push_back(entry.ToGameData());
    }
    return games;
}

void GameList::Replace(std::vector<GameData> games)
{
    games_ = std::move(games);
    for (const auto& callback : callbacks_)
    {
        if (callback)
        {
            callback(games_);
        }
    }
}

void GameList::OnChanged(Callback callback)
{
    callbacks_.push_back(std::move(callback));
}

const GameMetadata* FindGame(const std::vector<GameMetadata>& library, std::string_view uuid) noexcept
{
    const auto it = std::find_if(library.begin(), library.end(), [uuid](const GameMetadata& game) {
        return game.uuid == uuid;
    });
    return it != library.end() ? &*it : nullptr;
}

} // namespace hearth::model
