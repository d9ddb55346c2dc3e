#pragma once

#include "hearth/model/Game.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace hearth
{

//! Reads the game library document:
//! { "games": [ { "title": "...", "uuid": "...", ... } ] }
//! Throws std::runtime_error naming the offending entry on malformed input.
class GameLibraryLoader
{
  public:
    std::vector<model::GameMetadata> LoadFromFile(const std::string& filePath) const;
    std::vector<model::GameMetadata> Parse(const nlohmann::json& document) const;

  private:
    model::GameMetadata ParseGame(std::size_t index, const nlohmann::json& json) const;
};

std::vector<model::GameMetadata> LoadGameLibrary(const std::string& filePath);

} // namespace hearth
