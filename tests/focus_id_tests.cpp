#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "hearth/focus/FocusId.hpp"

#include <string>
#include <variant>

using namespace hearth::focus;

TEST_CASE("Button ids use the BTN@ prefix and upper case names")
{
    CHECK(MakeButtonId(ButtonKind::Games) == "BTN@GAMES");
    CHECK(MakeButtonId(ButtonKind::RecentlyPlayed) == "BTN@RECENTLY_PLAYED");
    CHECK(MakeButtonId(ButtonKind::Settings) == "BTN@SETTINGS");
    CHECK(IsButtonId("BTN@SETTINGS"));
    CHECK_FALSE(IsGameId("BTN@SETTINGS"));
}

TEST_CASE("Game ids use the GAME@ prefix and the raw uuid")
{
    CHECK(MakeGameId("123e4567-e89b") == "GAME@123e4567-e89b");
    CHECK(IsGameId("GAME@abc"));
    CHECK_FALSE(IsButtonId("GAME@abc"));
}

TEST_CASE("ParseActivation maps ids to typed activations")
{
    const auto button = ParseActivation("BTN@RECENTLY_PLAYED");
    REQUIRE(button.has_value());
    REQUIRE(std::holds_alternative<ButtonActivation>(*button));
    CHECK(std::get<ButtonActivation>(*button).kind == ButtonKind::RecentlyPlayed);

    const auto game = ParseActivation("GAME@abc");
    REQUIRE(game.has_value());
    REQUIRE(std::holds_alternative<GameLaunch>(*game));
    CHECK(std::get<GameLaunch>(*game).uuid == "abc");
}

TEST_CASE("ParseActivation rejects unknown ids")
{
    CHECK_FALSE(ParseActivation("").has_value());
    CHECK_FALSE(ParseActivation("BTN@QUIT").has_value());
    CHECK_FALSE(ParseActivation("btn@GAMES").has_value());
    CHECK_FALSE(ParseActivation("GAME@").has_value());
    CHECK_FALSE(ParseActivation("TILE@abc").has_value());
}

TEST_CASE("ToFocusId inverts ParseActivation")
{
    for (const std::string id : {"BTN@GAMES", "BTN@RECENTLY_PLAYED", "BTN@SETTINGS", "GAME@0b7c"})
    {
        const auto activation = ParseActivation(id);
        REQUIRE(activation.has_value());
        CHECK(ToFocusId(*activation) == id);
    }
}

TEST_CASE("ButtonKindFromString only accepts exact names")
{
    CHECK(ButtonKindFromString("GAMES") == ButtonKind::Games);
    CHECK_FALSE(ButtonKindFromString("games").has_value());
    CHECK(ToString(ButtonKind::Settings) == "SETTINGS");
}
