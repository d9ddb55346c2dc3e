#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "hearth/focus/FocusStore.hpp"
#include "hearth/model/HomeScreenModel.hpp"

#include <initializer_list>
#include <string>
#include <vector>

using namespace hearth;
using namespace hearth::model;

namespace
{
std::vector<GameData> MakeGames(std::initializer_list<const char*> uuids)
{
    std::vector<GameData> games;
    for (const char* uuid : uuids)
    {
        games.push_back(GameData{std::string{"Title "} + uuid, uuid});
    }
    return games;
}

layout::NavigationDirective Move(layout::Direction direction)
{
    return layout::NavigationDirective::Move(direction);
}
}

TEST_CASE("The home screen starts focused on the games button")
{
    HomeScreenModel model;
    CHECK(model.Focus().Get() == "BTN@GAMES");
    CHECK(model.Games().Empty());
    CHECK(model.TileLayout().tiles.empty());
}

TEST_CASE("Button ids are exposed in title bar order")
{
    const auto& ids = HomeScreenModel::ButtonIds();
    REQUIRE(ids.size() == 3);
    CHECK(ids[0] == "BTN@GAMES");
    CHECK(ids[1] == "BTN@RECENTLY_PLAYED");
    CHECK(ids[2] == "BTN@SETTINGS");
}

TEST_CASE("Navigation writes the new focus into the store")
{
    HomeScreenModel model;
    model.ReplaceGames(MakeGames({"a", "b", "c"}));

    model.Navigate(Move(layout::Direction::Down));
    CHECK(model.Focus().Get() == "GAME@a");

    model.Navigate(Move(layout::Direction::Right));
    CHECK(model.Focus().Get() == "GAME@b");
}

TEST_CASE("A failed move keeps the focus and does not notify")
{
    HomeScreenModel model;
    int notifications = 0;
    model.Focus().Subscribe([&notifications](const focus::FocusId&) { ++notifications; });

    const auto result = model.Navigate(Move(layout::Direction::Left));
    CHECK(result.kind == layout::NavigationResult::Kind::NoNextItem);
    CHECK(model.Focus().Get() == "BTN@GAMES");
    CHECK(notifications == 0);
}

TEST_CASE("Focus set by the host moves the navigation position")
{
    HomeScreenModel model;
    model.ReplaceGames(MakeGames({"a", "b", "c"}));

    model.SetFocus("GAME@b");
    model.Navigate(Move(layout::Direction::Right));
    CHECK(model.Focus().Get() == "GAME@c");
}

TEST_CASE("Replacing the games recomputes the tile layout")
{
    HomeScreenModel model;
    model.Resize(1400.0f, 900.0f);
    model.ReplaceGames(MakeGames({"a", "b", "c", "d", "e", "f", "g", "h"}));

    const auto& tiles = model.TileLayout();
    CHECK(tiles.rowCount == 2);
    CHECK(tiles.itemWidth == doctest::Approx(200.0f));
    CHECK(tiles.contentHeight == doctest::Approx(2 * 300.0f + 100.0f));
    REQUIRE(tiles.tiles.size() == 8);
    CHECK(tiles.tiles[7].cell == layout::GridCell{1, 0});

    model.Resize(700.0f, 300.0f);
    CHECK(model.TileLayout().itemWidth == doctest::Approx(100.0f));
    CHECK(model.TileLayout().itemHeight == doctest::Approx(100.0f));
}

TEST_CASE("Focus falls back to the games button when the focused game disappears")
{
    HomeScreenModel model;
    model.ReplaceGames(MakeGames({"a", "b"}));
    model.SetFocus("GAME@b");

    model.ReplaceGames(MakeGames({"a", "c"}));
    CHECK(model.Focus().Get() == "BTN@GAMES");

    model.Navigate(Move(layout::Direction::Down));
    CHECK(model.Focus().Get() == "GAME@a");
}

TEST_CASE("Focus stays on a game that survives a replacement")
{
    HomeScreenModel model;
    model.ReplaceGames(MakeGames({"a", "b"}));
    model.SetFocus("GAME@b");

    model.ReplaceGames(MakeGames({"b", "a"}));
    CHECK(model.Focus().Get() == "GAME@b");

    model.Navigate(Move(layout::Direction::Right));
    CHECK(model.Focus().Get() == "GAME@a");
}

TEST_CASE("Replacing with an equal list still refreshes")
{
    HomeScreenModel model;
    model.ReplaceGames(MakeGames({"a"}));
    model.Resize(700.0f, 300.0f);
    model.ReplaceGames(MakeGames({"a"}));
    CHECK(model.TileLayout().tiles.size() == 1);
    CHECK(model.Games().Size() == 1);
}

TEST_CASE("Every replacement bumps the games revision")
{
    HomeScreenModel model;
    CHECK(model.GamesRevision() == 0);

    model.ReplaceGames(MakeGames({"a", "b"}));
    const auto first = model.GamesRevision();
    CHECK(first > 0);

    model.Resize(700.0f, 300.0f);
    model.SetFocus("GAME@b");
    CHECK(model.GamesRevision() == first);

    model.ReplaceGames(MakeGames({"a", "b"}));
    CHECK(model.GamesRevision() > first);
}

TEST_CASE("Tiles sharing a uuid are highlighted together")
{
    HomeScreenModel model;
    model.ReplaceGames(MakeGames({"abc", "abc"}));
    focus::FocusBinding first{model.Focus(), "GAME@abc"};
    focus::FocusBinding second{model.Focus(), "GAME@abc"};

    model.SetFocus("GAME@abc");
    CHECK(first.Focused());
    CHECK(second.Focused());
}

TEST_CASE("Confirm activates the focused element")
{
    HomeScreenModel model;
    std::vector<focus::Activation> received;
    model.Activations().OnActivation([&received](const focus::Activation& activation) {
        received.push_back(activation);
    });
    model.ReplaceGames(MakeGames({"a"}));

    CHECK(model.Confirm());
    model.Navigate(Move(layout::Direction::Down));
    CHECK(model.Confirm());

    REQUIRE(received.size() == 2);
    CHECK(received[0] == focus::Activation{focus::ButtonActivation{focus::ButtonKind::Games}});
    CHECK(received[1] == focus::Activation{focus::GameLaunch{"a"}});
    CHECK(model.Focus().Get() == "GAME@a");
}

TEST_CASE("Pointer clicks route through the dispatcher")
{
    HomeScreenModel model;
    std::vector<focus::Activation> received;
    model.Activations().OnActivation([&received](const focus::Activation& activation) {
        received.push_back(activation);
    });

    model.PointerPressed("BTN@SETTINGS");
    CHECK(model.Activations().IsPressed("BTN@SETTINGS"));
    CHECK(model.PointerReleased("BTN@SETTINGS"));

    model.PointerPressed("BTN@SETTINGS");
    CHECK_FALSE(model.PointerReleased("BTN@GAMES"));

    REQUIRE(received.size() == 1);
    CHECK(received[0] == focus::Activation{focus::ButtonActivation{focus::ButtonKind::Settings}});
    CHECK(model.Focus().Get() == "BTN@GAMES");
}

TEST_CASE("Hover is tracked separately from focus")
{
    HomeScreenModel model;
    model.PointerHovered("BTN@SETTINGS");
    CHECK(model.HoveredId() == "BTN@SETTINGS");
    CHECK(model.Focus().Get() == "BTN@GAMES");
    model.PointerHovered("");
    CHECK(model.HoveredId().empty());
}

TEST_CASE("Custom grid columns shape the games navigation grid")
{
    HomeScreenModel model{layout::GridLayoutConfig{3, 2, 0.0f}};
    model.ReplaceGames(MakeGames({"a", "b", "c", "d"}));

    model.SetFocus("GAME@a");
    model.Navigate(Move(layout::Direction::Down));
    CHECK(model.Focus().Get() == "GAME@d");
}
