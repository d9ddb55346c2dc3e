#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "hearth/focus/ActivationDispatcher.hpp"
#include "hearth/focus/FocusStore.hpp"

#include <vector>

using namespace hearth::focus;

namespace
{
struct Recorder
{
    std::vector<Activation> received;

    void Attach(ActivationDispatcher& dispatcher)
    {
        dispatcher.OnActivation([this](const Activation& activation) { received.push_back(activation); });
    }
};
}

TEST_CASE("Press and release on the same element activates once")
{
    ActivationDispatcher dispatcher;
    Recorder recorder;
    recorder.Attach(dispatcher);

    dispatcher.PointerPressed("BTN@SETTINGS");
    CHECK(dispatcher.IsPressed("BTN@SETTINGS"));
    CHECK(dispatcher.PointerReleased("BTN@SETTINGS"));

    REQUIRE(recorder.received.size() == 1);
    CHECK(recorder.received[0] == Activation{ButtonActivation{ButtonKind::Settings}});
    CHECK_FALSE(dispatcher.IsPressed("BTN@SETTINGS"));
}

TEST_CASE("Clicking a game tile requests a launch of that uuid")
{
    ActivationDispatcher dispatcher;
    Recorder recorder;
    recorder.Attach(dispatcher);

    dispatcher.PointerPressed("GAME@8f14e45f");
    dispatcher.PointerReleased("GAME@8f14e45f");

    REQUIRE(recorder.received.size() == 1);
    CHECK(recorder.received[0] == Activation{GameLaunch{"8f14e45f"}});
}

TEST_CASE("Releasing outside the pressed element cancels the click")
{
    ActivationDispatcher dispatcher;
    Recorder recorder;
    recorder.Attach(dispatcher);

    dispatcher.PointerPressed("BTN@GAMES");
    CHECK_FALSE(dispatcher.PointerReleased("BTN@SETTINGS"));
    CHECK_FALSE(dispatcher.PointerReleased("BTN@GAMES"));

    dispatcher.PointerPressed("BTN@GAMES");
    CHECK_FALSE(dispatcher.PointerReleased(""));

    dispatcher.PointerPressed("BTN@GAMES");
    dispatcher.PointerCancelled();
    CHECK_FALSE(dispatcher.PointerReleased("BTN@GAMES"));

    CHECK(recorder.received.empty());
    CHECK(dispatcher.DispatchCount() == 0);
}

TEST_CASE("Confirm activates the focused element without changing focus")
{
    FocusStore store;
    ActivationDispatcher dispatcher;
    Recorder recorder;
    recorder.Attach(dispatcher);

    CHECK_FALSE(dispatcher.Confirm(store));

    store.Set("BTN@RECENTLY_PLAYED");
    CHECK(dispatcher.Confirm(store));
    REQUIRE(recorder.received.size() == 1);
    CHECK(recorder.received[0] == Activation{ButtonActivation{ButtonKind::RecentlyPlayed}});
    CHECK(store.Get() == "BTN@RECENTLY_PLAYED");
}

TEST_CASE("Activation without a handler is a silent no-op")
{
    ActivationDispatcher dispatcher;
    CHECK(dispatcher.Activate("BTN@GAMES"));
    CHECK(dispatcher.DispatchCount() == 1);
}

TEST_CASE("Unrecognised ids are dropped")
{
    ActivationDispatcher dispatcher;
    Recorder recorder;
    recorder.Attach(dispatcher);

    CHECK_FALSE(dispatcher.Activate("BTN@UNKNOWN"));
    CHECK_FALSE(dispatcher.Activate("GAME@"));
    CHECK(recorder.received.empty());
    CHECK(dispatcher.DispatchCount() == 0);
}
