// tests/run_session_tests.cpp

#include <doctest/doctest.h>

#include <stdexcept>

#include "engine/core/EventBus.hpp"
#include "game/gameplay/RunSession.hpp"
#include "test_support/TestWorld.hpp"

using engine::physics::Rect;
using game::gameplay::FrameInput;
using game::gameplay::GameplayTuning;
using game::gameplay::RunOutcome;
using game::gameplay::RunSession;
using game::gameplay::seeds::EchoSeedRegistry;
using game::world::RoomCatalog;
using game::world::RoomTemplate;

namespace
{
RoomCatalog PitCatalog()
{
    RoomTemplate pit;
    pit.id = "pit";
    pit.exit = Rect{900, 100, 40, 40};

    RoomCatalog catalog;
    catalog.Clear();
    catalog.AddTemplate(pit);
    return catalog;
}

GameplayTuning OneRoomTuning()
{
    GameplayTuning tuning;
    tuning.roomsPerRun = 1;
    tuning.echoSeedsPerRun = 0;
    return tuning;
}
} // namespace

TEST_SUITE("RunSession") {

TEST_CASE("A new run draws rooms and distinct seeds per tuning") {
    RunSession session(GameplayTuning{}, RoomCatalog{}, EchoSeedRegistry{}, 1234U);
    CHECK_FALSE(session.HasRun());
    CHECK_THROWS_AS((void)session.Current(), std::logic_error);

    session.StartNewRun(0);
    REQUIRE(session.HasRun());
    const auto& run = session.Current();
    CHECK(run.RoomCount() == 5);
    REQUIRE(run.EchoSeedIds().size() == 2);
    CHECK(run.EchoSeedIds()[0] != run.EchoSeedIds()[1]);
    CHECK(session.RunsStarted() == 1);
}

TEST_CASE("Restart is refused while a run is in progress") {
    RunSession session(GameplayTuning{}, RoomCatalog{}, EchoSeedRegistry{}, 99U);
    session.StartNewRun(0);
    CHECK_FALSE(session.RequestRestart(100));
    CHECK(session.RunsStarted() == 1);
}

TEST_CASE("Restart after a failed run starts fresh") {
    RunSession session(OneRoomTuning(), PitCatalog(), EchoSeedRegistry{}, 5U);
    session.StartNewRun(0);

    game::gameplay::TimestampMs now = 0;
    for (int frame = 0; frame < 300 && !session.Current().IsTerminal(); ++frame)
    {
        now += 16;
        session.Tick(FrameInput{}, now);
    }
    REQUIRE(session.Current().Outcome() == RunOutcome::Failed);

    CHECK(session.RequestRestart(now));
    CHECK(session.RunsStarted() == 2);
    CHECK(session.Current().Outcome() == RunOutcome::InProgress);
    CHECK(session.Current().RoomIndex() == 0);
    CHECK(session.Current().StartMs() == now);
    CHECK(session.Current().GetActor().box == OneRoomTuning().SpawnBox());
}

TEST_CASE("RequestRestart with no run starts one") {
    RunSession session(OneRoomTuning(), PitCatalog(), EchoSeedRegistry{}, 5U);
    CHECK(session.RequestRestart(0));
    CHECK(session.HasRun());
}

TEST_CASE("Invalid run sizes are rejected") {
    GameplayTuning noRooms;
    noRooms.roomsPerRun = 0;
    RunSession empty(noRooms, RoomCatalog{}, EchoSeedRegistry{}, 1U);
    CHECK_THROWS_AS(empty.StartNewRun(0), std::invalid_argument);

    GameplayTuning greedy;
    greedy.echoSeedsPerRun = 7;
    RunSession tooMany(greedy, RoomCatalog{}, EchoSeedRegistry{}, 1U);
    CHECK_THROWS_AS(tooMany.StartNewRun(0), std::invalid_argument);
    CHECK_FALSE(tooMany.HasRun());

    GameplayTuning shallow;
    shallow.boundsBottom = 640;
    RunSession softLock(shallow, RoomCatalog{}, EchoSeedRegistry{}, 1U);
    CHECK_THROWS_AS(softLock.StartNewRun(0), std::invalid_argument);
    CHECK_FALSE(softLock.HasRun());
}

TEST_CASE("Starting a run drops events left over from the previous one") {
    engine::core::EventBus events;
    int roomsEntered = 0;
    events.Subscribe(engine::core::EventType::RoomEntered, [&roomsEntered](const engine::core::Event&) { ++roomsEntered; });

    RunSession session(OneRoomTuning(), PitCatalog(), EchoSeedRegistry{}, 5U, &events);
    session.StartNewRun(0);
    session.StartNewRun(10);
    CHECK(events.PendingCount() == 1);
    events.DispatchQueued();
    CHECK(roomsEntered == 1);
}

} // TEST_SUITE
