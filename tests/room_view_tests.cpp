// tests/room_view_tests.cpp

#include <doctest/doctest.h>

#include <algorithm>

#include "game/ui/RoomView.hpp"

using engine::physics::Rect;
using game::gameplay::RunOutcome;
using game::gameplay::RunSnapshot;
using game::ui::RoomFrame;
using game::ui::RoomView;
using game::world::Season;

namespace
{
RunSnapshot BasicSnapshot()
{
    RunSnapshot snapshot;
    snapshot.roomCount = 5;
    snapshot.actorBox = Rect{70, 420, 34, 52};
    snapshot.exit = Rect{900, 428, 44, 70};
    snapshot.activePlatforms = {Rect{0, 498, 960, 50}};
    return snapshot;
}

bool Draws(const RoomFrame& frame, const Rect& rect)
{
    return std::any_of(frame.rects.begin(), frame.rects.end(), [&rect](const game::ui::ColoredRect& r) { return r.rect == rect; });
}
} // namespace

TEST_SUITE("RoomView") {

TEST_CASE("Background is the season colour without a flash") {
    const RoomView view;
    RunSnapshot snapshot = BasicSnapshot();
    snapshot.season = Season::Winter;
    const RoomFrame frame = view.Compose(snapshot);
    CHECK(frame.clearColor.b == doctest::Approx(RoomView::SeasonBackground(Season::Winter).b));
}

TEST_CASE("A flash blends the background toward the season accent") {
    const glm::vec3 base = RoomView::SeasonBackground(Season::Summer);
    const glm::vec3 accent = RoomView::SeasonAccent(Season::Summer);
    const glm::vec3 full = RoomView::FlashedBackground(Season::Summer, 255);
    const glm::vec3 partial = RoomView::FlashedBackground(Season::Summer, 170);

    CHECK(full.r == doctest::Approx(accent.r));
    CHECK(partial.r > base.r);
    CHECK(partial.r < accent.r);
    CHECK(RoomView::FlashedBackground(Season::Summer, 0).g == doctest::Approx(base.g));
}

TEST_CASE("Geometry, exit and actor are drawn") {
    const RoomView view;
    const RunSnapshot snapshot = BasicSnapshot();
    const RoomFrame frame = view.Compose(snapshot);
    CHECK(Draws(frame, snapshot.activePlatforms.front()));
    CHECK(Draws(frame, snapshot.exit));
    CHECK(Draws(frame, snapshot.actorBox));
}

TEST_CASE("An ended run adds a banner") {
    const RoomView view;
    RunSnapshot snapshot = BasicSnapshot();
    const std::size_t playing = view.Compose(snapshot).rects.size();
    snapshot.outcome = RunOutcome::Failed;
    CHECK(view.Compose(snapshot).rects.size() > playing);
}

} // TEST_SUITE
