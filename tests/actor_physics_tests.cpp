// tests/actor_physics_tests.cpp

#include <doctest/doctest.h>

#include "game/gameplay/ActorPhysics.hpp"
#include "test_support/TestWorld.hpp"

using engine::physics::Rect;
using game::gameplay::Actor;
using game::gameplay::ActorPhysics;
using game::gameplay::GameplayTuning;
using game::gameplay::Modifiers;
using game::gameplay::MoveIntent;
using game::world::RoomGeometry;
using game::world::RoomTemplate;
using game::world::Season;

namespace
{
Actor SpawnedActor(const GameplayTuning& tuning)
{
    Actor actor;
    actor.ResetTo(tuning.SpawnBox());
    return actor;
}

MoveIntent Right()
{
    MoveIntent intent;
    intent.right = true;
    return intent;
}

MoveIntent Left()
{
    MoveIntent intent;
    intent.left = true;
    return intent;
}

RoomTemplate EmptyRoom()
{
    RoomTemplate layout;
    layout.id = "empty";
    layout.exit = Rect{900, 0, 40, 40};
    return layout;
}
} // namespace

TEST_SUITE("ActorPhysics") {

TEST_CASE("Walking into an adjacent platform stops flush with it") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);

    RoomTemplate layout = testsupport::FlatRoom();
    layout.platforms.push_back(Rect{104, 300, 50, 172});
    const RoomGeometry room(layout);

    Actor actor = SpawnedActor(tuning);
    REQUIRE(actor.box.Right() == 104);

    physics.Step(actor, Right(), room, Season::Spring, Modifiers{});
    CHECK(actor.box.Right() == 104);
    CHECK(actor.velocity.x == doctest::Approx(tuning.baseSpeed));
}

TEST_CASE("Landing grounds the actor and zeroes vertical speed") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);
    const RoomGeometry room(testsupport::FlatRoom());

    Actor actor = SpawnedActor(tuning);
    physics.Step(actor, MoveIntent{}, room, Season::Spring, Modifiers{});
    CHECK(actor.grounded);
    CHECK(actor.velocity.y == doctest::Approx(0.0F));
    CHECK(actor.box.Bottom() == testsupport::Floor().Top());

    physics.Step(actor, MoveIntent{}, room, Season::Spring, Modifiers{});
    CHECK(actor.grounded);
    CHECK(actor.box.Bottom() == testsupport::Floor().Top());
}

TEST_CASE("Gravity builds up from zero again after a landing") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);
    const RoomGeometry floored(testsupport::FlatRoom());
    const RoomGeometry open(EmptyRoom());

    Actor actor = SpawnedActor(tuning);
    physics.Step(actor, MoveIntent{}, floored, Season::Spring, Modifiers{});
    REQUIRE(actor.grounded);
    REQUIRE(actor.velocity.y == doctest::Approx(0.0F));

    // Same actor, floor gone: the first unsupported frame carries exactly one gravity increment.
    physics.Step(actor, MoveIntent{}, open, Season::Spring, Modifiers{});
    CHECK_FALSE(actor.grounded);
    CHECK(actor.velocity.y == doctest::Approx(tuning.baseGravity));

    physics.Step(actor, MoveIntent{}, open, Season::Spring, Modifiers{});
    CHECK(actor.velocity.y == doctest::Approx(2.0F * tuning.baseGravity));
}

TEST_CASE("Diagonal fall into a wall corner ends flush and grounded") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);

    RoomTemplate layout = EmptyRoom();
    const Rect floor{0, 480, 960, 60};
    const Rect wall{104, 380, 40, 100};
    layout.platforms = {floor, wall};
    const RoomGeometry room(layout);

    Actor actor = SpawnedActor(tuning);
    actor.velocity.y = 10.0F - tuning.baseGravity;
    physics.Step(actor, Right(), room, Season::Spring, Modifiers{});
    CHECK(actor.box.x == tuning.spawnX);
    CHECK(actor.box.Right() == wall.Left());
    CHECK(actor.box.Bottom() == floor.Top());
    CHECK(actor.grounded);
    CHECK(actor.velocity.y == doctest::Approx(0.0F));
}

TEST_CASE("Gravity accelerates a resting actor in free fall") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);
    const RoomGeometry room(EmptyRoom());

    Actor actor = SpawnedActor(tuning);
    physics.Step(actor, MoveIntent{}, room, Season::Spring, Modifiers{});
    CHECK_FALSE(actor.grounded);
    CHECK(actor.velocity.y == doctest::Approx(tuning.baseGravity));
    CHECK(actor.box.y == tuning.spawnY + 1);
}

TEST_CASE("Fall speed is capped") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);
    const RoomGeometry room(EmptyRoom());

    Actor actor = SpawnedActor(tuning);
    actor.box.y = -150;
    for (int i = 0; i < 60; ++i)
    {
        physics.Step(actor, MoveIntent{}, room, Season::Spring, Modifiers{});
    }
    CHECK(actor.velocity.y == doctest::Approx(tuning.maxFallSpeed));
}

TEST_CASE("Jumping needs the ground") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);
    const RoomGeometry room(testsupport::FlatRoom());

    Actor actor = SpawnedActor(tuning);
    CHECK_FALSE(physics.TryJump(actor, Modifiers{}));
    CHECK(actor.velocity.y == doctest::Approx(0.0F));

    physics.Step(actor, MoveIntent{}, room, Season::Spring, Modifiers{});
    REQUIRE(actor.grounded);

    Modifiers bones;
    bones.jumpMultiplier = 1.08F;
    CHECK(physics.TryJump(actor, bones));
    CHECK_FALSE(actor.grounded);
    CHECK(actor.velocity.y == doctest::Approx(-tuning.baseJump * 1.08F));
    CHECK_FALSE(physics.TryJump(actor, bones));

    const int groundY = actor.box.y;
    physics.Step(actor, MoveIntent{}, room, Season::Spring, Modifiers{});
    CHECK(actor.box.y < groundY);
    CHECK(actor.velocity.y == doctest::Approx(-tuning.baseJump * 1.08F + tuning.baseGravity));
}

TEST_CASE("Speed multiplier scales horizontal movement") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);
    const RoomGeometry room(testsupport::FlatRoom());

    Modifiers swift;
    swift.speedMultiplier = 1.2F;
    Actor actor = SpawnedActor(tuning);
    physics.Step(actor, Right(), room, Season::Spring, swift);
    CHECK(actor.box.x == tuning.spawnX + 6);
}

TEST_CASE("Water drags horizontal speed in Spring and Summer only") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);

    RoomTemplate layout = testsupport::FlatRoom();
    layout.water.push_back(Rect{0, 400, 960, 72});
    const RoomGeometry room(layout);

    Actor spring = SpawnedActor(tuning);
    physics.Step(spring, Right(), room, Season::Spring, Modifiers{});
    CHECK(spring.velocity.x == doctest::Approx(tuning.baseSpeed * tuning.waterDragFactor));
    CHECK(spring.box.x == tuning.spawnX + 2);

    Actor summer = SpawnedActor(tuning);
    Modifiers heavy;
    heavy.waterDragMultiplier = 0.75F;
    physics.Step(summer, Right(), room, Season::Summer, heavy);
    CHECK(summer.velocity.x == doctest::Approx(tuning.baseSpeed * tuning.waterDragFactor * 0.75F));

    Actor autumn = SpawnedActor(tuning);
    physics.Step(autumn, Right(), room, Season::Autumn, Modifiers{});
    CHECK(autumn.box.x == tuning.spawnX + 5);
}

TEST_CASE("Autumn wind adds push per overlapping zone") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);

    RoomTemplate layout = testsupport::FlatRoom();
    layout.wind.push_back(Rect{0, 300, 300, 200});
    const RoomGeometry oneZone(layout);
    layout.wind.push_back(Rect{50, 350, 300, 200});
    const RoomGeometry twoZones(layout);

    Actor actor = SpawnedActor(tuning);
    physics.Step(actor, MoveIntent{}, oneZone, Season::Autumn, Modifiers{});
    CHECK(actor.velocity.x == doctest::Approx(Modifiers::kBaselineWindPush));

    actor = SpawnedActor(tuning);
    physics.Step(actor, MoveIntent{}, twoZones, Season::Autumn, Modifiers{});
    CHECK(actor.velocity.x == doctest::Approx(2.0F * Modifiers::kBaselineWindPush));

    actor = SpawnedActor(tuning);
    physics.Step(actor, MoveIntent{}, twoZones, Season::Summer, Modifiers{});
    CHECK(actor.velocity.x == doctest::Approx(0.0F));
}

TEST_CASE("Frozen water carries the actor in Winter and not in Spring") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);

    RoomTemplate layout = EmptyRoom();
    layout.water.push_back(Rect{0, 472, 960, 68});
    const RoomGeometry room(layout);

    Actor winter = SpawnedActor(tuning);
    physics.Step(winter, MoveIntent{}, room, Season::Winter, Modifiers{});
    CHECK(winter.grounded);
    CHECK(winter.box.y == tuning.spawnY);

    Actor spring = SpawnedActor(tuning);
    physics.Step(spring, MoveIntent{}, room, Season::Spring, Modifiers{});
    CHECK_FALSE(spring.grounded);
    CHECK(spring.box.y > tuning.spawnY);
}

TEST_CASE("The world band clamps sideways movement") {
    const GameplayTuning tuning;
    const ActorPhysics physics(tuning);
    const RoomGeometry room(testsupport::FlatRoom());

    Actor actor = SpawnedActor(tuning);
    actor.box.x = 2;
    physics.Step(actor, Left(), room, Season::Spring, Modifiers{});
    CHECK(actor.box.x == 0);

    actor.box.x = tuning.worldWidth - actor.box.w - 1;
    physics.Step(actor, Right(), room, Season::Spring, Modifiers{});
    CHECK(actor.box.Right() == tuning.worldWidth);
}

} // TEST_SUITE
