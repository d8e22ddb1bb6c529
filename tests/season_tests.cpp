// tests/season_tests.cpp

#include <doctest/doctest.h>

#include "game/world/Season.hpp"
#include "game/world/SeasonCycle.hpp"

using game::world::ParseSeason;
using game::world::Season;
using game::world::SeasonCycle;
using game::world::SeasonMask;

TEST_SUITE("Season") {

TEST_CASE("Seasons advance in order and wrap") {
    CHECK(game::world::NextSeason(Season::Spring) == Season::Summer);
    CHECK(game::world::NextSeason(Season::Summer) == Season::Autumn);
    CHECK(game::world::NextSeason(Season::Autumn) == Season::Winter);
    CHECK(game::world::NextSeason(Season::Winter) == Season::Spring);
}

TEST_CASE("ParseSeason is case-insensitive and rejects unknown names") {
    CHECK(ParseSeason("winter") == Season::Winter);
    CHECK(ParseSeason("Autumn") == Season::Autumn);
    CHECK(ParseSeason("SPRING") == Season::Spring);
    CHECK_FALSE(ParseSeason("monsoon").has_value());
    CHECK_FALSE(ParseSeason("").has_value());
}

TEST_CASE("SeasonMask membership") {
    const SeasonMask mask = SeasonMask::Of({Season::Spring, Season::Autumn});
    CHECK(mask.Contains(Season::Spring));
    CHECK(mask.Contains(Season::Autumn));
    CHECK_FALSE(mask.Contains(Season::Summer));
    CHECK_FALSE(mask.Contains(Season::Winter));
    CHECK(SeasonMask{}.IsEmpty());
    CHECK(SeasonMask::All().Bits() == 0x0F);
}

} // TEST_SUITE

TEST_SUITE("SeasonCycle") {

TEST_CASE("Cooldown gates cycle requests") {
    SeasonCycle cycle(500);
    CHECK(cycle.Active() == Season::Spring);

    CHECK(cycle.RequestCycle(0));
    CHECK(cycle.Active() == Season::Summer);

    CHECK_FALSE(cycle.RequestCycle(499));
    CHECK(cycle.Active() == Season::Summer);
    CHECK(cycle.LastCycleMs() == 0);

    CHECK(cycle.RequestCycle(500));
    CHECK(cycle.Active() == Season::Autumn);
}

TEST_CASE("Winter wraps back to Spring") {
    SeasonCycle cycle(500, Season::Winter);
    CHECK(cycle.RequestCycle(0));
    CHECK(cycle.Active() == Season::Spring);
}

TEST_CASE("A full lap returns to the starting season") {
    SeasonCycle cycle(500);
    for (int i = 0; i < 4; ++i)
    {
        CHECK(cycle.RequestCycle(i * 500));
    }
    CHECK(cycle.Active() == Season::Spring);
}

TEST_CASE("Cooldown remaining never goes negative") {
    SeasonCycle cycle(500);
    CHECK(cycle.CooldownRemainingMs(0) == 0);
    REQUIRE(cycle.RequestCycle(1000));
    CHECK(cycle.CooldownRemainingMs(1200) == 300);
    CHECK(cycle.CooldownRemainingMs(1500) == 0);
    CHECK(cycle.CooldownRemainingMs(9000) == 0);
}

TEST_CASE("Flash peaks on a cycle and decays per update") {
    SeasonCycle cycle(500);
    CHECK(cycle.FlashIntensity() == 0);
    REQUIRE(cycle.RequestCycle(0));
    CHECK(cycle.FlashIntensity() == SeasonCycle::kFlashPeak);
    cycle.Update();
    CHECK(cycle.FlashIntensity() == SeasonCycle::kFlashPeak - SeasonCycle::kFlashDecayPerFrame);
    for (int i = 0; i < 100; ++i)
    {
        cycle.Update();
    }
    CHECK(cycle.FlashIntensity() == 0);
}

TEST_CASE("A rejected request leaves the flash alone") {
    SeasonCycle cycle(500);
    REQUIRE(cycle.RequestCycle(0));
    cycle.Update();
    const int before = cycle.FlashIntensity();
    CHECK_FALSE(cycle.RequestCycle(100));
    CHECK(cycle.FlashIntensity() == before);
}

} // TEST_SUITE
