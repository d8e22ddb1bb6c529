#include "game/gameplay/RunState.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace game::gameplay
{
namespace
{
using engine::core::EventType;
using engine::physics::Rect;

std::vector<world::RoomGeometry> RequireRooms(std::vector<world::RoomGeometry>&& rooms)
{
    if (rooms.empty())
    {
        throw std::invalid_argument("a run needs at least one room");
    }
    return std::move(rooms);
}

const GameplayTuning& RequireValidTuning(const GameplayTuning& tuning)
{
    std::string error;
    if (!tuning.Validate(&error))
    {
        throw std::invalid_argument("invalid gameplay tuning: " + error);
    }
    return tuning;
}

bool OverlapsAny(const Rect& box, const std::vector<Rect>& rects)
{
    return std::any_of(rects.begin(), rects.end(), [&box](const Rect& rect) { return box.Overlaps(rect); });
}
} // namespace

RunState::RunState(RunSetup setup, engine::core::EventBus* events)
    : m_rooms(RequireRooms(std::move(setup.rooms)))
    , m_echoSeedIds(std::move(setup.echoSeedIds))
    , m_modifiers(setup.modifiers)
    , m_physics(RequireValidTuning(setup.tuning))
    , m_fallLineY(setup.tuning.FallLineY())
    , m_seasons(
          setup.modifiers.slowCycle ? setup.tuning.slowSeasonCooldownMs : setup.tuning.seasonCooldownMs,
          setup.initialSeason
      )
    , m_startMs(setup.startMs)
    , m_events(events)
{
    m_actor.ResetTo(m_physics.SpawnBox());
    Publish(EventType::RoomEntered, CurrentRoom().Id(), m_startMs, 0);
}

const world::RoomGeometry& RunState::CurrentRoom() const
{
    return m_rooms[std::min(m_roomIndex, m_rooms.size() - 1)];
}

void RunState::Tick(const FrameInput& input, TimestampMs nowMs)
{
    if (IsTerminal())
    {
        return;
    }

    if (input.cycleSeasonPressed && m_seasons.RequestCycle(nowMs))
    {
        Publish(EventType::SeasonCycled, world::SeasonToText(m_seasons.Active()), nowMs, static_cast<int>(m_seasons.Active()));
    }

    if (input.jumpPressed)
    {
        (void)m_physics.TryJump(m_actor, m_modifiers);
    }

    m_physics.Step(m_actor, input.move, CurrentRoom(), m_seasons.Active(), m_modifiers);
    m_seasons.Update();

    EvaluateOutcome(nowMs);
}

void RunState::EvaluateOutcome(TimestampMs nowMs)
{
    const world::RoomGeometry& room = CurrentRoom();

    if (world::RoomGeometry::HazardActive(m_seasons.Active(), m_modifiers.brittleThorns)
        && OverlapsAny(m_actor.box, room.Hazards()))
    {
        Finish(RunOutcome::Failed, FailReason::Hazard, nowMs);
        return;
    }

    if (m_actor.box.Top() > m_fallLineY)
    {
        Finish(RunOutcome::Failed, FailReason::FellOutOfWorld, nowMs);
        return;
    }

    if (m_actor.box.Overlaps(room.Exit()))
    {
        AdvanceRoom(nowMs);
    }
}

void RunState::AdvanceRoom(TimestampMs nowMs)
{
    ++m_roomIndex;
    if (m_roomIndex >= m_rooms.size())
    {
        Finish(RunOutcome::Won, FailReason::None, nowMs);
        return;
    }

    m_actor.ResetTo(m_physics.SpawnBox());
    Publish(EventType::RoomEntered, CurrentRoom().Id(), nowMs, static_cast<int>(m_roomIndex));
}

void RunState::Finish(RunOutcome outcome, FailReason reason, TimestampMs nowMs)
{
    if (IsTerminal())
    {
        return;
    }

    m_outcome = outcome;
    m_failReason = reason;
    m_endMs = nowMs;

    std::cout << "[Run] " << RunOutcomeToText(outcome) << " after " << (nowMs - m_startMs) << " ms, rooms cleared "
              << std::min(m_roomIndex, m_rooms.size()) << "/" << m_rooms.size();
    if (reason != FailReason::None)
    {
        std::cout << " (" << FailReasonToText(reason) << ")";
    }
    std::cout << "\n";

    if (outcome == RunOutcome::Won)
    {
        Publish(EventType::RunWon, "", nowMs, static_cast<int>(m_rooms.size()));
    }
    else
    {
        Publish(EventType::RunFailed, FailReasonToText(reason), nowMs, static_cast<int>(m_roomIndex));
    }
}

void RunState::Publish(EventType type, const std::string& detail, TimestampMs nowMs, int value) const
{
    if (m_events == nullptr)
    {
        return;
    }
    m_events->Publish(engine::core::Event{type, detail, nowMs, value});
}

TimestampMs RunState::ElapsedMs(TimestampMs nowMs) const
{
    return m_endMs.value_or(nowMs) - m_startMs;
}

RunSnapshot RunState::Snapshot(TimestampMs nowMs) const
{
    const world::RoomGeometry& room = CurrentRoom();
    const world::Season season = m_seasons.Active();

    RunSnapshot snapshot;
    snapshot.season = season;
    snapshot.roomIndex = m_roomIndex;
    snapshot.roomCount = m_rooms.size();
    snapshot.actorBox = m_actor.box;
    snapshot.actorGrounded = m_actor.grounded;
    snapshot.activePlatforms = room.ActivePlatforms(season);
    snapshot.hazards = room.Hazards();
    snapshot.water = room.Water();
    snapshot.wind = room.Wind();
    snapshot.exit = room.Exit();
    snapshot.hazardsActive = world::RoomGeometry::HazardActive(season, m_modifiers.brittleThorns);
    snapshot.outcome = m_outcome;
    snapshot.failReason = m_failReason;
    snapshot.elapsedMs = ElapsedMs(nowMs);
    snapshot.cooldownRemainingMs = m_seasons.CooldownRemainingMs(nowMs);
    snapshot.flashIntensity = m_seasons.FlashIntensity();
    snapshot.echoSeedIds = m_echoSeedIds;
    return snapshot;
}

const char* RunOutcomeToText(RunOutcome outcome)
{
    switch (outcome)
    {
        case RunOutcome::InProgress: return "in_progress";
        case RunOutcome::Won: return "won";
        case RunOutcome::Failed: return "failed";
        default: return "unknown";
    }
}

const char* FailReasonToText(FailReason reason)
{
    switch (reason)
    {
        case FailReason::None: return "none";
        case FailReason::Hazard: return "hazard";
        case FailReason::FellOutOfWorld: return "fell_out_of_world";
        default: return "unknown";
    }
}
} // namespace game::gameplay
