#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "engine/core/EventBus.hpp"
#include "engine/physics/Rect.hpp"
#include "game/gameplay/ActorPhysics.hpp"
#include "game/gameplay/GameplayTuning.hpp"
#include "game/gameplay/Modifiers.hpp"
#include "game/world/RoomGeometry.hpp"
#include "game/world/SeasonCycle.hpp"

namespace game::gameplay
{
using world::TimestampMs;

enum class RunOutcome
{
    InProgress,
    Won,
    Failed
};

enum class FailReason
{
    None,
    Hazard,
    FellOutOfWorld
};

/// Input sampled once at the start of a frame.
struct FrameInput
{
    MoveIntent move;
    bool cycleSeasonPressed = false;
    bool jumpPressed = false;
};

/// Everything a run is constructed from. Rooms must not be empty.
struct RunSetup
{
    std::vector<world::RoomGeometry> rooms;
    std::vector<std::string> echoSeedIds;
    Modifiers modifiers;
    GameplayTuning tuning;
    world::Season initialSeason = world::Season::Spring;
    TimestampMs startMs = 0;
};

/// Read-only view of a run for presentation.
struct RunSnapshot
{
    world::Season season = world::Season::Spring;
    std::size_t roomIndex = 0;
    std::size_t roomCount = 0;
    engine::physics::Rect actorBox;
    bool actorGrounded = false;
    std::vector<engine::physics::Rect> activePlatforms;
    std::vector<engine::physics::Rect> hazards;
    std::vector<engine::physics::Rect> water;
    std::vector<engine::physics::Rect> wind;
    engine::physics::Rect exit;
    bool hazardsActive = false;
    RunOutcome outcome = RunOutcome::InProgress;
    FailReason failReason = FailReason::None;
    TimestampMs elapsedMs = 0;
    TimestampMs cooldownRemainingMs = 0;
    int flashIntensity = 0;
    std::vector<std::string> echoSeedIds;
};

/// One attempt through an ordered sequence of rooms.
///
/// InProgress -> Won | Failed is one-way. Once terminal, Tick is a no-op and
/// the actor and room stay frozen; playing again means constructing a new run.
class RunState
{
public:
    /// Throws std::invalid_argument when setup.rooms is empty or setup.tuning fails Validate.
    explicit RunState(RunSetup setup, engine::core::EventBus* events = nullptr);

    void Tick(const FrameInput& input, TimestampMs nowMs);

    [[nodiscard]] RunOutcome Outcome() const { return m_outcome; }
    [[nodiscard]] FailReason GetFailReason() const { return m_failReason; }
    [[nodiscard]] bool IsTerminal() const { return m_outcome != RunOutcome::InProgress; }

    /// Index of the room being played; equals RoomCount() once the run is won.
    [[nodiscard]] std::size_t RoomIndex() const { return m_roomIndex; }
    [[nodiscard]] std::size_t RoomCount() const { return m_rooms.size(); }
    [[nodiscard]] const world::RoomGeometry& CurrentRoom() const;

    [[nodiscard]] const Actor& GetActor() const { return m_actor; }
    [[nodiscard]] const world::SeasonCycle& Seasons() const { return m_seasons; }
    [[nodiscard]] const Modifiers& GetModifiers() const { return m_modifiers; }
    [[nodiscard]] const std::vector<std::string>& EchoSeedIds() const { return m_echoSeedIds; }

    [[nodiscard]] TimestampMs StartMs() const { return m_startMs; }
    [[nodiscard]] std::optional<TimestampMs> EndMs() const { return m_endMs; }

    /// Run duration: fixed at the end timestamp once terminal, otherwise measured to nowMs.
    [[nodiscard]] TimestampMs ElapsedMs(TimestampMs nowMs) const;

    [[nodiscard]] RunSnapshot Snapshot(TimestampMs nowMs) const;

private:
    void EvaluateOutcome(TimestampMs nowMs);
    void AdvanceRoom(TimestampMs nowMs);
    void Finish(RunOutcome outcome, FailReason reason, TimestampMs nowMs);
    void Publish(engine::core::EventType type, const std::string& detail, TimestampMs nowMs, int value) const;

    const std::vector<world::RoomGeometry> m_rooms;
    const std::vector<std::string> m_echoSeedIds;
    const Modifiers m_modifiers;
    const ActorPhysics m_physics;
    const int m_fallLineY;

    world::SeasonCycle m_seasons;
    Actor m_actor;
    std::size_t m_roomIndex = 0;
    RunOutcome m_outcome = RunOutcome::InProgress;
    FailReason m_failReason = FailReason::None;
    TimestampMs m_startMs = 0;
    std::optional<TimestampMs> m_endMs;

    engine::core::EventBus* m_events = nullptr;
};

[[nodiscard]] const char* RunOutcomeToText(RunOutcome outcome);
[[nodiscard]] const char* FailReasonToText(FailReason reason);
} // namespace game::gameplay
