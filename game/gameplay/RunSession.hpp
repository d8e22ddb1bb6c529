#pragma once

#include <cstdint>
#include <memory>
#include <random>

#include "game/gameplay/EchoSeedRegistry.hpp"
#include "game/gameplay/GameplayTuning.hpp"
#include "game/gameplay/RunState.hpp"
#include "game/world/RoomCatalog.hpp"

namespace engine::core
{
class EventBus;
}

namespace game::gameplay
{
/// Owns the catalogs and the random source, and the run currently being played.
/// Restarting samples a fresh room sequence and echo seed selection and builds
/// a new RunState; nothing from the previous run carries over.
class RunSession
{
public:
    RunSession(
        GameplayTuning tuning,
        world::RoomCatalog rooms,
        seeds::EchoSeedRegistry seeds,
        std::uint32_t rngSeed,
        engine::core::EventBus* events = nullptr
    );

    /// Throws std::invalid_argument when tuning is invalid or asks for no rooms or more seeds than the pool holds.
    void StartNewRun(TimestampMs nowMs);

    /// Restarts only once the current run has ended. Returns whether a new run began.
    bool RequestRestart(TimestampMs nowMs);

    void Tick(const FrameInput& input, TimestampMs nowMs);

    [[nodiscard]] bool HasRun() const { return m_run != nullptr; }
    [[nodiscard]] const RunState& Current() const;
    [[nodiscard]] unsigned RunsStarted() const { return m_runsStarted; }

    [[nodiscard]] const GameplayTuning& Tuning() const { return m_tuning; }
    [[nodiscard]] const world::RoomCatalog& Rooms() const { return m_rooms; }
    [[nodiscard]] const seeds::EchoSeedRegistry& Seeds() const { return m_seeds; }

private:
    GameplayTuning m_tuning;
    world::RoomCatalog m_rooms;
    seeds::EchoSeedRegistry m_seeds;
    std::mt19937 m_rng;
    engine::core::EventBus* m_events = nullptr;
    std::unique_ptr<RunState> m_run;
    unsigned m_runsStarted = 0;
};
} // namespace game::gameplay
