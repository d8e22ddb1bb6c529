#include "game/gameplay/RunSession.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "engine/core/EventBus.hpp"

namespace game::gameplay
{
RunSession::RunSession(
    GameplayTuning tuning,
    world::RoomCatalog rooms,
    seeds::EchoSeedRegistry seeds,
    std::uint32_t rngSeed,
    engine::core::EventBus* events
)
    : m_tuning(std::move(tuning))
    , m_rooms(std::move(rooms))
    , m_seeds(std::move(seeds))
    , m_rng(rngSeed)
    , m_events(events)
{
}

void RunSession::StartNewRun(TimestampMs nowMs)
{
    if (m_tuning.roomsPerRun <= 0)
    {
        throw std::invalid_argument("rooms_per_run must be positive");
    }
    if (m_tuning.echoSeedsPerRun < 0)
    {
        throw std::invalid_argument("echo_seeds_per_run must not be negative");
    }
    std::string tuningError;
    if (!m_tuning.Validate(&tuningError))
    {
        throw std::invalid_argument("invalid gameplay tuning: " + tuningError);
    }

    RunSetup setup;
    setup.rooms = m_rooms.SampleRooms(static_cast<std::size_t>(m_tuning.roomsPerRun), m_rng);
    setup.echoSeedIds = m_seeds.SelectSeeds(static_cast<std::size_t>(m_tuning.echoSeedsPerRun), m_rng);
    setup.modifiers = m_seeds.ResolveModifiers(setup.echoSeedIds);
    setup.tuning = m_tuning;
    setup.startMs = nowMs;

    if (m_events != nullptr)
    {
        m_events->DiscardPending();
    }

    std::cout << "[Run] Starting run " << (m_runsStarted + 1) << " with echo seeds:";
    for (const std::string& id : setup.echoSeedIds)
    {
        const seeds::EchoSeed* seed = m_seeds.GetSeed(id);
        std::cout << " " << (seed != nullptr ? seed->name : id);
    }
    std::cout << "\n";

    m_run = std::make_unique<RunState>(std::move(setup), m_events);
    ++m_runsStarted;
}

bool RunSession::RequestRestart(TimestampMs nowMs)
{
    if (m_run != nullptr && !m_run->IsTerminal())
    {
        return false;
    }
    StartNewRun(nowMs);
    return true;
}

void RunSession::Tick(const FrameInput& input, TimestampMs nowMs)
{
    if (m_run != nullptr)
    {
        m_run->Tick(input, nowMs);
    }
}

const RunState& RunSession::Current() const
{
    if (m_run == nullptr)
    {
        throw std::logic_error("no run has been started");
    }
    return *m_run;
}
} // namespace game::gameplay
