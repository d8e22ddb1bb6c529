#include "engine/core/App.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "game/world/Season.hpp"

namespace engine::core
{
namespace
{
constexpr double kTitleRefreshSeconds = 0.1;

std::uint32_t MakeRunSeed()
{
    return static_cast<std::uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count());
}
} // namespace

App::App(std::string configDirectory)
    : m_configDirectory(std::move(configDirectory))
{
}

std::string App::ConfigPath(const char* fileName) const
{
    return (std::filesystem::path(m_configDirectory) / fileName).string();
}

bool App::Run()
{
    std::cout << "Fractured Forest\n";

    std::error_code dirError;
    std::filesystem::create_directories(m_configDirectory, dirError);
    if (dirError)
    {
        std::cerr << "App: WARNING - cannot create config directory " << m_configDirectory << ": " << dirError.message() << "\n";
    }

    (void)LoadGameplayConfig();
    (void)LoadRoomsConfig();
    (void)LoadEchoSeedsConfig();
    (void)LoadControlsConfig();

    m_windowSettings.width = m_tuning.worldWidth;
    m_windowSettings.height = m_tuning.worldHeight;
    m_windowSettings.title = "Fractured Forest";

    if (!m_window.Initialize(m_windowSettings))
    {
        return false;
    }

    if (!m_renderer.Initialize(m_window.FramebufferWidth(), m_window.FramebufferHeight(), m_tuning.worldWidth, m_tuning.worldHeight))
    {
        std::cerr << "Failed to initialize renderer.\n";
        m_window.Shutdown();
        return false;
    }

    m_window.SetResizeCallback([this](int width, int height) { m_renderer.SetViewport(width, height); });

    SubscribeRunEvents();
    m_time.SetFixedTickRate(m_tuning.fixedTickHz);
    m_time.Reset();

    try
    {
        m_session = std::make_unique<game::gameplay::RunSession>(m_tuning, m_rooms, m_seeds, MakeRunSeed(), &m_events);
        m_session->StartNewRun(m_time.SimulationMilliseconds());
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Failed to start run: " << ex.what() << "\n";
        m_renderer.Shutdown();
        m_window.Shutdown();
        return false;
    }
    m_events.DispatchQueued();

    while (!m_window.ShouldClose())
    {
        m_window.PollEvents();
        m_input.Update(m_window.NativeHandle());
        m_time.BeginFrame(m_window.NowSeconds());

        if (m_actionBindings.IsPressed(m_input, platform::InputAction::Quit))
        {
            m_window.SetShouldClose(true);
        }

        LatchInput();
        while (m_time.ShouldRunFixedStep())
        {
            m_time.ConsumeFixedStep();
            RunFixedStep();
        }

        RenderFrame();
        UpdateWindowTitle();
        m_window.SwapBuffers();
    }

    m_renderer.Shutdown();
    m_window.Shutdown();
    return true;
}

void App::LatchInput()
{
    using platform::InputAction;
    m_pending.jump = m_pending.jump || m_actionBindings.IsPressed(m_input, InputAction::Jump);
    m_pending.cycleSeason = m_pending.cycleSeason || m_actionBindings.IsPressed(m_input, InputAction::CycleSeason);
    m_pending.restart = m_pending.restart || m_actionBindings.IsPressed(m_input, InputAction::RestartRun);
}

void App::RunFixedStep()
{
    using platform::InputAction;
    const game::gameplay::TimestampMs nowMs = m_time.SimulationMilliseconds();

    if (m_pending.restart)
    {
        if (m_session->RequestRestart(nowMs))
        {
            m_pending = PendingActions{};
            m_events.DispatchQueued();
            return;
        }
        m_pending.restart = false;
    }

    game::gameplay::FrameInput input;
    input.move.left = m_actionBindings.IsDown(m_input, InputAction::MoveLeft);
    input.move.right = m_actionBindings.IsDown(m_input, InputAction::MoveRight);
    input.jumpPressed = m_pending.jump;
    input.cycleSeasonPressed = m_pending.cycleSeason;
    m_pending.jump = false;
    m_pending.cycleSeason = false;

    m_session->Tick(input, nowMs);
    m_events.DispatchQueued();
}

void App::RenderFrame()
{
    const game::gameplay::RunSnapshot snapshot = m_session->Current().Snapshot(m_time.SimulationMilliseconds());
    const game::ui::RoomFrame frame = m_roomView.Compose(snapshot);

    m_renderer.BeginFrame(frame.clearColor);
    for (const game::ui::ColoredRect& rect : frame.rects)
    {
        m_renderer.DrawRect(rect.rect, rect.color);
    }
    m_renderer.EndFrame();
}

void App::UpdateWindowTitle()
{
    if (m_lastTitleRefreshSeconds >= 0.0 && m_time.TotalSeconds() - m_lastTitleRefreshSeconds < kTitleRefreshSeconds)
    {
        return;
    }
    m_lastTitleRefreshSeconds = m_time.TotalSeconds();

    const game::gameplay::RunState& run = m_session->Current();
    const game::gameplay::RunSnapshot snapshot = run.Snapshot(m_time.SimulationMilliseconds());

    std::ostringstream title;
    title << std::fixed << std::setprecision(2);
    title << "Fractured Forest | " << game::world::SeasonToText(snapshot.season);

    if (snapshot.outcome == game::gameplay::RunOutcome::InProgress)
    {
        title << " | Room " << (snapshot.roomIndex + 1) << "/" << snapshot.roomCount;
        title << " | Cycle cooldown " << static_cast<double>(snapshot.cooldownRemainingMs) / 1000.0 << "s";
    }
    else
    {
        const bool won = snapshot.outcome == game::gameplay::RunOutcome::Won;
        title << " | " << (won ? "Run Complete" : "Run Failed");
        title << " | Rooms cleared " << snapshot.roomIndex << "/" << snapshot.roomCount;
        title << " | Time " << static_cast<double>(snapshot.elapsedMs) / 1000.0 << "s";
        title << " | Press " << platform::ActionBindings::CodeToLabel(m_actionBindings.GetCode(platform::InputAction::RestartRun, 0))
              << " to restart";
    }

    title << " | Echo Seeds:";
    if (snapshot.echoSeedIds.empty())
    {
        title << " none";
    }
    for (const std::string& id : snapshot.echoSeedIds)
    {
        const game::gameplay::seeds::EchoSeed* seed = m_session->Seeds().GetSeed(id);
        title << " " << (seed != nullptr ? seed->name : id);
    }

    m_window.SetTitle(title.str());
}

void App::SubscribeRunEvents()
{
    m_events.Subscribe(EventType::SeasonCycled, [](const Event& event) {
        std::cout << "[Season] " << event.detail << " at " << event.timestampMs << " ms\n";
    });
    m_events.Subscribe(EventType::RoomEntered, [](const Event& event) {
        std::cout << "[Run] Entered room " << (event.value + 1) << " (" << event.detail << ")\n";
    });
    // Run results are logged by the run itself; refresh the title bar straight away.
    m_events.Subscribe(EventType::RunWon, [this](const Event&) { m_lastTitleRefreshSeconds = -1.0; });
    m_events.Subscribe(EventType::RunFailed, [this](const Event&) { m_lastTitleRefreshSeconds = -1.0; });
}

bool App::LoadGameplayConfig()
{
    m_tuning = game::gameplay::GameplayTuning{};
    const std::string path = ConfigPath("gameplay_tuning.json");
    if (!std::filesystem::exists(path))
    {
        return game::gameplay::SaveGameplayTuning(path, m_tuning);
    }
    if (!game::gameplay::LoadGameplayTuning(path, m_tuning))
    {
        std::cout << "App: WARNING - " << path << " is invalid, using default tuning\n";
        m_tuning = game::gameplay::GameplayTuning{};
        return false;
    }
    return true;
}

bool App::LoadRoomsConfig()
{
    const std::string path = ConfigPath("rooms.json");
    if (!std::filesystem::exists(path))
    {
        return m_rooms.SaveToJson(path);
    }
    return m_rooms.LoadFromJson(path);
}

bool App::LoadEchoSeedsConfig()
{
    const std::string path = ConfigPath("echo_seeds.json");
    if (!std::filesystem::exists(path))
    {
        return m_seeds.SaveSeedsToJson(path);
    }
    return m_seeds.LoadSeedsFromJson(path);
}

bool App::LoadControlsConfig()
{
    m_actionBindings.ResetDefaults();
    const std::string path = ConfigPath("controls.json");
    if (!std::filesystem::exists(path))
    {
        std::string error;
        if (!m_actionBindings.SaveToJsonFile(path, &error))
        {
            std::cout << "App: WARNING - " << error << "\n";
            return false;
        }
        return true;
    }

    std::string error;
    if (!m_actionBindings.LoadFromJsonFile(path, &error))
    {
        std::cout << "App: WARNING - " << error << ". Using default controls.\n";
        m_actionBindings.ResetDefaults();
        return false;
    }
    return true;
}
} // namespace engine::core
