#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "engine/core/EventBus.hpp"
#include "engine/core/Time.hpp"
#include "engine/platform/ActionBindings.hpp"
#include "engine/platform/Input.hpp"
#include "engine/platform/Window.hpp"
#include "engine/render/Renderer.hpp"
#include "game/gameplay/EchoSeedRegistry.hpp"
#include "game/gameplay/GameplayTuning.hpp"
#include "game/gameplay/RunSession.hpp"
#include "game/ui/RoomView.hpp"
#include "game/world/RoomCatalog.hpp"

namespace engine::core
{
class App
{
public:
    explicit App(std::string configDirectory = "config");

    bool Run();

private:
    /// Edge-triggered actions are latched per rendered frame and consumed by
    /// the next fixed step, so a press is never lost when a frame runs no step.
    struct PendingActions
    {
        bool jump = false;
        bool cycleSeason = false;
        bool restart = false;
    };

    bool LoadGameplayConfig();
    bool LoadRoomsConfig();
    bool LoadEchoSeedsConfig();
    bool LoadControlsConfig();
    [[nodiscard]] std::string ConfigPath(const char* fileName) const;

    void SubscribeRunEvents();
    void LatchInput();
    void RunFixedStep();
    void RenderFrame();
    void UpdateWindowTitle();

    std::string m_configDirectory;

    platform::Window m_window;
    platform::WindowSettings m_windowSettings;
    platform::Input m_input;
    platform::ActionBindings m_actionBindings;
    render::Renderer m_renderer;
    Time m_time;
    EventBus m_events;

    game::gameplay::GameplayTuning m_tuning;
    game::world::RoomCatalog m_rooms;
    game::gameplay::seeds::EchoSeedRegistry m_seeds;
    std::unique_ptr<game::gameplay::RunSession> m_session;
    game::ui::RoomView m_roomView;

    PendingActions m_pending;
    double m_lastTitleRefreshSeconds = -1.0;
};
} // namespace engine::core
