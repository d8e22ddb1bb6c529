#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <utility>

#include "engine/physics/Rect.hpp"
#include "game/gameplay/GameplayTuning.hpp"
#include "game/world/RoomGeometry.hpp"

namespace testsupport
{
using engine::physics::Rect;

/// Ground that the default spawn box stands on.
inline Rect Floor()
{
    return Rect{0, 472, 960, 68};
}

inline game::world::RoomTemplate FlatRoom(std::string id = "flat")
{
    game::world::RoomTemplate layout;
    layout.id = std::move(id);
    layout.platforms.push_back(Floor());
    layout.exit = Rect{200, 400, 40, 72};
    return layout;
}

/// Removes the file on scope exit.
class TempFile
{
public:
    explicit TempFile(const std::string& stem)
    {
        static std::atomic<int> counter{0};
        m_path = std::filesystem::temp_directory_path()
            / ("fractured_forest_" + stem + "_" + std::to_string(counter.fetch_add(1)) + ".json");
    }

    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] std::string Path() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};
} // namespace testsupport
