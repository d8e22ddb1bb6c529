#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <string>
#include <vector>

namespace engine::core
{
enum class EventType : std::size_t
{
    SeasonCycled = 0,
    RoomEntered,
    RunWon,
    RunFailed,
    Count
};

struct Event
{
    EventType type = EventType::SeasonCycled;
    std::string detail;
    std::int64_t timestampMs = 0;
    int value = 0;
};

/// Queued publish/subscribe channel. Handlers run only from DispatchQueued,
/// so publishers never re-enter subscriber code mid-frame.
class EventBus
{
public:
    using Handler = std::function<void(const Event&)>;

    void Subscribe(EventType type, Handler handler);
    void Publish(Event event);
    void DispatchQueued();
    void DiscardPending();

    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }

private:
    std::array<std::vector<Handler>, static_cast<std::size_t>(EventType::Count)> m_handlers;
    std::queue<Event> m_queue;
};

[[nodiscard]] const char* EventTypeToText(EventType type);
} // namespace engine::core
