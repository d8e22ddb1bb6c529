#include "engine/core/EventBus.hpp"

#include <utility>

namespace engine::core
{
void EventBus::Subscribe(EventType type, Handler handler)
{
    m_handlers[static_cast<std::size_t>(type)].push_back(std::move(handler));
}

void EventBus::Publish(Event event)
{
    m_queue.push(std::move(event));
}

void EventBus::DispatchQueued()
{
    while (!m_queue.empty())
    {
        Event event = std::move(m_queue.front());
        m_queue.pop();

        for (const Handler& handler : m_handlers[static_cast<std::size_t>(event.type)])
        {
            handler(event);
        }
    }
}

void EventBus::DiscardPending()
{
    std::queue<Event> empty;
    m_queue.swap(empty);
}

const char* EventTypeToText(EventType type)
{
    switch (type)
    {
        case EventType::SeasonCycled: return "season_cycled";
        case EventType::RoomEntered: return "room_entered";
        case EventType::RunWon: return "run_won";
        case EventType::RunFailed: return "run_failed";
        default: return "unknown";
    }
}
} // namespace engine::core
