#include <sig-vault/event_dispatcher.hpp>
#include <sig-vault/logger.hpp>
#include <exception>
#include <stdexcept>
#include <vector>

namespace SigVault
{

ListenerId EventDispatcher::addListener(EventListener listener)
{
    std::lock_guard<std::mutex> lock(listeners_mutex);
    ListenerId id = next_id++;
    listeners.emplace(id, std::move(listener));
    return id;
}

void EventDispatcher::removeListener(ListenerId id)
{
    std::lock_guard<std::mutex> lock(listeners_mutex);
    listeners.erase(id);
}

size_t EventDispatcher::listenerCount() const
{
    std::lock_guard<std::mutex> lock(listeners_mutex);
    return listeners.size();
}

void EventDispatcher::publish(const VaultEvent &event)
{
    // Copy so a listener may add or remove listeners while being called
    std::vector<EventListener> snapshot;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex);
        snapshot.reserve(listeners.size());
        for (const auto &[id, listener] : listeners)
        {
            snapshot.push_back(listener);
        }
    }

    Logger::trace(LogCategory::EVENTS, "Publishing {} to {} listener(s)", eventTypeToString(event.type), snapshot.size());

    // Events are published from transfer workers; a throwing listener must not take one down
    for (const auto &listener : snapshot)
    {
        try
        {
            listener(event);
        }
        catch (const std::exception &e)
        {
            Logger::error(LogCategory::EVENTS, "Listener for {} threw: {}", eventTypeToString(event.type), e.what());
        }
        catch (...)
        {
            Logger::error(LogCategory::EVENTS, "Listener for {} threw a non-standard exception",
                          eventTypeToString(event.type));
        }
    }
}

const char *eventTypeToString(EventType type)
{
    switch (type)
    {
    case EventType::DIRECTORY_LISTED:
        return "DirectoryListed";
    case EventType::TRANSFER_PROGRESS:
        return "TransferProgress";
    case EventType::TRANSFER_FAILED:
        return "TransferFailed";
    case EventType::BACKEND_SWITCHED:
        return "BackendSwitched";
    }
    return "Unknown";
}

} // namespace SigVault
