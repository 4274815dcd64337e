#pragma once

#include "../types/vault_event.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace SigVault
{

using EventListener = std::function<void(const VaultEvent &)>;
using ListenerId = uint64_t;

// Fans events out to registered listeners. Listeners run synchronously on
// the publishing thread (a transfer worker or the browsing caller) and must
// not block.
class EventDispatcher
{
    public:
    ListenerId addListener(EventListener listener);
    void removeListener(ListenerId id);

    void publish(const VaultEvent &event);

    size_t listenerCount() const;

    private:
    mutable std::mutex listeners_mutex;
    std::unordered_map<ListenerId, EventListener> listeners;
    ListenerId next_id = 1;
};

const char *eventTypeToString(EventType type);

} // namespace SigVault
