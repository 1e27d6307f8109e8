#include "host.hpp"

int Host::addListener(HostEvent::Kind kind, Listener listener)
{
    const int handle = nextHandle++;
    listeners.push_back({ handle, kind, std::move(listener) });
    return handle;
}

void Host::removeListener(int handle)
{
    listeners.erase(std::remove_if(listeners.begin(), listeners.end(),
                        [handle](const Entry& entry) { return entry.handle == handle; }),
        listeners.end());
}

void Host::dispatch(const HostEvent& event)
{
    // walk a snapshot of handles so a listener removing itself (stop() from inside a handler) doesn't
    // invalidate the loop, and look each one up again so removed listeners aren't called
    std::vector<int> handles;
    for (const Entry& entry : listeners)
        if (entry.kind == event.kind)
            handles.push_back(entry.handle);

    for (int handle : handles) {
        const auto found = std::find_if(listeners.begin(), listeners.end(),
            [handle](const Entry& entry) { return entry.handle == handle; });
        if (found == listeners.end())
            continue;
        // copy, the callback may erase its own entry
        const Listener listener = found->listener;
        listener(event);
    }
}
