#pragma once
#include "message.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace kindling {

using MessageListener = std::function<void(const Message&)>;
using ListenerId = uint64_t;

// Ordered set of message listeners. Thread-safe: attach/detach may run on
// any thread while a dispatcher iterates over a snapshot.
class ListenerList {
public:
    // Append a listener. Returns an ID usable with detach().
    ListenerId attach(MessageListener listener);

    // Remove by ID. Returns true if found and removed.
    bool detach(ListenerId id);

    // Copy of the current listeners in attachment order. Taken under the
    // lock, so callers invoke them without holding it.
    std::vector<MessageListener> snapshot() const;

    // Remove all listeners.
    void clear();

    size_t size() const;

private:
    struct Entry {
        ListenerId id;
        MessageListener listener;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    ListenerId next_id_ = 1;
};

} // namespace kindling
