#include "listeners.hpp"

namespace kindling {

ListenerId ListenerList::attach(MessageListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = next_id_++;
    entries_.push_back(Entry{id, std::move(listener)});
    return id;
}

bool ListenerList::detach(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->id == id) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

std::vector<MessageListener> ListenerList::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MessageListener> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        out.push_back(e.listener);
    }
    return out;
}

void ListenerList::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t ListenerList::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace kindling
