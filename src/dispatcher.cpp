#include "dispatcher.hpp"

#include <iostream>

namespace kindling {

Dispatcher::Dispatcher(const ListenerList& listeners, StreamQueue& queue,
                       const StopSignal& stop, StreamErrorCallback on_error)
    : listeners_(listeners), queue_(queue), stop_(stop), on_error_(std::move(on_error))
{}

uint64_t Dispatcher::run() {
    uint64_t delivered = 0;
    while (!stop_.requested()) {
        auto item = queue_.pop();
        if (!item) break;
        if (stop_.requested()) break;

        if (auto* msg = std::get_if<Message>(&*item)) {
            dispatch(*msg);
            ++delivered;
        } else {
            report(std::get<StreamError>(*item));
        }
    }
    return delivered;
}

size_t Dispatcher::dispatch(const Message& msg) {
    size_t failures = 0;
    for (const auto& listener : listeners_.snapshot()) {
        std::string what;
        try {
            listener(msg);
            continue;
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "unknown exception";
        }
        ++failures;
        std::cerr << "[stream] Listener failed on message " << msg.id
                  << ": " << what << '\n';
        StreamError err;
        err.kind = StreamErrorKind::Listener;
        err.message = what;
        err.message_id = msg.id;
        report(err);
    }
    return failures;
}

void Dispatcher::report(const StreamError& err) {
    if (!on_error_) return;
    try {
        on_error_(err);
    } catch (const std::exception& e) {
        std::cerr << "[stream] Error callback threw: " << e.what() << '\n';
    } catch (...) {
        std::cerr << "[stream] Error callback threw an unknown exception\n";
    }
}

} // namespace kindling
