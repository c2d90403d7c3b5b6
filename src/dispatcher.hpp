#pragma once
#include "bounded_queue.hpp"
#include "listeners.hpp"
#include "message.hpp"
#include "stop_signal.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace kindling {

enum class StreamErrorKind {
    Transport, // connection drop, HTTP failure, poll failure
    Listener,  // a listener threw
};

struct StreamError {
    StreamErrorKind kind = StreamErrorKind::Transport;
    std::string message;
    uint32_t attempt = 0;   // consecutive transport failures, 0 for listener errors
    int64_t message_id = 0; // message being dispatched, listener errors only
};

using StreamErrorCallback = std::function<void(const StreamError&)>;

// What the fetch thread hands the dispatch thread. Errors share the queue
// so they are reported in order, on the dispatch thread.
using StreamItem = std::variant<Message, StreamError>;
using StreamQueue = BoundedQueue<StreamItem>;

// Drains a stream queue and fans each message out to the listeners.
class Dispatcher {
public:
    Dispatcher(const ListenerList& listeners, StreamQueue& queue,
               const StopSignal& stop, StreamErrorCallback on_error);

    // Consume until the queue is closed and empty, or stop is requested.
    // Returns the number of messages dispatched.
    uint64_t run();

    // Deliver one message to every listener in attachment order.
    // Returns the number of listeners that threw.
    size_t dispatch(const Message& msg);

    void report(const StreamError& err);

private:
    const ListenerList& listeners_;
    StreamQueue& queue_;
    const StopSignal& stop_;
    StreamErrorCallback on_error_;
};

} // namespace kindling
