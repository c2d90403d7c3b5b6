#pragma once
#include "config.hpp"
#include "dispatcher.hpp"
#include "fetcher.hpp"
#include "listeners.hpp"
#include "stop_signal.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace kindling {

class Room;

enum class StreamState {
    Idle,
    Running,
    Stopping,
    Stopped,
};

const char* stream_state_name(StreamState state);

// Message stream for one room: a fetch thread pulls events and classifies
// them, a dispatch thread hands each message to every listener in order.
// The two share nothing but a bounded queue; a slow listener makes the
// fetcher wait rather than drop messages.
class Stream {
public:
    Stream(Room& room, const StreamConfig& config, StreamErrorCallback on_error = {});

    // Custom fetch strategy (tests, replays)
    Stream(Room& room, std::unique_ptr<Fetcher> fetcher, const StreamConfig& config,
           StreamErrorCallback on_error = {});

    ~Stream();

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    ListenerId attach(MessageListener listener);
    bool detach(ListenerId id);

    // Live streams join the room first; a failed join throws
    // ConnectionError and leaves the stream idle.
    void start();

    // Ask both threads to exit. Returns immediately.
    void stop();

    // Block until stopped. Throws NotStartedError when idle.
    void join();

    StreamState state() const { return state_.load(); }
    StreamMode mode() const { return mode_; }
    bool is_streaming() const { return state_.load() == StreamState::Running; }

    // Messages handed to listeners, counted once the dispatch thread exits
    uint64_t delivered() const { return delivered_.load(); }

    Room& room() const { return room_; }

private:
    void run_fetch();
    void run_dispatch();
    void unit_finished();
    void join_threads();

    Room& room_;
    StreamConfig config_;
    StreamMode mode_;
    std::unique_ptr<Fetcher> fetcher_;
    ListenerList listeners_;
    StreamErrorCallback on_error_;

    StopSignal stop_;
    std::unique_ptr<StreamQueue> queue_;
    std::atomic<StreamState> state_{StreamState::Idle};
    std::atomic<uint64_t> delivered_{0};

    std::mutex mutex_;
    std::condition_variable stopped_cv_;
    int active_units_ = 0;
    bool starting_ = false;     // start() is joining the room

    std::mutex join_mutex_;
    std::thread fetch_thread_;
    std::thread dispatch_thread_;
    std::atomic<std::thread::id> dispatch_id_{};
};

} // namespace kindling
