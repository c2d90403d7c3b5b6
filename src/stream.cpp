#include "stream.hpp"
#include "errors.hpp"
#include "room.hpp"

#include <iostream>

namespace kindling {

const char* stream_state_name(StreamState state) {
    switch (state) {
        case StreamState::Idle:     return "idle";
        case StreamState::Running:  return "running";
        case StreamState::Stopping: return "stopping";
        case StreamState::Stopped:  return "stopped";
    }
    return "unknown";
}

Stream::Stream(Room& room, const StreamConfig& config, StreamErrorCallback on_error)
    : Stream(room, make_fetcher(config, room.connection(), room.id()), config,
             std::move(on_error))
{}

Stream::Stream(Room& room, std::unique_ptr<Fetcher> fetcher, const StreamConfig& config,
               StreamErrorCallback on_error)
    : room_(room)
    , config_(config)
    , mode_(fetcher->mode())
    , fetcher_(std::move(fetcher))
    , on_error_(std::move(on_error))
{
    if (config_.queue_capacity == 0) config_.queue_capacity = 256;
}

Stream::~Stream() {
    stop();
    join_threads();
}

ListenerId Stream::attach(MessageListener listener) {
    return listeners_.attach(std::move(listener));
}

bool Stream::detach(ListenerId id) {
    return listeners_.detach(id);
}

void Stream::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() != StreamState::Idle || starting_) throw AlreadyStartedError("Stream");
        starting_ = true;
    }

    // The live endpoint only serves rooms the user is in. Joined outside
    // the lock; stop() must not wait on the network.
    if (mode_ == StreamMode::Live) {
        try {
            room_.join();
        } catch (const std::exception&) {
            std::lock_guard<std::mutex> lock(mutex_);
            starting_ = false;
            throw;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    starting_ = false;
    queue_ = std::make_unique<StreamQueue>(config_.queue_capacity);
    active_units_ = 2;
    state_ = StreamState::Running;
    std::cerr << "[stream] Starting " << stream_mode_name(mode_) << " stream for room "
              << room_.id() << '\n';

    fetch_thread_ = std::thread(&Stream::run_fetch, this);
    dispatch_thread_ = std::thread(&Stream::run_dispatch, this);
}

void Stream::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() != StreamState::Running) return;
    state_ = StreamState::Stopping;
    stop_.request();
    // Wakes a fetcher blocked on a full queue and a dispatcher on an empty one
    queue_->close();
}

void Stream::join() {
    if (state_.load() == StreamState::Idle) throw NotStartedError("Stream");
    if (std::this_thread::get_id() == dispatch_id_.load()) {
        throw std::logic_error("Stream::join called from a listener");
    }
    {
        std::unique_lock<std::mutex> lock(mutex_);
        stopped_cv_.wait(lock, [this] { return state_.load() == StreamState::Stopped; });
    }
    join_threads();
}

void Stream::join_threads() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (fetch_thread_.joinable()) fetch_thread_.join();
    if (dispatch_thread_.joinable()) dispatch_thread_.join();
}

void Stream::run_fetch() {
    FetchSink sink;
    sink.on_event = [this](const nlohmann::json& event) {
        return queue_->push(classify(event));
    };
    sink.on_error = [this](const std::string& message, uint32_t attempt) {
        StreamError err;
        err.kind = StreamErrorKind::Transport;
        err.message = message;
        err.attempt = attempt;
        queue_->force_push(std::move(err));
    };

    try {
        fetcher_->run(stop_, sink);
    } catch (const std::exception& e) {
        std::cerr << "[stream] Fetcher for room " << room_.id() << " failed: "
                  << e.what() << '\n';
        StreamError err;
        err.kind = StreamErrorKind::Transport;
        err.message = e.what();
        queue_->force_push(std::move(err));
    }

    // Lets the dispatcher drain what is left and exit
    queue_->close();
    unit_finished();
}

void Stream::run_dispatch() {
    dispatch_id_ = std::this_thread::get_id();
    Dispatcher dispatcher(listeners_, *queue_, stop_, on_error_);
    delivered_ = dispatcher.run();
    unit_finished();
}

void Stream::unit_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (--active_units_ > 0) return;
    state_ = StreamState::Stopped;
    std::cerr << "[stream] Room " << room_.id() << " stream stopped, "
              << delivered_.load() << " messages delivered\n";
    stopped_cv_.notify_all();
}

} // namespace kindling
