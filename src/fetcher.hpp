#pragma once
#include "config.hpp"
#include "connection.hpp"
#include "stop_signal.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kindling {

// Where a fetcher sends what it pulls off the wire.
struct FetchSink {
    // Raw decoded event. Return false to make the fetcher exit.
    std::function<bool(const nlohmann::json& event)> on_event;
    // Transport failure; attempt counts consecutive failures from 1.
    std::function<void(const std::string& message, uint32_t attempt)> on_error;
};

// Producer half of a stream: pulls events for one room until stopped.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Blocks until stop is requested, the sink refuses an event, or the
    // fetcher gives up on the transport.
    virtual void run(StopSignal& stop, const FetchSink& sink) = 0;

    virtual StreamMode mode() const = 0;
};

// Splits the live stream into events. The server writes one JSON object
// per line, terminated by '\r' (sometimes "\r\n"), and sends bare
// whitespace as keepalive.
class LiveDecoder {
public:
    // Return false to stop decoding.
    using Callback = std::function<bool(const nlohmann::json& event)>;

    // Feed raw bytes. Complete lines go to callback; a partial line is kept
    // for the next feed. Lines that are not JSON are handed on as a string
    // so classification can still report them.
    bool feed(const std::string& chunk, const Callback& callback);

    void reset();

    size_t buffered() const { return buffer_.size(); }

private:
    std::string buffer_;
};

// Deduplicates overlapping transcript snapshots. Each call returns the
// events not returned before, ordered by id.
class TranscriptCursor {
public:
    explicit TranscriptCursor(size_t max_tracked = 4096);

    std::vector<nlohmann::json> delta(const nlohmann::json& events);

    // Highest id seen so far, 0 before the first event
    int64_t last_id() const { return last_id_; }

    size_t tracked() const { return seen_.size(); }

private:
    size_t max_tracked_;
    std::set<int64_t> seen_;
    int64_t floor_ = 0;   // ids at or below this were pruned from seen_ and count as seen
    int64_t last_id_ = 0;
};

// Holds the live endpoint open, reconnecting with exponential backoff.
class LiveFetcher : public Fetcher {
public:
    LiveFetcher(Connection& connection, int64_t room_id, const StreamConfig& config);

    void run(StopSignal& stop, const FetchSink& sink) override;
    StreamMode mode() const override { return StreamMode::Live; }

private:
    Connection& connection_;
    int64_t room_id_;
    StreamConfig config_;
};

// Re-reads the room transcript on a fixed interval.
class PollingFetcher : public Fetcher {
public:
    PollingFetcher(Connection& connection, int64_t room_id, const StreamConfig& config);

    void run(StopSignal& stop, const FetchSink& sink) override;
    StreamMode mode() const override { return StreamMode::Polling; }

private:
    Connection& connection_;
    int64_t room_id_;
    StreamConfig config_;
};

std::unique_ptr<Fetcher> make_fetcher(const StreamConfig& config,
                                      Connection& connection, int64_t room_id);

} // namespace kindling
