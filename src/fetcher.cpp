#include "fetcher.hpp"
#include "errors.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>

namespace kindling {

// ── LiveDecoder ─────────────────────────────────────────────────

static bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

bool LiveDecoder::feed(const std::string& chunk, const Callback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t end = buffer_.find_first_of("\r\n", pos);
        if (end == std::string::npos) {
            // Incomplete line - keep remainder in buffer
            buffer_ = buffer_.substr(pos);
            return true;
        }

        std::string line = buffer_.substr(pos, end - pos);
        pos = end + 1;
        if (is_blank(line)) continue;

        nlohmann::json event;
        try {
            event = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception&) {
            std::cerr << "[live] Undecodable line (" << line.size() << " bytes)\n";
            event = line;
        }
        if (!callback(event)) {
            buffer_ = buffer_.substr(pos);
            return false;
        }
    }

    buffer_.clear();
    return true;
}

void LiveDecoder::reset() {
    buffer_.clear();
}

// ── TranscriptCursor ────────────────────────────────────────────

TranscriptCursor::TranscriptCursor(size_t max_tracked)
    : max_tracked_(max_tracked == 0 ? 1 : max_tracked)
{}

std::vector<nlohmann::json> TranscriptCursor::delta(const nlohmann::json& events) {
    std::vector<nlohmann::json> out;
    if (!events.is_array()) return out;

    // Sorted and unique by id; events without an id cannot be deduplicated
    std::map<int64_t, const nlohmann::json*> fresh;
    for (const auto& ev : events) {
        if (!ev.is_object() || !ev.contains("id") || !ev["id"].is_number_integer())
            continue;
        int64_t id = ev["id"].get<int64_t>();
        if (id <= floor_ || seen_.count(id)) continue;
        fresh.emplace(id, &ev);
    }

    for (const auto& [id, ev] : fresh) {
        seen_.insert(id);
        last_id_ = std::max(last_id_, id);
        out.push_back(*ev);
    }

    while (seen_.size() > max_tracked_) {
        floor_ = *seen_.begin();
        seen_.erase(seen_.begin());
    }
    return out;
}

// ── LiveFetcher ─────────────────────────────────────────────────

LiveFetcher::LiveFetcher(Connection& connection, int64_t room_id,
                         const StreamConfig& config)
    : connection_(connection), room_id_(room_id), config_(config)
{}

void LiveFetcher::run(StopSignal& stop, const FetchSink& sink) {
    const std::string url =
        connection_.streaming_url("room/" + std::to_string(room_id_) + "/live");
    const auto headers = connection_.headers();

    uint32_t failures = 0;
    uint32_t delay_ms = std::max<uint32_t>(config_.reconnect_initial_ms, 1);
    const uint32_t max_delay_ms = std::max(config_.reconnect_max_ms, delay_ms);

    while (!stop.requested()) {
        LiveDecoder decoder;
        bool delivered = false;
        bool sink_closed = false;

        auto resp = connection_.http().stream_get(url, headers,
            [&](const char* data, size_t len) {
                if (stop.requested()) return false;
                return decoder.feed(std::string(data, len), [&](const nlohmann::json& ev) {
                    delivered = true;
                    if (!sink.on_event(ev)) {
                        sink_closed = true;
                        return false;
                    }
                    return true;
                });
            }, stop.flag());

        if (stop.requested() || sink_closed) break;

        // A connection that carried events was healthy; start backoff over
        if (delivered) {
            failures = 0;
            delay_ms = std::max<uint32_t>(config_.reconnect_initial_ms, 1);
        }

        std::string what;
        if (resp.status_code == 0) {
            what = "Live stream connection failed: " + resp.error;
        } else if (resp.status_code < 200 || resp.status_code >= 300) {
            what = "Live stream returned HTTP " + std::to_string(resp.status_code);
        } else {
            what = "Live stream closed by server";
        }

        ++failures;
        if (sink.on_error) sink.on_error(what, failures);

        if (config_.max_reconnect_attempts != 0 &&
            failures > config_.max_reconnect_attempts) {
            std::cerr << "[live] Giving up on room " << room_id_ << " after "
                      << failures << " failed connections\n";
            break;
        }

        std::cerr << "[live] " << what << ", reconnecting in " << delay_ms << " ms\n";
        if (stop.wait_for(std::chrono::milliseconds(delay_ms))) break;
        delay_ms = delay_ms > max_delay_ms / 2 ? max_delay_ms : delay_ms * 2;
    }
}

// ── PollingFetcher ──────────────────────────────────────────────

PollingFetcher::PollingFetcher(Connection& connection, int64_t room_id,
                               const StreamConfig& config)
    : connection_(connection), room_id_(room_id), config_(config)
{}

void PollingFetcher::run(StopSignal& stop, const FetchSink& sink) {
    const std::string room = "room/" + std::to_string(room_id_);
    TranscriptCursor cursor;
    uint32_t failures = 0;

    while (!stop.requested()) {
        try {
            // First pass reads today's transcript, later passes only what is newer
            nlohmann::json events;
            if (cursor.last_id() == 0) {
                events = connection_.get(room + "/transcript", "messages");
            } else {
                events = connection_.get(room + "/recent", "messages",
                    {{"since_message_id", std::to_string(cursor.last_id())}});
            }
            failures = 0;

            for (const auto& ev : cursor.delta(events)) {
                if (stop.requested()) return;
                if (!sink.on_event(ev)) return;
            }
        } catch (const ConnectionError& e) {
            ++failures;
            std::cerr << "[poll] " << e.what() << '\n';
            if (sink.on_error) sink.on_error(e.what(), failures);
            if (config_.max_reconnect_attempts != 0 &&
                failures > config_.max_reconnect_attempts) {
                std::cerr << "[poll] Giving up on room " << room_id_ << " after "
                          << failures << " failed polls\n";
                return;
            }
        }

        if (stop.wait_for(std::chrono::milliseconds(config_.poll_interval_ms))) break;
    }
}

// ── Factory ─────────────────────────────────────────────────────

std::unique_ptr<Fetcher> make_fetcher(const StreamConfig& config,
                                      Connection& connection, int64_t room_id) {
    if (config.mode == StreamMode::Polling) {
        return std::make_unique<PollingFetcher>(connection, room_id, config);
    }
    return std::make_unique<LiveFetcher>(connection, room_id, config);
}

} // namespace kindling
