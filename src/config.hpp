#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace kindling {

enum class StreamMode { Live, Polling };

const char* stream_mode_name(StreamMode mode);

struct StreamConfig {
    StreamMode mode = StreamMode::Live;
    uint32_t poll_interval_ms = 1000;       // Polling: pause between transcript requests
    uint32_t queue_capacity = 256;          // fetch → dispatch backlog before the fetcher blocks
    uint32_t reconnect_initial_ms = 1000;   // Live: first backoff after a drop
    uint32_t reconnect_max_ms = 120000;     // Live: backoff ceiling
    uint32_t max_reconnect_attempts = 0;    // consecutive failures before giving up, 0 = never
};

struct UploadConfig {
    uint32_t chunk_size = 16384;
    uint32_t max_retries = 2;
    uint32_t retry_delay_ms = 1000;
};

struct Config {
    std::string subdomain;
    bool ssl = true;
    std::string api_token;
    std::string base_url;       // overrides https://<subdomain>.campfirenow.com
    std::string streaming_url = "https://streaming.campfirenow.com";

    StreamConfig stream;
    UploadConfig upload;

    // Load from ~/.kindling/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults if missing) + env vars
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config object; absent or mistyped keys keep their defaults
    static Config from_json(const nlohmann::json& j);

    // Base URL of the REST API
    std::string api_base_url() const;
};

} // namespace kindling
