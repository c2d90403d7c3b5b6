#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace kindling {

const char* stream_mode_name(StreamMode mode) {
    return mode == StreamMode::Live ? "live" : "polling";
}

nlohmann::json Config::defaults_json() {
    return {
        {"subdomain", ""},
        {"ssl", true},
        {"api_token", ""},
        {"base_url", ""},
        {"streaming_url", "https://streaming.campfirenow.com"},
        {"stream", {
            {"mode", "live"},
            {"poll_interval_ms", 1000},
            {"queue_capacity", 256},
            {"reconnect_initial_ms", 1000},
            {"reconnect_max_ms", 120000},
            {"max_reconnect_attempts", 0}
        }},
        {"upload", {
            {"chunk_size", 16384},
            {"max_retries", 2},
            {"retry_delay_ms", 1000}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    // Parsed text yields unsigned; json literals built in code yield signed
    if (!obj.contains(key) || !obj[key].is_number_integer()) return;
    int64_t v = obj[key].get<int64_t>();
    if (v >= 0 && v <= static_cast<int64_t>(UINT32_MAX))
        out = static_cast<uint32_t>(v);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("subdomain") && j["subdomain"].is_string())
        cfg.subdomain = j["subdomain"].get<std::string>();
    if (j.contains("ssl") && j["ssl"].is_boolean())
        cfg.ssl = j["ssl"].get<bool>();
    if (j.contains("api_token") && j["api_token"].is_string())
        cfg.api_token = j["api_token"].get<std::string>();
    if (j.contains("base_url") && j["base_url"].is_string())
        cfg.base_url = j["base_url"].get<std::string>();
    if (j.contains("streaming_url") && j["streaming_url"].is_string())
        cfg.streaming_url = j["streaming_url"].get<std::string>();

    if (j.contains("stream") && j["stream"].is_object()) {
        auto& s = j["stream"];
        if (s.contains("mode") && s["mode"].is_string()) {
            std::string mode = to_lower(s["mode"].get<std::string>());
            if (mode == "polling" || mode == "poll" || mode == "transcript") {
                cfg.stream.mode = StreamMode::Polling;
            } else if (mode != "live") {
                std::cerr << "[config] Unknown stream mode \"" << mode
                          << "\", using live\n";
            }
        }
        read_u32(s, "poll_interval_ms", cfg.stream.poll_interval_ms);
        read_u32(s, "queue_capacity", cfg.stream.queue_capacity);
        read_u32(s, "reconnect_initial_ms", cfg.stream.reconnect_initial_ms);
        read_u32(s, "reconnect_max_ms", cfg.stream.reconnect_max_ms);
        read_u32(s, "max_reconnect_attempts", cfg.stream.max_reconnect_attempts);
    }

    if (j.contains("upload") && j["upload"].is_object()) {
        auto& u = j["upload"];
        read_u32(u, "chunk_size", cfg.upload.chunk_size);
        read_u32(u, "max_retries", cfg.upload.max_retries);
        read_u32(u, "retry_delay_ms", cfg.upload.retry_delay_ms);
    }

    // Zero would stall the engine
    if (cfg.stream.poll_interval_ms == 0) cfg.stream.poll_interval_ms = 1000;
    if (cfg.stream.queue_capacity == 0) cfg.stream.queue_capacity = 256;
    if (cfg.upload.chunk_size == 0) cfg.upload.chunk_size = 16384;

    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.kindling/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("CAMPFIRE_SUBDOMAIN"))
        cfg.subdomain = v;
    if (const char* v = std::getenv("CAMPFIRE_TOKEN"))
        cfg.api_token = v;
    if (const char* v = std::getenv("CAMPFIRE_BASE_URL"))
        cfg.base_url = v;
    if (const char* v = std::getenv("CAMPFIRE_STREAMING_URL"))
        cfg.streaming_url = v;

    return cfg;
}

std::string Config::api_base_url() const {
    std::string url = base_url;
    if (url.empty() && !subdomain.empty())
        url = std::string(ssl ? "https" : "http") + "://" + subdomain + ".campfirenow.com";
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

} // namespace kindling
