#pragma once
#include "config.hpp"
#include "connection.hpp"
#include "dispatcher.hpp"
#include "message.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace kindling {

class Stream;
class Upload;
struct UploadCallbacks;

// One chat room. Thin request/response calls; every method throws
// ConnectionError (AuthenticationError on 401) when the request fails.
class Room {
public:
    Room(Connection& connection, int64_t id);

    int64_t id() const { return id_; }
    Connection& connection() const { return connection_; }

    // Room object as the server describes it (name, topic, users, ...)
    nlohmann::json info();

    void join();
    void leave();
    void lock();
    void unlock();

    // Post a message; returns it as stored by the server
    Message speak(const Message& message);
    Message speak(const std::string& text);

    // Highlight a message in the transcript, or take the highlight off
    void star(const Message& message);
    void unstar(const Message& message);

    void set_topic(const std::string& topic);
    void set_name(const std::string& name);

    // Recently uploaded files (raw upload objects)
    nlohmann::json recent_uploads();

    // Full upload object (name, full_url, size, ...) behind an UploadMessage
    nlohmann::json upload_details(const Message& message);

    std::string uploads_path() const;

    // Stream of this room's messages. Not started.
    std::unique_ptr<Stream> stream(const StreamConfig& config,
                                   StreamErrorCallback on_error = {});

    // Background upload of path to this room. Not started.
    std::unique_ptr<Upload> upload(const std::string& path, const UploadConfig& config,
                                   UploadCallbacks callbacks);

private:
    std::string path(const std::string& suffix = {}) const;

    Connection& connection_;
    int64_t id_;
};

} // namespace kindling
