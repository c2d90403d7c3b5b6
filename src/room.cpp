#include "room.hpp"
#include "errors.hpp"
#include "stream.hpp"
#include "upload.hpp"

namespace kindling {

Room::Room(Connection& connection, int64_t id)
    : connection_(connection), id_(id)
{}

std::string Room::path(const std::string& suffix) const {
    std::string p = "room/" + std::to_string(id_);
    if (!suffix.empty()) p += "/" + suffix;
    return p;
}

nlohmann::json Room::info() {
    return connection_.get(path(), "room");
}

void Room::join() {
    connection_.post(path("join"));
}

void Room::leave() {
    connection_.post(path("leave"));
}

void Room::lock() {
    connection_.post(path("lock"));
}

void Room::unlock() {
    connection_.post(path("unlock"));
}

Message Room::speak(const Message& message) {
    auto result = connection_.post(path("speak"), {{"message", to_json(message)}});
    if (!result.is_object() || !result.contains("message")) {
        throw ConnectionError("Invalid response (key message not found) from " +
                              connection_.url(path("speak")));
    }
    return classify(result["message"]);
}

Message Room::speak(const std::string& text) {
    return speak(make_outgoing(text));
}

static std::string star_path(const Message& message) {
    if (message.id <= 0) throw UsageError("Cannot star a message that has no id");
    return "messages/" + std::to_string(message.id) + "/star";
}

void Room::star(const Message& message) {
    connection_.post(star_path(message));
}

void Room::unstar(const Message& message) {
    connection_.del(star_path(message));
}

void Room::set_topic(const std::string& topic) {
    connection_.put(path(), {{"room", {{"topic", topic}}}});
}

void Room::set_name(const std::string& name) {
    connection_.put(path(), {{"room", {{"name", name}}}});
}

nlohmann::json Room::recent_uploads() {
    return connection_.get(path("uploads"), "uploads");
}

nlohmann::json Room::upload_details(const Message& message) {
    if (message.kind != MessageKind::Upload) {
        throw UsageError("upload_details needs an upload message, got " +
                         std::string(message_kind_name(message.kind)));
    }
    return connection_.get(path("messages/" + std::to_string(message.id) + "/upload"),
                           "upload");
}

std::string Room::uploads_path() const {
    return path("uploads");
}

std::unique_ptr<Stream> Room::stream(const StreamConfig& config,
                                     StreamErrorCallback on_error) {
    return std::make_unique<Stream>(*this, config, std::move(on_error));
}

std::unique_ptr<Upload> Room::upload(const std::string& path, const UploadConfig& config,
                                     UploadCallbacks callbacks) {
    return std::make_unique<Upload>(*this, path, config, std::move(callbacks));
}

} // namespace kindling
