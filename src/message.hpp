#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace kindling {

enum class MessageKind {
    Enter,
    Leave,
    Tweet,
    Text,
    Upload,
    TopicChange,
    Other,
};

const char* message_kind_name(MessageKind kind);

struct UserRef {
    int64_t id = 0;
    std::string name; // empty unless the event carried it
};

struct TweetPayload {
    std::string author;
    std::string text;
    std::string url;
};

struct UploadPayload {
    std::string file_name;
    std::string download_url; // empty when the event did not embed it
};

// One chat event. Only the field matching `kind` is populated:
// body for Text/TopicChange, tweet for Tweet, upload for Upload.
struct Message {
    MessageKind kind = MessageKind::Other;
    std::string type_name;   // server type string, e.g. "PasteMessage"
    int64_t id = 0;
    int64_t room_id = 0;
    uint64_t created_at = 0; // epoch seconds, 0 if unknown
    bool starred = false;
    std::optional<UserRef> user;
    std::string body;
    std::optional<TweetPayload> tweet;
    std::optional<UploadPayload> upload;
    nlohmann::json raw;      // original event, kept for diagnostics

    bool is_paste() const { return type_name == "PasteMessage"; }
};

// Campfire type strings
namespace message_types {
    constexpr const char* Enter       = "EnterMessage";
    constexpr const char* Leave       = "LeaveMessage";
    constexpr const char* Paste       = "PasteMessage";
    constexpr const char* Sound       = "SoundMessage";
    constexpr const char* Text        = "TextMessage";
    constexpr const char* Timestamp   = "TimestampMessage";
    constexpr const char* TopicChange = "TopicChangeMessage";
    constexpr const char* Tweet       = "TweetMessage";
    constexpr const char* Upload      = "UploadMessage";
} // namespace message_types

// Classify a decoded event. Never throws: unknown or malformed events come
// back as MessageKind::Other with `raw` set.
Message classify(const nlohmann::json& event);

// Extract a tweet from a TweetMessage body. Handles the live-stream form
// "<text> -- @<author>, <url>" and the transcript form
// "---\n:author_username: ...\n:message: ...\n:id: ...".
std::optional<TweetPayload> parse_tweet_body(const std::string& body);

// Build an outgoing message from user text: multi-line text is a paste, a
// twitter status URL is a tweet, anything else is plain text.
Message make_outgoing(const std::string& text);

// Request payload for posting a message ({"type": ..., "body": ...}).
nlohmann::json to_json(const Message& msg);

} // namespace kindling
