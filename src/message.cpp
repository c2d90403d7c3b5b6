#include "message.hpp"
#include "util.hpp"

#include <cctype>

namespace kindling {

const char* message_kind_name(MessageKind kind) {
    switch (kind) {
        case MessageKind::Enter:       return "enter";
        case MessageKind::Leave:       return "leave";
        case MessageKind::Tweet:       return "tweet";
        case MessageKind::Text:        return "text";
        case MessageKind::Upload:      return "upload";
        case MessageKind::TopicChange: return "topic_change";
        case MessageKind::Other:       return "other";
    }
    return "other";
}

static std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return {};
}

static int64_t id_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return 0;
    const auto& v = j[key];
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_string()) {
        try {
            return std::stoll(v.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

static std::optional<UserRef> user_field(const nlohmann::json& event) {
    // Embedded user object wins over the bare id
    if (event.contains("user") && event["user"].is_object()) {
        UserRef ref;
        ref.id = id_field(event["user"], "id");
        ref.name = string_field(event["user"], "name");
        if (ref.id != 0) return ref;
    }
    int64_t uid = id_field(event, "user_id");
    if (uid == 0) return std::nullopt;
    UserRef ref;
    ref.id = uid;
    return ref;
}

// "<text> -- @<author>, <url>". The last separator wins, so the text may
// itself contain " -- @".
static std::optional<TweetPayload> inline_tweet(const std::string& body) {
    std::string s = trim(body);
    size_t sep = s.rfind("-- @");
    while (sep != std::string::npos) {
        if (sep > 0 && std::isspace(static_cast<unsigned char>(s[sep - 1]))) break;
        sep = sep == 0 ? std::string::npos : s.rfind("-- @", sep - 1);
    }
    if (sep == std::string::npos) return std::nullopt;

    std::string text = trim(s.substr(0, sep));
    size_t author_start = sep + 4;
    size_t comma = s.find(',', author_start);
    if (text.empty() || comma == std::string::npos) return std::nullopt;

    std::string author = trim(s.substr(author_start, comma - author_start));
    std::string url = trim(s.substr(comma + 1));
    if (author.empty() || url.empty()) return std::nullopt;
    for (char c : url) {
        if (std::isspace(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return TweetPayload{author, text, url};
}

// ":key: value" with the value optionally double-quoted
static bool yaml_entry(const std::string& line, std::string& key, std::string& value) {
    if (line.size() < 3 || line[0] != ':') return false;
    size_t colon = line.find(':', 1);
    if (colon == std::string::npos || colon == 1) return false;
    key = line.substr(1, colon - 1);
    value = trim(line.substr(colon + 1));
    if (!value.empty() && value.front() == '"') value.erase(0, 1);
    if (!value.empty() && value.back() == '"') value.pop_back();
    return true;
}

std::optional<TweetPayload> parse_tweet_body(const std::string& body) {
    if (auto tweet = inline_tweet(body)) return tweet;

    if (body.rfind("---", 0) != 0) return std::nullopt;

    std::string author;
    std::string text;
    std::string tweet_id;
    auto lines = split(body, '\n');
    for (size_t i = 1; i < lines.size(); ++i) {
        std::string key;
        std::string value;
        if (!yaml_entry(trim(lines[i]), key, value)) continue;
        if (key == "author_username") author = value;
        else if (key == "message") text = value;
        else if (key == "id") tweet_id = value;
    }
    if (author.empty() || text.empty() || tweet_id.empty()) return std::nullopt;
    return TweetPayload{author, text, "http://twitter.com/" + author + "/status/" + tweet_id};
}

static std::optional<TweetPayload> tweet_object(const nlohmann::json& event) {
    if (!event.contains("tweet") || !event["tweet"].is_object()) return std::nullopt;
    const auto& t = event["tweet"];
    std::string author = string_field(t, "author_username");
    std::string text = string_field(t, "message");
    int64_t tweet_id = id_field(t, "id");
    if (author.empty() || text.empty() || tweet_id == 0) return std::nullopt;
    return TweetPayload{author, text,
                        "http://twitter.com/" + author + "/status/" + std::to_string(tweet_id)};
}

static Message as_other(Message msg) {
    msg.kind = MessageKind::Other;
    msg.body.clear();
    msg.tweet.reset();
    msg.upload.reset();
    return msg;
}

Message classify(const nlohmann::json& event) {
    Message msg;
    msg.raw = event;
    if (!event.is_object()) return msg;

    msg.type_name = string_field(event, "type");
    msg.id = id_field(event, "id");
    msg.room_id = id_field(event, "room_id");
    msg.user = user_field(event);
    if (event.contains("starred") && event["starred"].is_boolean())
        msg.starred = event["starred"].get<bool>();
    if (event.contains("created_at") && event["created_at"].is_string())
        msg.created_at = parse_timestamp(event["created_at"].get<std::string>());

    const bool has_body = event.contains("body") && event["body"].is_string();
    const std::string body = has_body ? event["body"].get<std::string>() : std::string{};
    const std::string& type = msg.type_name;

    if (type == message_types::Enter || type == message_types::Leave) {
        if (!msg.user) return as_other(std::move(msg));
        msg.kind = type == message_types::Enter ? MessageKind::Enter : MessageKind::Leave;
    } else if (type == message_types::Text || type == message_types::Paste) {
        if (!has_body) return as_other(std::move(msg));
        msg.kind = MessageKind::Text;
        msg.body = body;
    } else if (type == message_types::TopicChange) {
        if (!has_body) return as_other(std::move(msg));
        msg.kind = MessageKind::TopicChange;
        msg.body = body;
    } else if (type == message_types::Tweet) {
        auto tweet = tweet_object(event);
        if (!tweet && has_body) tweet = parse_tweet_body(body);
        if (tweet) {
            msg.kind = MessageKind::Tweet;
            msg.tweet = std::move(tweet);
        } else if (has_body) {
            // Unrecognised tweet layout: still readable as text
            msg.kind = MessageKind::Text;
            msg.body = body;
        } else {
            return as_other(std::move(msg));
        }
    } else if (type == message_types::Upload) {
        if (!has_body || body.empty()) return as_other(std::move(msg));
        UploadPayload up;
        up.file_name = body;
        if (event.contains("upload") && event["upload"].is_object()) {
            const auto& u = event["upload"];
            up.download_url = string_field(u, "full_url");
            if (up.download_url.empty()) up.download_url = string_field(u, "url");
        }
        msg.kind = MessageKind::Upload;
        msg.upload = std::move(up);
    }
    // Sound, Timestamp and unknown types stay Other

    return msg;
}

// http(s)://[www.]twitter.com/<user>/status/<digits>
static bool is_tweet_url(const std::string& text) {
    std::string rest;
    if (text.rfind("http://", 0) == 0) rest = text.substr(7);
    else if (text.rfind("https://", 0) == 0) rest = text.substr(8);
    else return false;
    if (rest.rfind("www.", 0) == 0) rest.erase(0, 4);
    if (rest.rfind("twitter.com/", 0) != 0) return false;
    rest.erase(0, 12);

    size_t slash = rest.find('/');
    if (slash == 0 || slash == std::string::npos) return false;
    if (rest.compare(slash, 8, "/status/") != 0) return false;
    size_t digits = slash + 8;
    return digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits]));
}

Message make_outgoing(const std::string& text) {
    Message msg;
    msg.kind = MessageKind::Text;
    msg.body = text;
    if (text.find('\n') != std::string::npos) {
        msg.type_name = message_types::Paste;
    } else if (is_tweet_url(text)) {
        // The server expands the URL into a tweet; locally it is still text
        msg.type_name = message_types::Tweet;
    } else {
        msg.type_name = message_types::Text;
    }
    return msg;
}

nlohmann::json to_json(const Message& msg) {
    nlohmann::json j = {{"type", msg.type_name}};
    switch (msg.kind) {
        case MessageKind::Text:
        case MessageKind::TopicChange:
            j["body"] = msg.body;
            break;
        case MessageKind::Tweet:
            if (msg.tweet) j["body"] = msg.tweet->url;
            break;
        case MessageKind::Upload:
            if (msg.upload) j["body"] = msg.upload->file_name;
            break;
        default:
            break;
    }
    return j;
}

} // namespace kindling
