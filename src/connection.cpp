#include "connection.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace kindling {

static std::string strip_trailing_slash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

Connection::Connection(HttpClient& http, std::string base_url, std::string api_token,
                       std::string streaming_url)
    : http_(http)
    , base_url_(strip_trailing_slash(std::move(base_url)))
    , api_token_(std::move(api_token))
    , streaming_url_(strip_trailing_slash(std::move(streaming_url)))
{}

Connection::Connection(HttpClient& http, const Config& config)
    : Connection(http, config.api_base_url(), config.api_token, config.streaming_url)
{}

std::string Connection::url(const std::string& path, const QueryParams& params) const {
    std::string out = base_url_ + "/" + path + ".json";
    char sep = '?';
    for (const auto& [key, value] : params) {
        out += sep;
        out += url_encode(key) + "=" + url_encode(value);
        sep = '&';
    }
    return out;
}

std::string Connection::streaming_url(const std::string& path) const {
    return streaming_url_ + "/" + path + ".json";
}

std::vector<Header> Connection::headers() const {
    // The API token is the basic-auth user; the password is ignored
    return {
        {"Authorization", "Basic " + base64_encode(api_token_ + ":X")},
        {"User-Agent", "kindling/1.0"},
        {"Accept", "application/json"},
    };
}

nlohmann::json Connection::handle(const std::string& url, const HttpResponse& resp) {
    if (resp.status_code == 0)
        throw ConnectionError("Error while fetching from " + url + ": " + resp.error);
    if (resp.status_code == 401)
        throw AuthenticationError(url);
    if (resp.status_code == 404)
        throw ConnectionError("URL not found: " + url, 404);
    if (resp.status_code < 200 || resp.status_code >= 300)
        throw ConnectionError("HTTP " + std::to_string(resp.status_code) + " from " + url,
                              resp.status_code);

    if (trim(resp.body).empty()) return nullptr;
    try {
        return nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::exception& e) {
        throw ConnectionError(std::string("Invalid JSON from ") + url + ": " + e.what(),
                              resp.status_code);
    }
}

nlohmann::json Connection::get(const std::string& path, const std::string& key,
                               const QueryParams& params) {
    std::string u = url(path, params);
    auto data = handle(u, http_.get(u, headers()));
    if (key.empty()) return data;
    if (!data.is_object() || !data.contains(key))
        throw ConnectionError("Invalid response (key " + key + " not found) from " + u);
    return data[key];
}

nlohmann::json Connection::post(const std::string& path, const nlohmann::json& body) {
    std::string u = url(path);
    auto hdrs = headers();
    hdrs.emplace_back("Content-Type", "application/json");
    return handle(u, http_.post(u, body.is_null() ? std::string{} : body.dump(), hdrs));
}

nlohmann::json Connection::put(const std::string& path, const nlohmann::json& body) {
    std::string u = url(path);
    auto hdrs = headers();
    hdrs.emplace_back("Content-Type", "application/json");
    return handle(u, http_.put(u, body.dump(), hdrs));
}

nlohmann::json Connection::del(const std::string& path) {
    std::string u = url(path);
    return handle(u, http_.del(u, headers()));
}

} // namespace kindling
