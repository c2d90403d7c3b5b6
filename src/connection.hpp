#pragma once
#include "config.hpp"
#include "http.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kindling {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Authenticated access to the chat backend's JSON API. Paths are relative
// ("room/42/join") and get ".json" appended, as the API expects.
//
// Request helpers throw AuthenticationError on 401 and ConnectionError on
// any other failure (transport error, non-2xx, unparseable body).
class Connection {
public:
    Connection(HttpClient& http, std::string base_url, std::string api_token,
               std::string streaming_url = "https://streaming.campfirenow.com");
    Connection(HttpClient& http, const Config& config);

    HttpClient& http() const { return http_; }

    std::string url(const std::string& path, const QueryParams& params = {}) const;
    std::string streaming_url(const std::string& path) const;

    // Auth + user agent; add Content-Type per request
    std::vector<Header> headers() const;

    // GET and parse. With key set, returns that member of the response object.
    nlohmann::json get(const std::string& path, const std::string& key = {},
                       const QueryParams& params = {});

    // POST/PUT a JSON body (null = empty body). Returns the parsed response,
    // or null when the server sent no body.
    nlohmann::json post(const std::string& path, const nlohmann::json& body = nullptr);
    nlohmann::json put(const std::string& path, const nlohmann::json& body);
    nlohmann::json del(const std::string& path);

private:
    nlohmann::json handle(const std::string& url, const HttpResponse& resp);

    HttpClient& http_;
    std::string base_url_;
    std::string api_token_;
    std::string streaming_url_;
};

} // namespace kindling
