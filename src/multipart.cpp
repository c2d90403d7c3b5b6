#include "multipart.hpp"
#include "util.hpp"

#include <filesystem>
#include <unordered_map>

namespace kindling {

static std::string escape_quoted(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        if (c == '\r' || c == '\n') continue;
        out += c;
    }
    return out;
}

std::string guess_content_type(const std::string& file_path) {
    static const std::unordered_map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".log", "text/plain"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"},
    };

    std::string ext = to_lower(std::filesystem::path(file_path).extension().string());
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

MultipartBody::MultipartBody(const std::string& field, const std::string& file_path,
                             uint64_t file_size, const FormFields& fields,
                             std::string boundary)
    : boundary_(std::move(boundary))
    , file_size_(file_size)
{
    if (boundary_.empty()) boundary_ = "----kindling" + generate_id();

    for (const auto& [name, value] : fields) {
        preamble_ += "--" + boundary_ + "\r\n";
        preamble_ += "Content-Disposition: form-data; name=\"" + escape_quoted(name) + "\"\r\n\r\n";
        preamble_ += value + "\r\n";
    }

    std::string file_name = std::filesystem::path(file_path).filename().string();
    preamble_ += "--" + boundary_ + "\r\n";
    preamble_ += "Content-Disposition: form-data; name=\"" + escape_quoted(field) +
                 "\"; filename=\"" + escape_quoted(file_name) + "\"\r\n";
    preamble_ += "Content-Type: " + guess_content_type(file_path) + "\r\n\r\n";

    epilogue_ = "\r\n--" + boundary_ + "--\r\n";
}

std::string MultipartBody::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

uint64_t MultipartBody::content_length() const {
    return preamble_.size() + file_size_ + epilogue_.size();
}

} // namespace kindling
