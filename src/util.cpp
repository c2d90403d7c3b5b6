#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <sstream>

namespace kindling {

uint64_t epoch_seconds() {
    return static_cast<uint64_t>(std::time(nullptr));
}

uint64_t parse_timestamp(const std::string& text) {
    std::tm tm_buf{};
    int offset = 0;
    char sign = '+';
    int consumed = 0;

    std::string s = trim(text);
    if (std::sscanf(s.c_str(), "%d/%d/%d %d:%d:%d %n",
                    &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                    &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed) == 6) {
        // Optional "+HHMM" / "-HHMM" suffix
        if (consumed > 0 && static_cast<size_t>(consumed) < s.size()) {
            if (std::sscanf(s.c_str() + consumed, "%c%d", &sign, &offset) != 2 ||
                (sign != '+' && sign != '-')) {
                return 0;
            }
        }
    } else if (std::sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d",
                           &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                           &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) != 6) {
        return 0;
    }

    if (tm_buf.tm_mon < 1 || tm_buf.tm_mon > 12 || tm_buf.tm_mday < 1 || tm_buf.tm_mday > 31)
        return 0;

    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;
    std::time_t t = timegm(&tm_buf);
    if (t < 0) return 0;

    // +HHMM means local = UTC + offset, so subtract it
    int64_t offset_seconds = (offset / 100) * 3600 + (offset % 100) * 60;
    if (sign == '-') offset_seconds = -offset_seconds;
    int64_t utc = static_cast<int64_t>(t) - offset_seconds;
    return utc > 0 ? static_cast<uint64_t>(utc) : 0;
}

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

std::string generate_id() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint64_t> dist;
    // Shared across upload worker threads
    static std::mutex gen_mutex;
    uint64_t val;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        val = dist(gen);
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(val));
    return buf;
}

std::string url_encode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string base64_encode(const std::string& in) {
    static const char* table =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((in.size() + 2) / 3) * 4);
    size_t i = 0;
    while (i + 2 < in.size()) {
        uint32_t n = (static_cast<unsigned char>(in[i]) << 16) |
                     (static_cast<unsigned char>(in[i + 1]) << 8) |
                     static_cast<unsigned char>(in[i + 2]);
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += table[(n >> 6) & 0x3F];
        out += table[n & 0x3F];
        i += 3;
    }
    size_t rest = in.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<unsigned char>(in[i]) << 16;
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<unsigned char>(in[i]) << 16) |
                     (static_cast<unsigned char>(in[i + 1]) << 8);
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += table[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp." + generate_id();
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) return false;
        out << content;
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace kindling
