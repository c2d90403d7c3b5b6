#include <catch2/catch.hpp>
#include "upload.hpp"
#include "errors.hpp"
#include "room.hpp"
#include "mock_http_client.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace kindling;
using json = nlohmann::json;

namespace {

// Temp directory with one file of the given size, removed on destruction
struct TempFile {
    std::string dir;
    std::string path;

    TempFile(size_t size, const std::string& name = "report.txt") {
        auto tmpl = (std::filesystem::temp_directory_path() / "kindling_up_XXXXXX").string();
        char* result = mkdtemp(tmpl.data());
        dir = result ? std::string(result) : "";
        path = dir + "/" + name;
        std::ofstream f(path, std::ios::binary);
        for (size_t i = 0; i < size; i++) f.put(static_cast<char>('a' + i % 26));
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
};

struct Progress {
    std::mutex mutex;
    std::vector<std::pair<uint64_t, uint64_t>> calls;
    int finished = 0;
    int errors = 0;
    UploadReceipt receipt;
    UploadError error;

    UploadCallbacks callbacks() {
        UploadCallbacks cb;
        cb.progress = [this](uint64_t sent, uint64_t total) {
            std::lock_guard<std::mutex> lock(mutex);
            calls.emplace_back(sent, total);
        };
        cb.finished = [this](const UploadReceipt& r) {
            std::lock_guard<std::mutex> lock(mutex);
            finished++;
            receipt = r;
        };
        cb.error = [this](const UploadError& e) {
            std::lock_guard<std::mutex> lock(mutex);
            errors++;
            error = e;
        };
        return cb;
    }
};

UploadConfig chunks_of(uint32_t size) {
    UploadConfig config;
    config.chunk_size = size;
    config.retry_delay_ms = 1;
    return config;
}

using Calls = std::vector<std::pair<uint64_t, uint64_t>>;

} // namespace

struct UploadFixture {
    MockHttpClient http;
    Connection conn{http, "https://acme.campfirenow.com", "tok"};
    Room room{conn, 42};
};

// ── Success ─────────────────────────────────────────────────────

TEST_CASE("Upload: 300 bytes in 100-byte chunks", "[upload]") {
    UploadFixture f;
    f.http.next_response = http_ok(json{{"upload", {
        {"id", 5}, {"name", "report.txt"}, {"byte_size", 300},
        {"content_type", "text/plain"},
        {"full_url", "https://acme.campfirenow.com/room/42/uploads/5/report.txt"}}}}.dump(), 201);
    TempFile file(300);
    Progress p;

    Upload upload(f.room, file.path, chunks_of(100), p.callbacks());
    upload.start();
    upload.join();

    REQUIRE(upload.state() == UploadState::Completed);
    REQUIRE(p.calls == Calls{{100, 300}, {200, 300}, {300, 300}});
    REQUIRE(p.finished == 1);
    REQUIRE(p.errors == 0);
    REQUIRE(upload.bytes_sent() == 300);
    REQUIRE(upload.bytes_total() == 300);
    REQUIRE(p.receipt.id == 5);
    REQUIRE(p.receipt.name == "report.txt");
    REQUIRE(p.receipt.byte_size == 300);
    REQUIRE(p.receipt.full_url == "https://acme.campfirenow.com/room/42/uploads/5/report.txt");
}

TEST_CASE("Upload: request is a multipart post to the room", "[upload]") {
    UploadFixture f;
    TempFile file(10, "notes.txt");

    Upload upload(f.room, file.path, chunks_of(4));
    upload.add_field("note", "hello");
    upload.start();
    upload.join();

    auto req = f.http.last_request();
    REQUIRE(req.method == "UPLOAD");
    REQUIRE(req.url == "https://acme.campfirenow.com/room/42/uploads.json");

    std::string content_type;
    for (const auto& [k, v] : req.headers) {
        if (k == "Content-Type") content_type = v;
    }
    REQUIRE(content_type.rfind("multipart/form-data; boundary=", 0) == 0);
    std::string boundary = content_type.substr(std::string("multipart/form-data; boundary=").size());

    REQUIRE(req.body.find("name=\"note\"\r\n\r\nhello\r\n") != std::string::npos);
    REQUIRE(req.body.find("name=\"upload\"; filename=\"notes.txt\"") != std::string::npos);
    REQUIRE(req.body.find("abcdefghij") != std::string::npos);
    REQUIRE(req.body.size() == f.http.last_content_length());
    REQUIRE(req.body.substr(req.body.size() - boundary.size() - 6) == "--" + boundary + "--\r\n");
}

TEST_CASE("Upload: empty file completes", "[upload]") {
    UploadFixture f;
    TempFile file(0);
    Progress p;

    Upload upload(f.room, file.path, chunks_of(100), p.callbacks());
    upload.start();
    upload.join();

    REQUIRE(upload.state() == UploadState::Completed);
    REQUIRE(p.calls == Calls{{0, 0}});
    REQUIRE(p.finished == 1);
}

TEST_CASE("Upload: progress is monotonic and bounded", "[upload]") {
    UploadFixture f;
    f.http.read_buffer = 7;  // transport pulls smaller pieces than the chunk size
    TempFile file(1000);
    Progress p;

    Upload upload(f.room, file.path, chunks_of(64), p.callbacks());
    upload.start();
    upload.join();

    REQUIRE(upload.state() == UploadState::Completed);
    REQUIRE_FALSE(p.calls.empty());
    for (size_t i = 0; i < p.calls.size(); i++) {
        REQUIRE(p.calls[i].first <= p.calls[i].second);
        REQUIRE(p.calls[i].second == 1000);
        if (i > 0) REQUIRE(p.calls[i].first > p.calls[i - 1].first);
    }
    REQUIRE(p.calls.back().first == 1000);
}

// ── Cancellation ────────────────────────────────────────────────

TEST_CASE("Upload: stop after the first chunk cancels", "[upload]") {
    UploadFixture f;
    TempFile file(300);
    Progress p;
    Upload* self = nullptr;

    UploadCallbacks cb = p.callbacks();
    auto record = cb.progress;
    cb.progress = [&](uint64_t sent, uint64_t total) {
        record(sent, total);
        if (sent == 100) self->stop();
    };

    Upload upload(f.room, file.path, chunks_of(100), cb);
    self = &upload;
    upload.start();
    upload.join();

    REQUIRE(upload.state() == UploadState::Cancelled);
    REQUIRE(p.calls == Calls{{100, 300}});
    REQUIRE(p.finished == 0);
    REQUIRE(p.errors == 0);
    REQUIRE_FALSE(upload.is_uploading());
}

TEST_CASE("Upload: stop during retry delay cancels", "[upload]") {
    UploadFixture f;
    f.http.next_response = http_ok("", 503);
    TempFile file(50);
    Progress p;

    UploadConfig config = chunks_of(100);
    config.retry_delay_ms = 60000;
    Upload upload(f.room, file.path, config, p.callbacks());
    upload.start();

    REQUIRE(wait_until([&] { return f.http.count("UPLOAD") == 1; }));
    upload.stop();
    upload.join();

    REQUIRE(upload.state() == UploadState::Cancelled);
    REQUIRE(p.errors == 0);
    REQUIRE(p.finished == 0);
}

TEST_CASE("Upload: stop after completion is a no-op", "[upload]") {
    UploadFixture f;
    TempFile file(10);
    Progress p;

    Upload upload(f.room, file.path, chunks_of(100), p.callbacks());
    upload.start();
    upload.join();
    upload.stop();
    upload.stop();

    REQUIRE(upload.state() == UploadState::Completed);
    REQUIRE(p.finished == 1);
    REQUIRE(p.errors == 0);
}

TEST_CASE("Upload: stop before start is a no-op", "[upload]") {
    UploadFixture f;
    TempFile file(10);
    Upload upload(f.room, file.path);
    upload.stop();
    REQUIRE(upload.state() == UploadState::Idle);
    upload.start();
    upload.join();
    REQUIRE(upload.state() == UploadState::Completed);
}

// ── Failure and retry ───────────────────────────────────────────

TEST_CASE("Upload: server rejection fails without retry", "[upload]") {
    UploadFixture f;
    f.http.next_response = http_ok("{\"error\":\"too big\"}", 422);
    TempFile file(300);
    Progress p;

    Upload upload(f.room, file.path, chunks_of(100), p.callbacks());
    upload.start();
    upload.join();

    REQUIRE(upload.state() == UploadState::Failed);
    REQUIRE(p.errors == 1);
    REQUIRE(p.finished == 0);
    REQUIRE(p.error.status_code == 422);
    REQUIRE(p.error.attempts == 1);
    REQUIRE(f.http.count("UPLOAD") == 1);
    // Never reported complete
    for (const auto& c : p.calls) REQUIRE(c.first < 300);
}

TEST_CASE("Upload: transient failures are retried", "[upload]") {
    UploadFixture f;
    f.http.upload_responses.push_back(http_fail("Connection reset by peer"));
    f.http.upload_responses.push_back(http_ok("", 502));
    f.http.next_response = http_ok("{\"upload\":{\"id\":9}}", 201);
    TempFile file(300);
    Progress p;

    Upload upload(f.room, file.path, chunks_of(100), p.callbacks());
    upload.start();
    upload.join();

    REQUIRE(upload.state() == UploadState::Completed);
    REQUIRE(f.http.count("UPLOAD") == 3);
    REQUIRE(p.finished == 1);
    REQUIRE(p.errors == 0);
    REQUIRE(p.receipt.id == 9);
    // Restarted attempts do not repeat progress
    REQUIRE(p.calls == Calls{{100, 300}, {200, 300}, {300, 300}});
}

TEST_CASE("Upload: retries are bounded", "[upload]") {
    UploadFixture f;
    f.http.next_response = http_fail("Operation timed out");
    TempFile file(30);
    Progress p;

    UploadConfig config = chunks_of(10);
    config.max_retries = 2;
    Upload upload(f.room, file.path, config, p.callbacks());
    upload.start();
    upload.join();

    REQUIRE(upload.state() == UploadState::Failed);
    REQUIRE(f.http.count("UPLOAD") == 3);
    REQUIRE(p.errors == 1);
    REQUIRE(p.error.attempts == 3);
    REQUIRE(p.error.status_code == 0);
    REQUIRE(p.error.cause.find("Operation timed out") != std::string::npos);
}

TEST_CASE("Upload: throwing callbacks do not break the worker", "[upload]") {
    UploadFixture f;
    TempFile file(300);
    int finished = 0;

    UploadCallbacks cb;
    cb.progress = [](uint64_t, uint64_t) { throw std::runtime_error("ui gone"); };
    cb.finished = [&](const UploadReceipt&) { finished++; };

    Upload upload(f.room, file.path, chunks_of(100), cb);
    upload.start();
    upload.join();

    REQUIRE(upload.state() == UploadState::Completed);
    REQUIRE(finished == 1);
}

// ── Usage errors ────────────────────────────────────────────────

TEST_CASE("Upload: missing file is rejected at start", "[upload]") {
    UploadFixture f;
    Upload upload(f.room, "/nonexistent/kindling/file.bin");
    REQUIRE_THROWS_AS(upload.start(), FileNotFoundError);
    REQUIRE(upload.state() == UploadState::Idle);
    REQUIRE(f.http.call_count() == 0);
}

TEST_CASE("Upload: directory is rejected at start", "[upload]") {
    UploadFixture f;
    TempFile file(1);
    Upload upload(f.room, file.dir);
    try {
        upload.start();
        FAIL("expected FileNotFoundError");
    } catch (const FileNotFoundError& e) {
        REQUIRE(e.path() == file.dir);
    }
}

TEST_CASE("Upload: second start throws", "[upload]") {
    UploadFixture f;
    TempFile file(10);
    Upload upload(f.room, file.path);
    upload.start();
    REQUIRE_THROWS_AS(upload.start(), AlreadyStartedError);
    REQUIRE_THROWS_AS(upload.add_field("a", "b"), AlreadyStartedError);
    upload.join();
    REQUIRE_THROWS_AS(upload.start(), AlreadyStartedError);
}

TEST_CASE("Upload: join before start throws", "[upload]") {
    UploadFixture f;
    TempFile file(10);
    Upload upload(f.room, file.path);
    REQUIRE_THROWS_AS(upload.join(), NotStartedError);
}

TEST_CASE("Upload: join racing start waits for the terminal state", "[upload]") {
    UploadFixture f;
    TempFile file(300);
    Progress p;

    Upload upload(f.room, file.path, chunks_of(100), p.callbacks());
    std::atomic<bool> joined{false};
    std::thread joiner([&] {
        while (true) {
            try {
                upload.join();
                break;
            } catch (const NotStartedError&) {
                std::this_thread::yield();
            }
        }
        joined = true;
    });

    upload.start();
    joiner.join();

    REQUIRE(joined.load());
    REQUIRE(upload.state() == UploadState::Completed);
    REQUIRE(p.finished == 1);
}

TEST_CASE("Upload: callback sees the upload in progress", "[upload]") {
    UploadFixture f;
    TempFile file(300);
    Upload* self = nullptr;
    std::vector<bool> uploading;
    bool join_refused = false;

    UploadCallbacks cb;
    cb.progress = [&](uint64_t, uint64_t) { uploading.push_back(self->is_uploading()); };
    cb.finished = [&](const UploadReceipt&) {
        uploading.push_back(self->is_uploading());
        try {
            self->join();
        } catch (const std::logic_error&) {
            join_refused = true;
        }
    };

    Upload upload(f.room, file.path, chunks_of(100), cb);
    self = &upload;
    upload.start();
    upload.join();

    REQUIRE(uploading.size() == 4);
    for (bool b : uploading) REQUIRE(b);
    REQUIRE(join_refused);
}

TEST_CASE("Upload: room factory builds an idle upload", "[upload]") {
    UploadFixture f;
    TempFile file(10);
    auto upload = f.room.upload(file.path, UploadConfig{}, {});
    REQUIRE(upload->state() == UploadState::Idle);
    REQUIRE_FALSE(upload->is_uploading());
    REQUIRE(upload->path() == file.path);
}

TEST_CASE("upload_state_name: names", "[upload]") {
    REQUIRE(std::string(upload_state_name(UploadState::Uploading)) == "uploading");
    REQUIRE(std::string(upload_state_name(UploadState::Cancelled)) == "cancelled");
}
