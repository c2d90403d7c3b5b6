#include "upload.hpp"
#include "errors.hpp"
#include "room.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace kindling {

const char* upload_state_name(UploadState state) {
    switch (state) {
        case UploadState::Idle:      return "idle";
        case UploadState::Uploading: return "uploading";
        case UploadState::Completed: return "completed";
        case UploadState::Failed:    return "failed";
        case UploadState::Cancelled: return "cancelled";
    }
    return "unknown";
}

// Run a user callback; a throwing callback must not take the worker down.
template<typename Fn, typename... Args>
static void notify(const char* what, const Fn& fn, Args&&... args) {
    if (!fn) return;
    try {
        fn(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        std::cerr << "[upload] " << what << " callback threw: " << e.what() << '\n';
    } catch (...) {
        std::cerr << "[upload] " << what << " callback threw an unknown exception\n";
    }
}

static UploadReceipt parse_receipt(const std::string& body) {
    UploadReceipt receipt;
    try {
        auto j = nlohmann::json::parse(body);
        if (j.is_object() && j.contains("upload") && j["upload"].is_object()) {
            j = j["upload"];
        }
        if (!j.is_object()) return receipt;

        if (j.contains("id") && j["id"].is_number_integer())
            receipt.id = j["id"].get<int64_t>();
        if (j.contains("byte_size") && j["byte_size"].is_number_integer())
            receipt.byte_size = j["byte_size"].get<uint64_t>();
        receipt.name = j.value("name", "");
        receipt.content_type = j.value("content_type", "");
        receipt.full_url = j.value("full_url", "");
        receipt.raw = std::move(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[upload] Unreadable upload response: " << e.what() << '\n';
    }
    return receipt;
}

Upload::Upload(Room& room, std::string path, UploadConfig config,
               UploadCallbacks callbacks)
    : room_(room)
    , path_(std::move(path))
    , config_(config)
    , callbacks_(std::move(callbacks))
{
    if (config_.chunk_size == 0) config_.chunk_size = 16384;
}

Upload::~Upload() {
    stop();
    if (worker_.joinable()) worker_.join();
}

void Upload::add_field(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() != UploadState::Idle) throw AlreadyStartedError("Upload");
    fields_.emplace_back(name, value);
}

void Upload::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() != UploadState::Idle) throw AlreadyStartedError("Upload");

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) throw FileNotFoundError(path_);
    uint64_t size = std::filesystem::file_size(path_, ec);
    if (ec) throw FileNotFoundError(path_);
    std::ifstream probe(path_, std::ios::binary);
    if (!probe) throw FileNotFoundError(path_);

    bytes_total_ = size;
    bytes_sent_ = 0;
    // Still Idle if the thread cannot be created
    worker_ = std::thread(&Upload::run_worker, this);
    state_ = UploadState::Uploading;
}

void Upload::stop() {
    if (state_.load() != UploadState::Uploading) return;
    if (stop_.requested()) return;
    std::cerr << "[upload] Cancelling " << path_ << '\n';
    stop_.request();
}

void Upload::join() {
    if (state_.load() == UploadState::Idle) throw NotStartedError("Upload");
    if (std::this_thread::get_id() == worker_id_.load()) {
        throw std::logic_error("Upload::join called from an upload callback");
    }
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] {
        auto s = state_.load();
        return s != UploadState::Idle && s != UploadState::Uploading;
    });
}

void Upload::report_progress(uint64_t sent) {
    if (sent <= bytes_sent_.load()) return;
    bytes_sent_ = sent;
    notify("progress", callbacks_.progress, sent, bytes_total_.load());
}

void Upload::finish(UploadState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
    }
    done_cv_.notify_all();
}

void Upload::run_worker() {
    worker_id_ = std::this_thread::get_id();
    {
        // Wait for start() to publish the Uploading state
        std::lock_guard<std::mutex> lock(mutex_);
    }

    UploadReceipt receipt;
    UploadError error;
    Outcome outcome = Outcome::Retry;
    uint32_t number = 0;

    while (outcome == Outcome::Retry) {
        ++number;
        outcome = attempt(number, receipt, error);
        if (outcome != Outcome::Retry) break;
        if (number > config_.max_retries) {
            outcome = Outcome::Failed;
            break;
        }
        std::cerr << "[upload] " << error.cause << ", retrying " << path_ << " in "
                  << config_.retry_delay_ms << " ms\n";
        if (stop_.wait_for(std::chrono::milliseconds(config_.retry_delay_ms))) {
            outcome = Outcome::Cancelled;
        }
    }
    error.attempts = number;

    const uint64_t total = bytes_total_.load();
    switch (outcome) {
        case Outcome::Completed:
            bytes_sent_ = total;
            notify("progress", callbacks_.progress, total, total);
            std::cerr << "[upload] Uploaded " << path_ << " (" << total << " bytes)\n";
            notify("finished", callbacks_.finished, receipt);
            finish(UploadState::Completed);
            break;
        case Outcome::Cancelled:
            std::cerr << "[upload] Cancelled " << path_ << " after "
                      << bytes_sent_.load() << " of " << total << " bytes\n";
            finish(UploadState::Cancelled);
            break;
        case Outcome::Failed:
        case Outcome::Retry:
            std::cerr << "[upload] Failed " << path_ << ": " << error.cause << '\n';
            notify("error", callbacks_.error, error);
            finish(UploadState::Failed);
            break;
    }
}

Upload::Outcome Upload::attempt(uint32_t number, UploadReceipt& receipt,
                                UploadError& error) {
    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        error.cause = "Cannot open " + path_;
        error.status_code = 0;
        return Outcome::Failed;
    }

    const uint64_t total = bytes_total_.load();
    MultipartBody body("upload", path_, total, fields_);
    const std::string& preamble = body.preamble();
    const std::string& epilogue = body.epilogue();

    uint64_t preamble_off = 0;
    uint64_t file_off = 0;
    uint64_t epilogue_off = 0;
    bool cancelled = false;
    bool read_failed = false;

    BodyReader reader = [&](char* buf, size_t max) -> size_t {
        if (stop_.requested()) {
            cancelled = true;
            return kAbortBody;
        }
        // The transport asking for more means the previous chunk went out.
        // (total, total) waits for the server's answer.
        if (file_off > 0 && file_off < total) report_progress(file_off);
        if (stop_.requested()) {
            cancelled = true;
            return kAbortBody;
        }

        if (preamble_off < preamble.size()) {
            size_t n = static_cast<size_t>(
                std::min<uint64_t>(max, preamble.size() - preamble_off));
            std::memcpy(buf, preamble.data() + preamble_off, n);
            preamble_off += n;
            return n;
        }
        if (file_off < total) {
            size_t n = static_cast<size_t>(
                std::min<uint64_t>({max, config_.chunk_size, total - file_off}));
            file.read(buf, static_cast<std::streamsize>(n));
            if (static_cast<size_t>(file.gcount()) != n) {
                read_failed = true;
                return kAbortBody;
            }
            file_off += n;
            return n;
        }
        if (epilogue_off < epilogue.size()) {
            size_t n = static_cast<size_t>(
                std::min<uint64_t>(max, epilogue.size() - epilogue_off));
            std::memcpy(buf, epilogue.data() + epilogue_off, n);
            epilogue_off += n;
            return n;
        }
        return 0;
    };

    Connection& conn = room_.connection();
    auto headers = conn.headers();
    headers.emplace_back("Content-Type", body.content_type());

    if (number > 1) {
        std::cerr << "[upload] Attempt " << number << " for " << path_ << '\n';
    }
    auto resp = conn.http().post_body(conn.url(room_.uploads_path()), headers,
                                      body.content_length(), reader, stop_.flag());

    if (read_failed) {
        error.cause = "Read error on " + path_;
        error.status_code = 0;
        return Outcome::Failed;
    }
    if (cancelled || (resp.aborted && stop_.requested())) return Outcome::Cancelled;

    error.status_code = resp.status_code;
    if (resp.status_code == 0) {
        error.cause = "Upload failed: " + resp.error;
        return Outcome::Retry;
    }
    if (resp.status_code >= 500) {
        error.cause = "Server returned HTTP " + std::to_string(resp.status_code);
        return Outcome::Retry;
    }
    if (resp.status_code == 401) {
        error.cause = "Access denied while uploading to room " + std::to_string(room_.id());
        return Outcome::Failed;
    }
    if (resp.status_code < 200 || resp.status_code >= 300) {
        error.cause = "Upload rejected with HTTP " + std::to_string(resp.status_code);
        return Outcome::Failed;
    }

    receipt = parse_receipt(resp.body);
    return Outcome::Completed;
}

} // namespace kindling
