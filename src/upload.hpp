#pragma once
#include "config.hpp"
#include "multipart.hpp"
#include "stop_signal.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace kindling {

class Room;

enum class UploadState {
    Idle,
    Uploading,
    Completed,
    Failed,
    Cancelled,
};

const char* upload_state_name(UploadState state);

struct UploadError {
    std::string cause;
    long status_code = 0;   // 0 when the request never got a response
    uint32_t attempts = 0;
};

// The stored upload as the server reports it
struct UploadReceipt {
    int64_t id = 0;
    std::string name;
    std::string content_type;
    uint64_t byte_size = 0;
    std::string full_url;
    nlohmann::json raw;
};

using UploadProgressCallback = std::function<void(uint64_t bytes_sent, uint64_t bytes_total)>;
using UploadFinishedCallback = std::function<void(const UploadReceipt& receipt)>;
using UploadErrorCallback = std::function<void(const UploadError& error)>;

struct UploadCallbacks {
    UploadProgressCallback progress;
    UploadFinishedCallback finished;
    UploadErrorCallback error;
};

// Sends one file to a room on a background thread.
//
// Callbacks run on the worker thread. Progress is reported at chunk
// boundaries and never goes backwards; it reaches (total, total) only once
// the server accepted the file. Exactly one of finished/error runs, unless
// the upload was cancelled, in which case neither does.
class Upload {
public:
    Upload(Room& room, std::string path, UploadConfig config = {},
           UploadCallbacks callbacks = {});
    ~Upload();

    Upload(const Upload&) = delete;
    Upload& operator=(const Upload&) = delete;

    // Extra form field sent ahead of the file. Only before start().
    void add_field(const std::string& name, const std::string& value);

    // Throws FileNotFoundError if path is not a readable regular file,
    // AlreadyStartedError if not idle.
    void start();

    // Cancel. No-op unless uploading.
    void stop();

    // Block until a terminal state. Throws NotStartedError when idle.
    void join();

    bool is_uploading() const { return state_.load() == UploadState::Uploading; }
    UploadState state() const { return state_.load(); }
    uint64_t bytes_sent() const { return bytes_sent_.load(); }
    uint64_t bytes_total() const { return bytes_total_.load(); }
    const std::string& path() const { return path_; }

private:
    enum class Outcome { Completed, Retry, Failed, Cancelled };

    void run_worker();
    Outcome attempt(uint32_t number, UploadReceipt& receipt, UploadError& error);
    void report_progress(uint64_t sent);
    void finish(UploadState state);

    Room& room_;
    std::string path_;
    UploadConfig config_;
    UploadCallbacks callbacks_;
    FormFields fields_;

    StopSignal stop_;
    std::atomic<UploadState> state_{UploadState::Idle};
    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> bytes_total_{0};

    std::mutex mutex_;
    std::condition_variable done_cv_;
    std::thread worker_;
    std::atomic<std::thread::id> worker_id_{};
};

} // namespace kindling
