#include "config.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "message.hpp"
#include "room.hpp"
#include "stream.hpp"
#include "upload.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: kindling --room ID [options]\n"
              << "\n"
              << "Options:\n"
              << "  --room ID            Room to work with (required)\n"
              << "  --say TEXT           Post a message\n"
              << "  --topic TEXT         Set the room topic\n"
              << "  --upload PATH        Upload a file\n"
              << "  --listen             Stream messages after the actions above\n"
              << "  --poll               Stream by polling the transcript instead of live\n"
              << "  --config PATH        Config file (default: ~/.kindling/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Without --say, --topic or --upload the room is streamed until Ctrl+C.\n"
              << "\n"
              << "Environment variables:\n"
              << "  CAMPFIRE_SUBDOMAIN   Account subdomain (<subdomain>.campfirenow.com)\n"
              << "  CAMPFIRE_TOKEN       API token\n"
              << "  CAMPFIRE_BASE_URL    API base URL, overrides the subdomain\n"
              << "  CAMPFIRE_STREAMING_URL  Live stream base URL\n";
}

static std::string who(const kindling::Message& msg) {
    if (!msg.user) return "(system)";
    if (!msg.user->name.empty()) return msg.user->name;
    return "user " + std::to_string(msg.user->id);
}

static void print_message(const kindling::Message& msg) {
    using kindling::MessageKind;
    switch (msg.kind) {
        case MessageKind::Enter:
            std::cout << "--> " << who(msg) << " entered the room\n";
            break;
        case MessageKind::Leave:
            std::cout << "<-- " << who(msg) << " left the room\n";
            break;
        case MessageKind::Text:
            std::cout << who(msg) << ": " << msg.body << '\n';
            break;
        case MessageKind::Tweet:
            std::cout << who(msg) << " tweeted @" << msg.tweet->author << ": "
                      << msg.tweet->text << " (" << msg.tweet->url << ")\n";
            break;
        case MessageKind::Upload:
            std::cout << who(msg) << " uploaded " << msg.upload->file_name;
            if (!msg.upload->download_url.empty()) std::cout << " " << msg.upload->download_url;
            std::cout << '\n';
            break;
        case MessageKind::TopicChange:
            std::cout << who(msg) << " changed the topic to: " << msg.body << '\n';
            break;
        case MessageKind::Other:
            break;
    }
    std::cout << std::flush;
}

static int run_upload(kindling::Room& room, const std::string& path,
                      const kindling::UploadConfig& config) {
    kindling::UploadCallbacks callbacks;
    callbacks.progress = [](uint64_t sent, uint64_t total) {
        unsigned pct = total ? static_cast<unsigned>(sent * 100 / total) : 100;
        std::cout << "\rUploading: " << pct << "% (" << sent << "/" << total << " bytes)"
                  << std::flush;
    };
    callbacks.finished = [](const kindling::UploadReceipt& receipt) {
        std::cout << "\nUploaded " << receipt.name;
        if (!receipt.full_url.empty()) std::cout << " " << receipt.full_url;
        std::cout << '\n';
    };
    callbacks.error = [](const kindling::UploadError& error) {
        std::cerr << "\nUpload failed: " << error.cause << '\n';
    };

    auto upload = room.upload(path, config, std::move(callbacks));
    upload->start();
    while (upload->is_uploading()) {
        if (g_shutdown.load()) upload->stop();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    upload->join();

    if (upload->state() == kindling::UploadState::Cancelled) {
        std::cout << "\nUpload cancelled.\n";
    }
    return upload->state() == kindling::UploadState::Completed ? 0 : 1;
}

static int run_stream(kindling::Room& room, const kindling::StreamConfig& config) {
    auto stream = room.stream(config, [](const kindling::StreamError& err) {
        if (err.kind == kindling::StreamErrorKind::Transport) {
            std::cerr << "[kindling] Connection problem (attempt " << err.attempt
                      << "): " << err.message << '\n';
        } else {
            std::cerr << "[kindling] Listener error on message " << err.message_id
                      << ": " << err.message << '\n';
        }
    });
    stream->attach(print_message);
    stream->start();

    std::cerr << "[kindling] Streaming room " << room.id() << " ("
              << kindling::stream_mode_name(stream->mode()) << "). Ctrl+C to stop.\n";
    while (!g_shutdown.load() && stream->is_streaming()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    stream->stop();
    stream->join();
    std::cerr << "[kindling] Shutting down.\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    int64_t room_id = 0;
    std::string say;
    std::string topic;
    std::string upload_path;
    std::string config_path;
    bool listen = false;
    bool poll = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--room") == 0 && i + 1 < argc) {
            room_id = std::strtoll(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--say") == 0 && i + 1 < argc) {
            say = argv[++i];
        } else if (std::strcmp(argv[i], "--topic") == 0 && i + 1 < argc) {
            topic = argv[++i];
        } else if (std::strcmp(argv[i], "--upload") == 0 && i + 1 < argc) {
            upload_path = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--listen") == 0) {
            listen = true;
        } else if (std::strcmp(argv[i], "--poll") == 0) {
            poll = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (room_id <= 0) {
        std::cerr << "Error: --room ID is required\n";
        print_usage();
        return 1;
    }

    // Initialize
    kindling::http_init();
    auto config = config_path.empty() ? kindling::Config::load()
                                      : kindling::Config::load_from(config_path);
    if (poll) config.stream.mode = kindling::StreamMode::Polling;

    if (config.api_base_url().empty() || config.api_token.empty()) {
        std::cerr << "Error: set subdomain and api_token in the config file, "
                  << "or CAMPFIRE_SUBDOMAIN and CAMPFIRE_TOKEN\n";
        kindling::http_cleanup();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    kindling::CurlHttpClient http_client;
    kindling::Connection connection(http_client, config);
    kindling::Room room(connection, room_id);

    int rc = 0;
    bool acted = false;
    try {
        if (!topic.empty()) {
            room.set_topic(topic);
            std::cout << "Topic set.\n";
            acted = true;
        }
        if (!say.empty()) {
            auto sent = room.speak(say);
            std::cout << "Posted message " << sent.id << "\n";
            acted = true;
        }
        if (!upload_path.empty()) {
            rc = run_upload(room, upload_path, config.upload);
            acted = true;
        }
        if ((!acted || listen) && !g_shutdown.load()) {
            rc = run_stream(room, config.stream);
        }
    } catch (const kindling::ConnectionError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    } catch (const kindling::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    kindling::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
