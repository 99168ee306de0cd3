#include "client_config.hpp"
#include "logging.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/tcp_frame_client.hpp"
#include "stream_client.hpp"

#include <cerrno>
#include <cstdio>
#include <mutex>
#include <poll.h>
#include <print>
#include <string>
#include <unistd.h>

namespace {

std::mutex display_mutex;

void render(const TranscriptAggregator::Snapshot& snap, bool recording) {
    std::lock_guard lock(display_mutex);
    std::print("\033c");
    std::println("Current:     {}", snap.current_text);
    std::println("Transcript:  {}", snap.accumulated_text);
    if (snap.session_seconds) {
        std::println("Session:     {:.1f}s{}", *snap.session_seconds, recording ? " (recording)" : "");
    }
    std::println("");
    std::println("[s] start/stop recording   [q] quit");
    std::fflush(stdout);
}

// Reads one command line from stdin. Returns false on timeout; sets eof
// when stdin is closed.
bool read_command(std::string& line, bool& eof, int timeout_ms) {
    pollfd pfd{.fd = STDIN_FILENO, .events = POLLIN, .revents = 0};
    int ret = poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno == EINTR) return false;
        eof = true;
        return false;
    }
    if (ret == 0) return false;

    line.clear();
    char c;
    while (true) {
        ssize_t n = ::read(STDIN_FILENO, &c, 1);
        if (n <= 0) {
            eof = true;
            return !line.empty();
        }
        if (c == '\n') return true;
        line += c;
    }
}

} // namespace

static void usage(const char* prog) {
    std::println("Usage: {} [options]", prog);
    std::println("Options:");
    std::println("  -s, --server ADDR   Server address host:port (default from config)");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -v, --verbose       Verbose logging (-vv for per-frame debug)");
    std::println("  -h, --help          Show this help");
}

int main(int argc, char* argv[]) {
    int verbosity = 0;
    std::string config_path;
    std::string server;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbosity++;
        } else if (arg == "-vv") {
            verbosity += 2;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--server" || arg == "-s") && i + 1 < argc) {
            server = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    logging::set_verbosity(verbosity);

    ClientConfig config = config_path.empty() ? ClientConfig::load_default()
                                               : ClientConfig::load(config_path);
    if (!server.empty()) config.server = server;

    auto endpoint = parse_endpoint(config.server);
    if (!endpoint) {
        std::println(stderr, "Invalid server address '{}': {}", config.server, endpoint.error());
        return 1;
    }

    int rc = 0;
    {
        PipeWireCapture capture(config.sample_rate, config.frames_per_buffer);
        StreamClient* client_ptr = nullptr;
        StreamClient client(config, capture,
                            [&client_ptr](const protocol::RecognitionResult& result,
                                          const TranscriptAggregator::Snapshot& snap) {
                                if (result.error) return;
                                bool recording = client_ptr && client_ptr->recorder().is_recording();
                                render(snap, recording);
                            });
        client_ptr = &client;

        if (!client.connect(*endpoint)) {
            std::println(stderr, "Failed to connect to server at {}:{}", endpoint->host, endpoint->port);
            std::println(stderr, "Is asr-streamd running?");
            rc = 1;
        } else {
            if (!client.recorder().start()) {
                std::println(stderr, "Failed to start audio capture");
            }
            render(client.transcript().snapshot(), client.recorder().is_recording());

            bool eof = false;
            std::string line;
            while (!eof && client.connected()) {
                if (!read_command(line, eof, 250)) continue;
                if (line == "q") break;
                if (line == "s") {
                    if (!client.recorder().toggle()) {
                        std::println(stderr, "Failed to start audio capture");
                    }
                    render(client.transcript().snapshot(), client.recorder().is_recording());
                }
            }

            if (!client.connected()) {
                std::println(stderr, "Connection to server lost");
                rc = 1;
            }
            client.disconnect();

            auto snap = client.transcript().snapshot();
            if (!snap.accumulated_text.empty()) std::println("{}", snap.accumulated_text);
        }
    }

    return rc;
}
