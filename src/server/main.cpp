#include "config.hpp"
#include "logging.hpp"
#include "platform/linux/server_loop.hpp"
#include "recognizer/lan_recognizer.hpp"

#include <cstdlib>
#include <memory>
#include <print>
#include <string>

static void usage(const char* prog) {
    std::println("Usage: {} [options]", prog);
    std::println("Options:");
    std::println("  -l, --listen HOST   Address to listen on (default 127.0.0.1)");
    std::println("  -p, --port PORT     Port to listen on (default 8081)");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -v, --verbose       Verbose logging (-vv for per-frame debug)");
    std::println("  -h, --help          Show this help");
}

int main(int argc, char* argv[]) {
    int verbosity = 0;
    std::string config_path;
    std::string host;
    int port = -1;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbosity++;
        } else if (arg == "-vv") {
            verbosity += 2;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--listen" || arg == "-l") && i + 1 < argc) {
            host = argv[++i];
        } else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            port = std::atoi(argv[++i]);
            if (port <= 0 || port > 65535) {
                std::println(stderr, "Invalid port: {}", argv[i]);
                return 1;
            }
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

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!host.empty()) config.listen.host = host;
    if (port > 0) config.listen.port = static_cast<uint16_t>(port);

    std::unique_ptr<Recognizer> recognizer;
    if (config.recognizer.type == "lan") {
        recognizer = std::make_unique<LanRecognizer>(
            config.recognizer.url, config.recognizer.api_format,
            config.recognizer.language, config.recognizer.timeout_s);
    } else {
        std::println(stderr, "Unknown recognizer type: {}", config.recognizer.type);
        return 1;
    }

    logging::info("starting (recognizer: {} @ {}, threshold {} bytes)",
                  config.recognizer.type, config.recognizer.url,
                  config.session.dispatch_threshold_bytes);

    ServerLoop loop(std::move(config), std::move(recognizer));
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize server");
        return 1;
    }

    loop.run();
    logging::info("exiting");
    return 0;
}
