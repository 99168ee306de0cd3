#include "batch_runner.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "recognizer/lan_recognizer.hpp"

#include <filesystem>
#include <memory>
#include <print>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

static void usage(const char* prog) {
    std::println("Usage: {} -i INPUT [options]", prog);
    std::println("Options:");
    std::println("  -i, --input PATH    WAV file, or directory searched recursively");
    std::println("  -o, --output DIR    Output directory (default results)");
    std::println("  -c, --config PATH   Server config file (recognizer section)");
    std::println("  -v, --verbose       Verbose logging");
    std::println("  -h, --help          Show this help");
}

int main(int argc, char* argv[]) {
    int verbosity = 0;
    std::string input;
    std::string output = "results";
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbosity++;
        } else if ((arg == "--input" || arg == "-i") && i + 1 < argc) {
            input = argv[++i];
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            output = argv[++i];
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (input.empty()) {
        usage(argv[0]);
        return 1;
    }

    logging::set_verbosity(verbosity);

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (config.recognizer.type != "lan") {
        std::println(stderr, "Unknown recognizer type: {}", config.recognizer.type);
        return 1;
    }
    auto recognizer = std::make_unique<LanRecognizer>(
        config.recognizer.url, config.recognizer.api_format,
        config.recognizer.language, config.recognizer.timeout_s);

    std::error_code ec;
    fs::path in_path(input);
    std::vector<fs::path> files;
    if (fs::is_directory(in_path, ec)) {
        files = batch::collect_inputs(in_path);
    } else if (fs::is_regular_file(in_path, ec)) {
        files.push_back(in_path);
    } else {
        std::println(stderr, "Invalid input path: {}", input);
        return 1;
    }

    size_t succeeded = 0;
    for (auto& file : files) {
        if (batch::process_file(*recognizer, file, output)) succeeded++;
    }

    std::println(stderr, "[asr-stream] found {} audio file(s), {} processed successfully",
                 files.size(), succeeded);
    return 0;
}
