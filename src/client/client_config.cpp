#include "client_config.hpp"

#include "config_value.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

ClientConfig ClientConfig::load(const std::string& path) {
    ClientConfig cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);
        ClientConfig parsed;

        if (j.contains("server")) parsed.server = j["server"].get<std::string>();

        constexpr int64_t u32_max = std::numeric_limits<uint32_t>::max();
        bool valid = read_int_setting(j, "sample_rate", parsed.sample_rate, 1, u32_max) &&
                     read_int_setting(j, "frames_per_buffer", parsed.frames_per_buffer, 1, u32_max) &&
                     read_int_setting(j, "queue_frames", parsed.queue_frames, 1, 1 << 20) &&
                     read_int_setting(j, "drain_timeout_ms", parsed.drain_timeout_ms, 0, 60000);
        if (!valid) {
            std::println(stderr, "config: numeric settings out of range, using defaults");
            return cfg;
        }
        cfg = std::move(parsed);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

ClientConfig ClientConfig::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return ClientConfig{};

    auto config_path = fs::path(dir) / "client.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return ClientConfig{};
}
