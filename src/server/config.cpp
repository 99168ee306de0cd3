#include "config.hpp"

#include "config_value.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int64_t MAX_TIMEOUT_S = 24 * 3600;

template <typename T>
void read_checked(const json& obj, const char* name, const char* key, T& out,
                  int64_t lo, int64_t hi) {
    if (!read_int_setting(obj, key, out, lo, hi)) {
        std::println(stderr, "config: {} must be an integer in [{}, {}], keeping {}",
                     name, lo, hi, out);
    }
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);
        Config parsed;

        if (j.contains("listen")) {
            auto& l = j["listen"];
            if (l.contains("host")) parsed.listen.host = l["host"].get<std::string>();
            read_checked(l, "listen.port", "port", parsed.listen.port, 0, 65535);
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            read_checked(s, "session.sample_rate", "sample_rate", parsed.session.sample_rate,
                         1, std::numeric_limits<uint32_t>::max());
            read_checked(s, "session.dispatch_threshold_bytes", "dispatch_threshold_bytes",
                         parsed.session.dispatch_threshold_bytes,
                         1, std::numeric_limits<int64_t>::max());
        }

        if (j.contains("recognizer")) {
            auto& r = j["recognizer"];
            if (r.contains("type")) parsed.recognizer.type = r["type"].get<std::string>();
            if (r.contains("url")) parsed.recognizer.url = r["url"].get<std::string>();
            if (r.contains("api_format")) parsed.recognizer.api_format = r["api_format"].get<std::string>();
            if (r.contains("language")) parsed.recognizer.language = r["language"].get<std::string>();
            read_checked(r, "recognizer.timeout_s", "timeout_s", parsed.recognizer.timeout_s,
                         1, MAX_TIMEOUT_S);
        }

        cfg = std::move(parsed);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "server.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
