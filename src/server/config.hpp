#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Listen {
        std::string host = "127.0.0.1";
        uint16_t port = 8081;
    } listen;

    struct SessionOptions {
        uint32_t sample_rate = 16000;
        // ~1 s of 16-bit mono audio at 16 kHz
        size_t dispatch_threshold_bytes = 32000;
    } session;

    struct Backend {
        std::string type = "lan";
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "zh";
        long timeout_s = 120;
    } recognizer;

    static Config load(const std::string& path);
    static Config load_default();
};
