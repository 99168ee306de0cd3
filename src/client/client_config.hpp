#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct ClientConfig {
    std::string server = "127.0.0.1:8081";
    uint32_t sample_rate = 16000;
    uint32_t frames_per_buffer = 1600; // 100 ms at 16 kHz
    size_t queue_frames = 64;
    // How long disconnect waits for the answer to a final eof.
    uint32_t drain_timeout_ms = 3000;

    static ClientConfig load(const std::string& path);
    static ClientConfig load_default();
};
