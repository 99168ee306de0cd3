#pragma once

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <span>
#include <string>

// External speech recognizer. Returns the raw structured result, expected to
// be an object with a "text" string and an optional "timestamp" list of
// {"text", "timestamp": [start_ms, end_ms]} entries. Shape checking is left
// to the caller. One instance is shared by all sessions.
class Recognizer {
public:
    virtual ~Recognizer() = default;
    virtual std::expected<nlohmann::json, std::string>
        recognize(std::span<const float> samples, uint32_t sample_rate) = 0;
};
