#pragma once

#include "protocol.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <span>
#include <vector>

// Converts little-endian signed 16-bit samples to floats in [-1.0, 1.0).
// A trailing odd byte is ignored.
std::vector<float> pcm16le_to_float(std::span<const uint8_t> bytes);

// Maps a raw recognizer result to a RecognitionResult. A value that is not a
// record, or whose "text" is not a string, yields error "unexpected result shape".
protocol::RecognitionResult map_recognizer_output(const nlohmann::json& output);
