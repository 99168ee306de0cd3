#include "recognition.hpp"

#include "logging.hpp"

using json = nlohmann::json;

namespace {

// Recognizer output may carry invalid UTF-8; never let a log line throw.
std::string for_log(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

std::vector<float> pcm16le_to_float(std::span<const uint8_t> bytes) {
    std::vector<float> out(bytes.size() / 2);
    for (size_t i = 0; i < out.size(); i++) {
        auto lo = static_cast<uint16_t>(bytes[2 * i]);
        auto hi = static_cast<uint16_t>(bytes[2 * i + 1]);
        auto sample = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
        out[i] = static_cast<float>(sample) / 32768.0f;
    }
    return out;
}

protocol::RecognitionResult map_recognizer_output(const json& output) {
    if (!output.is_object()) {
        logging::error("recognizer returned a non-record result: {}", for_log(output));
        return protocol::RecognitionResult::failure("unexpected result shape");
    }

    protocol::RecognitionResult result;
    if (output.contains("text")) {
        if (!output["text"].is_string()) {
            logging::error("recognizer text is not a string: {}", for_log(output["text"]));
            return protocol::RecognitionResult::failure("unexpected result shape");
        }
        result.text = output["text"].get<std::string>();
    }

    if (!output.contains("timestamp")) return result;

    auto& stamps = output["timestamp"];
    if (!stamps.is_array()) {
        logging::warn("timestamp data is not a list: {}", for_log(stamps));
        return result;
    }

    for (auto& seg : stamps) {
        bool valid = seg.is_object() && seg.contains("text") && seg["text"].is_string() &&
                     seg.contains("timestamp") && seg["timestamp"].is_array() &&
                     seg["timestamp"].size() >= 2 && seg["timestamp"][0].is_number() &&
                     seg["timestamp"][1].is_number();
        if (!valid) {
            logging::warn("skipping malformed timestamp segment: {}", for_log(seg));
            continue;
        }
        result.segments.push_back({
            .text = seg["text"].get<std::string>(),
            .start = seg["timestamp"][0].get<double>(),
            .end = seg["timestamp"][1].get<double>(),
        });
    }

    return result;
}
