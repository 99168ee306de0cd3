#pragma once

#include "recognizer.hpp"

#include <string>

// Recognizer backed by an HTTP speech server on the local network.
class LanRecognizer : public Recognizer {
public:
    // api_format: "whisper.cpp" or "openai"
    LanRecognizer(std::string url, std::string api_format = "whisper.cpp",
                  std::string language = "zh", long timeout_s = 120);
    ~LanRecognizer() override;

    LanRecognizer(const LanRecognizer&) = delete;
    LanRecognizer& operator=(const LanRecognizer&) = delete;

    std::expected<nlohmann::json, std::string>
        recognize(std::span<const float> samples, uint32_t sample_rate) override;

    // Converts a whisper.cpp / OpenAI verbose_json body into the recognizer
    // result shape. Exposed for tests.
    static std::expected<nlohmann::json, std::string> normalize_response(const std::string& body);

private:
    std::string url_;
    std::string api_format_;
    std::string language_;
    long timeout_s_;
};
