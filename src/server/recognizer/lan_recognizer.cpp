#include "lan_recognizer.hpp"

#include "logging.hpp"
#include "wav.hpp"

#include <chrono>
#include <cmath>
#include <curl/curl.h>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

LanRecognizer::LanRecognizer(std::string url, std::string api_format, std::string language,
                             long timeout_s)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)), timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanRecognizer::~LanRecognizer() {
    curl_global_cleanup();
}

std::expected<nlohmann::json, std::string>
LanRecognizer::recognize(std::span<const float> samples, uint32_t sample_rate) {
    if (samples.empty()) {
        return std::unexpected("empty audio");
    }

    auto wav_data = wav::encode_float(samples, sample_rate);

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "verbose_json", CURL_ZERO_TERMINATED);

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, "whisper-1", CURL_ZERO_TERMINATED);

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "timestamp_granularities[]");
        curl_mime_data(part, "segment", CURL_ZERO_TERMINATED);
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "temperature");
        curl_mime_data(part, "0.0", CURL_ZERO_TERMINATED);
    }

    if (!language_.empty()) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, language_.c_str(), CURL_ZERO_TERMINATED);
    }

    std::string response_body;
    long http_status = 0;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    logging::debug("recognizer: HTTP {} in {:.2f}s for {:.2f}s of audio", http_status,
                   processing_s, static_cast<double>(samples.size()) / sample_rate);

    if (http_status >= 400 && response_body.empty()) {
        return std::unexpected("server returned HTTP " + std::to_string(http_status));
    }

    return normalize_response(response_body);
}

std::expected<nlohmann::json, std::string>
LanRecognizer::normalize_response(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }

    // Anything that is not a record is passed through for shape checking.
    if (!j.is_object()) return j;

    if (j.contains("error") && !j.contains("text")) {
        auto& err = j["error"];
        std::string msg;
        if (err.is_string()) msg = err.get<std::string>();
        else if (err.is_object() && err.contains("message") && err["message"].is_string())
            msg = err["message"].get<std::string>();
        else msg = err.dump(-1, ' ', false, json::error_handler_t::replace);
        return std::unexpected("server error: " + msg);
    }

    if (!j.contains("text")) {
        return std::unexpected("unexpected response: " + body);
    }

    if (!j["text"].is_string()) return j;

    json out = {{"text", trim(j["text"].get<std::string>())}};

    if (j.contains("segments") && j["segments"].is_array()) {
        json stamps = json::array();
        for (auto& seg : j["segments"]) {
            if (!seg.is_object() || !seg.contains("start") || !seg.contains("end")) continue;
            if (!seg["start"].is_number() || !seg["end"].is_number()) continue;
            if (seg.contains("text") && !seg["text"].is_string()) continue;
            auto to_ms = [](const json& v) { return std::lround(v.get<double>() * 1000.0); };
            stamps.push_back({
                {"text", trim(seg.value("text", ""))},
                {"timestamp", {to_ms(seg["start"]), to_ms(seg["end"])}},
            });
        }
        out["timestamp"] = std::move(stamps);
    }

    return out;
}
