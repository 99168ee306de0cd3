#include "protocol.hpp"

#include <cstring>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace protocol {

std::string encode_frame(FrameType type, std::string_view payload) {
    auto len = static_cast<uint32_t>(payload.size());
    auto type_id = static_cast<uint32_t>(type);

    std::string out(HEADER_SIZE + payload.size(), '\0');
    std::memcpy(out.data(), MAGIC, MAGIC_SIZE);
    std::memcpy(out.data() + 6, &len, 4);
    std::memcpy(out.data() + 10, &type_id, 4);
    if (!payload.empty()) {
        std::memcpy(out.data() + HEADER_SIZE, payload.data(), payload.size());
    }
    return out;
}

void FrameDecoder::feed(const char* data, size_t len) {
    // Compact consumed bytes before growing the buffer.
    if (pos_ > 0 && pos_ == buf_.size()) {
        buf_.clear();
        pos_ = 0;
    } else if (pos_ > 64 * 1024) {
        buf_.erase(0, pos_);
        pos_ = 0;
    }
    buf_.append(data, len);
}

std::expected<std::optional<Frame>, std::string> FrameDecoder::next() {
    if (buffered() < HEADER_SIZE) return std::nullopt;

    const char* header = buf_.data() + pos_;
    if (std::memcmp(header, MAGIC, MAGIC_SIZE) != 0) {
        return std::unexpected("bad frame magic");
    }

    uint32_t len;
    uint32_t type_id;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type_id, header + 10, 4);

    if (type_id != static_cast<uint32_t>(FrameType::Text) &&
        type_id != static_cast<uint32_t>(FrameType::Binary)) {
        return std::unexpected("unknown frame type " + std::to_string(type_id));
    }
    if (len > MAX_PAYLOAD) {
        return std::unexpected("frame too large: " + std::to_string(len) + " bytes");
    }
    if (buffered() < HEADER_SIZE + len) return std::nullopt;

    Frame frame{
        .type = static_cast<FrameType>(type_id),
        .payload = buf_.substr(pos_ + HEADER_SIZE, len),
    };
    pos_ += HEADER_SIZE + len;
    return frame;
}

std::expected<ControlMessage, ProtocolError> decode_control(std::string_view text) {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(ProtocolError{"control message is not an object"});
        }

        std::string type = j.value("type", "");
        if (type == "config") {
            ConfigMessage msg;
            if (j.contains("sample_rate")) {
                auto& sr = j["sample_rate"];
                if (!sr.is_number_integer() || sr.get<int64_t>() <= 0 ||
                    sr.get<int64_t>() > UINT32_MAX) {
                    return std::unexpected(ProtocolError{"invalid sample_rate: " + sr.dump()});
                }
                msg.sample_rate = sr.get<uint32_t>();
            }
            return msg;
        }
        if (type == "eof") return EofMessage{};
        return UnknownMessage{std::move(type)};
    } catch (const json::exception& e) {
        return std::unexpected(ProtocolError{std::string("malformed control message: ") + e.what()});
    }
}

std::string encode_config(uint32_t sample_rate) {
    return json{{"type", "config"}, {"sample_rate", sample_rate}}.dump();
}

std::string encode_eof() {
    return json{{"type", "eof"}}.dump();
}

std::string encode_result(const RecognitionResult& result) {
    json j = {{"text", result.text}, {"timestamps", json::array()}};
    for (auto& s : result.segments) {
        j["timestamps"].push_back({{"text", s.text}, {"start", s.start}, {"end", s.end}});
    }
    if (result.error) j["error"] = *result.error;
    // Recognizer text may carry invalid UTF-8; replace rather than throw.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::expected<RecognitionResult, ProtocolError> decode_result(std::string_view text) {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(ProtocolError{"result is not an object"});
        }

        RecognitionResult result;
        result.text = j.value("text", "");
        if (j.contains("error") && !j["error"].is_null()) {
            result.error = j["error"].get<std::string>();
        }
        if (j.contains("timestamps") && j["timestamps"].is_array()) {
            for (auto& ts : j["timestamps"]) {
                result.segments.push_back({
                    .text = ts.value("text", ""),
                    .start = ts.value("start", 0.0),
                    .end = ts.value("end", 0.0),
                });
            }
        }
        return result;
    } catch (const json::exception& e) {
        return std::unexpected(ProtocolError{std::string("malformed result: ") + e.what()});
    }
}

} // namespace protocol
