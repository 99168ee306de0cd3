#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Wire protocol shared by asr-streamd and asr-stream.
//
// Every message travels in a frame:
//   "asr-io" (6 bytes) + payload length (u32 LE) + frame type (u32 LE) + payload
// Text frames carry JSON (control messages upstream, results downstream).
// Binary frames carry raw PCM16LE mono audio with no boundary semantics.
namespace protocol {

inline constexpr char MAGIC[] = "asr-io";
inline constexpr size_t MAGIC_SIZE = 6;
inline constexpr size_t HEADER_SIZE = 14;
inline constexpr uint32_t MAX_PAYLOAD = 16 * 1024 * 1024;
inline constexpr uint32_t DEFAULT_SAMPLE_RATE = 16000;

enum class FrameType : uint32_t { Text = 1, Binary = 2 };

struct Frame {
    FrameType type = FrameType::Text;
    std::string payload;
};

std::string encode_frame(FrameType type, std::string_view payload);

// Incremental frame parser for stream sockets. Bytes are fed as they arrive;
// next() yields complete frames. A framing error leaves the decoder unusable,
// the stream cannot be resynchronized.
class FrameDecoder {
public:
    void feed(const char* data, size_t len);

    // Returns a frame, std::nullopt if more bytes are needed, or an error.
    std::expected<std::optional<Frame>, std::string> next();

    size_t buffered() const { return buf_.size() - pos_; }

private:
    std::string buf_;
    size_t pos_ = 0;
};

// Malformed structured text. Logged by the receiver, never fatal to a session.
struct ProtocolError {
    std::string message;
};

struct ConfigMessage {
    uint32_t sample_rate = DEFAULT_SAMPLE_RATE;
};

struct EofMessage {};

struct UnknownMessage {
    std::string type;
};

using ControlMessage = std::variant<ConfigMessage, EofMessage, UnknownMessage>;

std::expected<ControlMessage, ProtocolError> decode_control(std::string_view text);
std::string encode_config(uint32_t sample_rate);
std::string encode_eof();

struct Segment {
    std::string text;
    double start = 0.0;
    double end = 0.0;

    bool operator==(const Segment&) const = default;
};

struct RecognitionResult {
    std::string text;
    std::vector<Segment> segments;
    std::optional<std::string> error;

    static RecognitionResult failure(std::string message) {
        return {.text = {}, .segments = {}, .error = std::move(message)};
    }
};

std::string encode_result(const RecognitionResult& result);
std::expected<RecognitionResult, ProtocolError> decode_result(std::string_view text);

} // namespace protocol
