#pragma once

#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// In-memory WAV encoding for recognizer uploads and decoding for batch input.
namespace wav {

// Encodes mono float samples as a 32-bit IEEE float WAV file.
inline std::vector<uint8_t> encode_float(std::span<const float> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 32;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(float));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(3);                 // IEEE float
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + 44, samples.data(), data_size);
    }

    return out;
}

struct DecodedAudio {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    std::vector<float> samples; // mono, [-1.0, 1.0]
};

// Decodes PCM 8/16/32-bit or float32 WAV data. Multi-channel input is
// down-mixed to mono by averaging the channels of each frame.
std::expected<DecodedAudio, std::string> decode(std::span<const uint8_t> data);

std::expected<DecodedAudio, std::string> read_file(const std::string& path);

} // namespace wav
