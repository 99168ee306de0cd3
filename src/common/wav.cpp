#include "wav.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace wav {

namespace {

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_FLOAT = 3;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

float sample_at(const uint8_t* p, uint16_t format, uint16_t bits) {
    if (format == FORMAT_FLOAT) {
        float v;
        std::memcpy(&v, p, 4);
        return v;
    }
    switch (bits) {
        case 8:
            return (static_cast<float>(*p) - 128.0f) / 128.0f;
        case 16: {
            int16_t v;
            std::memcpy(&v, p, 2);
            return static_cast<float>(v) / 32768.0f;
        }
        case 32: {
            int32_t v;
            std::memcpy(&v, p, 4);
            return static_cast<float>(static_cast<double>(v) / 2147483648.0);
        }
    }
    return 0.0f;
}

} // namespace

std::expected<DecodedAudio, std::string> decode(std::span<const uint8_t> data) {
    if (data.size() < 12 || !tag_is(data.data(), "RIFF") || !tag_is(data.data() + 8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    bool have_fmt = false;
    std::span<const uint8_t> pcm;
    bool have_data = false;

    size_t pos = 12;
    while (pos + 8 <= data.size()) {
        const uint8_t* chunk = data.data() + pos;
        uint32_t size = read_u32(chunk + 4);
        size_t body = pos + 8;
        size_t avail = data.size() - body;

        if (tag_is(chunk, "fmt ")) {
            if (size < 16 || avail < 16) return std::unexpected("truncated fmt chunk");
            format = read_u16(data.data() + body);
            channels = read_u16(data.data() + body + 2);
            sample_rate = read_u32(data.data() + body + 4);
            bits = read_u16(data.data() + body + 14);
            if (format == FORMAT_EXTENSIBLE) {
                if (size < 26 || avail < 26) return std::unexpected("truncated extensible fmt chunk");
                // First two bytes of the sub-format GUID hold the actual format tag.
                format = read_u16(data.data() + body + 24);
            }
            have_fmt = true;
        } else if (tag_is(chunk, "data")) {
            // Tolerate writers that leave the size field unset on streamed files.
            size_t len = std::min<size_t>(size, avail);
            pcm = data.subspan(body, len);
            have_data = true;
            break;
        }

        pos = body + size + (size & 1);
    }

    if (!have_fmt) return std::unexpected("missing fmt chunk");
    if (!have_data) return std::unexpected("missing data chunk");
    if (channels == 0) return std::unexpected("zero channels");
    if (sample_rate == 0) return std::unexpected("zero sample rate");

    bool supported = (format == FORMAT_PCM && (bits == 8 || bits == 16 || bits == 32)) ||
                     (format == FORMAT_FLOAT && bits == 32);
    if (!supported) {
        return std::unexpected("unsupported sample format " + std::to_string(format) +
                               " with " + std::to_string(bits) + " bits");
    }

    size_t bytes_per_sample = bits / 8;
    size_t frame_bytes = bytes_per_sample * channels;
    size_t frames = pcm.size() / frame_bytes;

    DecodedAudio out;
    out.sample_rate = sample_rate;
    out.channels = channels;
    out.samples.resize(frames);

    for (size_t f = 0; f < frames; f++) {
        const uint8_t* frame = pcm.data() + f * frame_bytes;
        float sum = 0.0f;
        for (uint16_t c = 0; c < channels; c++) {
            sum += sample_at(frame + c * bytes_per_sample, format, bits);
        }
        out.samples[f] = sum / static_cast<float>(channels);
    }

    return out;
}

std::expected<DecodedAudio, std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("could not open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return decode(bytes);
}

} // namespace wav
