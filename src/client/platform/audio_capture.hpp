#pragma once

#include <cstdint>
#include <functional>
#include <span>

class AudioCapture {
public:
    // Receives PCM16LE mono bytes on the capture thread. Must not block.
    using FrameCallback = std::function<void(std::span<const uint8_t>)>;

    virtual ~AudioCapture() = default;
    virtual bool start(FrameCallback on_frame) = 0;
    // Returns once no callback is running or will run again.
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
};
