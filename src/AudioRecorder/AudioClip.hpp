#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace push_to_talk {

// Interleaved 16-bit PCM handed from the capture device to a sender
struct AudioClip {
    std::vector<int16_t> samples;
    unsigned int sampleRate = 0;
    unsigned int channels = 1;

    size_t FrameCount() const {
        return channels == 0 ? 0 : samples.size() / channels;
    }

    double DurationSeconds() const {
        if (sampleRate == 0) return 0.0;
        return static_cast<double>(FrameCount()) / static_cast<double>(sampleRate);
    }

    void TrimToFrames(size_t frames) {
        const size_t count = frames * channels;
        if (samples.size() > count) {
            samples.resize(count);
        }
    }
};

} // namespace push_to_talk
