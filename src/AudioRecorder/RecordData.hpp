#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace push_to_talk {

// Shared between AudioRecorder and the RtAudio callback thread
struct RecordData {
    std::vector<int16_t> audioData;
    std::mutex mutex;
    std::atomic<bool> isRecording{false};
    std::atomic<size_t> framesCaptured{0};
    size_t maxFrames = 0;
    unsigned int sampleRate = 0;
    unsigned int channels = 1;
    std::atomic<unsigned int> overflows{0};
};

// Appends nFrames interleaved frames from the driver buffer, stopping at
// maxFrames. Does nothing while not recording or without input.
// Returns the number of frames appended.
size_t AppendCaptured(RecordData& data, const int16_t* input, unsigned int nFrames);

} // namespace push_to_talk
