#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "ISavingWorker.hpp"
#include "../AudioRecorder/AudioClip.hpp"

namespace push_to_talk {

// 16-bit PCM WAV packaging through libsndfile
class WavWorker : public ISavingWorker {
public:
    explicit WavWorker(std::string filename = "");

    // Loads sample rate, channels and samples from a clip
    void SetClip(AudioClip clip);

    // Whole WAV file in memory; empty when there is no audio
    std::vector<uint8_t> Encode() const;

    // Writes to the filename given at construction
    bool Save() override;

    const std::string& GetFilename() const { return _filename; }
    void SetFilename(std::string filename) { _filename = std::move(filename); }

private:
    void CheckFormat() const;

    std::string _filename;
};

} // namespace push_to_talk
