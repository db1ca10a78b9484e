#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace push_to_talk {

class SavingWorkerException : public std::runtime_error {
public:
    explicit SavingWorkerException(const std::string& message)
        : std::runtime_error(message) {}
};

class ISavingWorker {
public:
    virtual ~ISavingWorker() = default;

    void SetSampleRate(unsigned int sampleRate) {
        _sampleRate = sampleRate;
        _setter_called = true;
    }
    void SetChannels(unsigned int channels) { _channels = channels; }
    void SetAudioData(std::vector<int16_t> audioData) { _audioData = std::move(audioData); }

    const std::vector<int16_t>& GetAudioData() const { return _audioData; }

    virtual bool Save() = 0;

protected:
    std::vector<int16_t> _audioData;
    unsigned int _sampleRate = 0;
    unsigned int _channels = 1;
    bool _setter_called = false;
};

} // namespace push_to_talk
