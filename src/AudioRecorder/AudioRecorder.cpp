#include "AudioRecorder.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace push_to_talk {

namespace {

int record(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
           double /*streamTime*/, RtAudioStreamStatus status, void* userData)
{
    RecordData* data = static_cast<RecordData*>(userData);

    if (status) {
        data->overflows++;
    }

    AppendCaptured(*data, static_cast<const int16_t*>(inputBuffer), nBufferFrames);
    return 0;
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

} // namespace

size_t AppendCaptured(RecordData& data, const int16_t* input, unsigned int nFrames) {
    if (!data.isRecording || !input) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(data.mutex);
    const size_t captured = data.framesCaptured.load();
    if (captured >= data.maxFrames) {
        return 0;
    }

    // The clip has a fixed length; frames past the ceiling are dropped.
    const size_t frames = std::min<size_t>(nFrames, data.maxFrames - captured);
    data.audioData.insert(data.audioData.end(), input, input + frames * data.channels);
    data.framesCaptured = captured + frames;
    return frames;
}

std::string DescribeDevice(const RtAudio::DeviceInfo& info) {
    std::ostringstream oss;
    oss << info.name << " (ID " << info.ID << ", " << info.inputChannels << " input ch)";
    if (info.isDefaultInput) {
        oss << " [default]";
    }
    if (!info.sampleRates.empty()) {
        oss << " rates:";
        for (unsigned int sr : info.sampleRates) {
            oss << " " << sr;
        }
    }
    return oss.str();
}

AudioRecorder::AudioRecorder(const std::string& deviceName)
    : _current_handle(0)
    , _next_handle(1)
    , _buffer_frames(256) {
    std::vector<unsigned int> deviceIds = _audio.getDeviceIds();
    if (deviceIds.empty()) {
        throw std::runtime_error("No audio devices found");
    }

    PTT_DEBUG_LOG("Available audio devices:" << PTT_DEBUG_LOG_ENDL);
    for (unsigned int id : deviceIds) {
        PTT_DEBUG_LOG("  " << DescribeDevice(_audio.getDeviceInfo(id)) << PTT_DEBUG_LOG_ENDL);
    }

    unsigned int selected = _audio.getDefaultInputDevice();
    RtAudio::DeviceInfo selectedInfo = _audio.getDeviceInfo(selected);

    if (!deviceName.empty()) {
        bool found = false;
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo info = _audio.getDeviceInfo(id);
            if (info.inputChannels > 0 && ContainsIgnoreCase(info.name, deviceName)) {
                selected = id;
                selectedInfo = info;
                found = true;
                break;
            }
        }
        if (!found) {
            std::cerr << "Input device '" << deviceName << "' not found, using default" << std::endl;
        }
    }

    if (selectedInfo.inputChannels < 1) {
        PTT_DEBUG_LOG("Default device has no input channels! Searching for alternative..." << PTT_DEBUG_LOG_ENDL);
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo info = _audio.getDeviceInfo(id);
            if (info.inputChannels > 0) {
                selected = id;
                selectedInfo = info;
                break;
            }
        }
    }

    if (selectedInfo.inputChannels < 1) {
        throw std::runtime_error("No input devices found!");
    }

    _device_info = selectedInfo;
    _parameters.deviceId = selected;
    _parameters.nChannels = 1;
    _parameters.firstChannel = 0;

    PTT_DEBUG_LOG("Using input device: " << _device_info.name
                  << " (" << _device_info.inputChannels << " channels)" << PTT_DEBUG_LOG_ENDL);
}

AudioRecorder::~AudioRecorder() {
    _record_data.isRecording = false;
    CloseStream();
}

void AudioRecorder::ListDevices() {
    RtAudio audio;
    std::vector<unsigned int> deviceIds = audio.getDeviceIds();
    if (deviceIds.empty()) {
        std::cout << "No audio devices found." << std::endl;
        return;
    }

    std::cout << "Audio input devices:" << std::endl;
    for (unsigned int id : deviceIds) {
        RtAudio::DeviceInfo info = audio.getDeviceInfo(id);
        if (info.inputChannels == 0) continue;
        std::cout << "- " << DescribeDevice(info) << std::endl;
    }
}

unsigned int AudioRecorder::NegotiateSampleRate(unsigned int requested) const {
    for (unsigned int sr : _device_info.sampleRates) {
        if (sr == requested) {
            return requested;
        }
    }
    if (_device_info.preferredSampleRate == 0) {
        return requested;
    }
    PTT_DEBUG_LOG(requested << " Hz not supported, using preferred rate: "
                  << _device_info.preferredSampleRate << PTT_DEBUG_LOG_ENDL);
    return _device_info.preferredSampleRate;
}

std::optional<CaptureHandle> AudioRecorder::Start(unsigned int sampleRate,
                                                  unsigned int channels,
                                                  double maxDurationSeconds) {
    if (_record_data.isRecording || _audio.isStreamOpen()) {
        std::cerr << "Capture already running on " << _device_info.name << std::endl;
        return std::nullopt;
    }
    if (channels == 0 || channels > _device_info.inputChannels) {
        std::cerr << "Device " << _device_info.name << " cannot capture "
                  << channels << " channels" << std::endl;
        return std::nullopt;
    }

    const unsigned int rate = NegotiateSampleRate(sampleRate);
    _parameters.nChannels = channels;

    {
        std::lock_guard<std::mutex> lock(_record_data.mutex);
        _record_data.sampleRate = rate;
        _record_data.channels = channels;
        _record_data.maxFrames = static_cast<size_t>(std::llround(maxDurationSeconds * rate));
        _record_data.framesCaptured = 0;
        _record_data.overflows = 0;
        _record_data.audioData.clear();
        _record_data.audioData.reserve(_record_data.maxFrames * channels);
    }

    unsigned int bufferFrames = _buffer_frames;

    PTT_DEBUG_LOG("Opening stream: " << rate << " Hz, " << channels
                  << " ch, " << bufferFrames << " frames, SINT16" << PTT_DEBUG_LOG_ENDL);

    if (_audio.openStream(nullptr, &_parameters, RTAUDIO_SINT16,
                          rate, &bufferFrames, &record, &_record_data)) {
        std::cerr << "Error opening stream: " << _audio.getErrorText() << std::endl;
        CloseStream();
        return std::nullopt;
    }

    _record_data.isRecording = true;

    if (_audio.startStream()) {
        std::cerr << "Error starting stream: " << _audio.getErrorText() << std::endl;
        _record_data.isRecording = false;
        CloseStream();
        return std::nullopt;
    }

    _current_handle = _next_handle++;
    return _current_handle;
}

size_t AudioRecorder::SamplesCaptured(CaptureHandle handle) const {
    if (handle != _current_handle) {
        return 0;
    }
    return _record_data.framesCaptured.load();
}

AudioClip AudioRecorder::Stop(CaptureHandle handle) {
    AudioClip clip;
    if (handle == 0 || handle != _current_handle) {
        return clip;
    }

    _record_data.isRecording = false;
    if (_audio.isStreamRunning()) {
        _audio.stopStream();
    }
    CloseStream();
    _current_handle = 0;

    std::lock_guard<std::mutex> lock(_record_data.mutex);
    if (_record_data.overflows.load() > 0) {
        PTT_DEBUG_LOG("Stream overflow detected " << _record_data.overflows.load() << " times" << PTT_DEBUG_LOG_ENDL);
    }

    clip.sampleRate = _record_data.sampleRate;
    clip.channels = _record_data.channels;
    clip.samples = std::move(_record_data.audioData);
    _record_data.audioData.clear();

    PTT_DEBUG_LOG("Recorded " << clip.FrameCount() << " frames" << PTT_DEBUG_LOG_ENDL);
    return clip;
}

void AudioRecorder::CloseStream() {
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
}

} // namespace push_to_talk
