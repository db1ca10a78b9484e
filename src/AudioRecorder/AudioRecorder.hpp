#pragma once

#include <RtAudio.h>

#include <optional>
#include <string>
#include <vector>

#include "ICaptureDevice.hpp"
#include "RecordData.hpp"

namespace push_to_talk {

// One-line summary: name, id, input channels, default flag and sample rates
std::string DescribeDevice(const RtAudio::DeviceInfo& info);

// Microphone capture over RtAudio. The stream is opened per capture
// and closed again on Stop.
class AudioRecorder : public ICaptureDevice {
public:
    // Empty deviceName selects the default input device.
    explicit AudioRecorder(const std::string& deviceName = "");
    ~AudioRecorder() override;

    std::optional<CaptureHandle> Start(unsigned int sampleRate,
                                       unsigned int channels,
                                       double maxDurationSeconds) override;
    size_t SamplesCaptured(CaptureHandle handle) const override;
    AudioClip Stop(CaptureHandle handle) override;

    bool IsRecording() const { return _record_data.isRecording.load(); }
    std::string GetDeviceName() const { return _device_info.name; }

    static void ListDevices();

private:
    unsigned int NegotiateSampleRate(unsigned int requested) const;
    void CloseStream();

    RecordData _record_data;
    RtAudio _audio;
    RtAudio::StreamParameters _parameters;
    RtAudio::DeviceInfo _device_info;
    CaptureHandle _current_handle;
    CaptureHandle _next_handle;
    unsigned int _buffer_frames;
};

} // namespace push_to_talk
