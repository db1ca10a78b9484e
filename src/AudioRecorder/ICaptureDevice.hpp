#pragma once

#include <cstddef>
#include <optional>

#include "AudioClip.hpp"

namespace push_to_talk {

using CaptureHandle = unsigned int;

class ICaptureDevice {
public:
    virtual ~ICaptureDevice() = default;

    // Empty on failure; the device logs the reason.
    virtual std::optional<CaptureHandle> Start(unsigned int sampleRate,
                                               unsigned int channels,
                                               double maxDurationSeconds) = 0;

    // Frames captured so far, never more than maxDurationSeconds worth
    virtual size_t SamplesCaptured(CaptureHandle handle) const = 0;

    virtual AudioClip Stop(CaptureHandle handle) = 0;
};

} // namespace push_to_talk
