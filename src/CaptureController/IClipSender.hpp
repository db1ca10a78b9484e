#pragma once

#include "../AudioRecorder/AudioClip.hpp"

namespace push_to_talk {

// Receives committed captures. Submit must not block; ownership of the
// clip passes to the sender.
class IClipSender {
public:
    virtual ~IClipSender() = default;
    virtual void Submit(AudioClip&& clip) = 0;
};

} // namespace push_to_talk
