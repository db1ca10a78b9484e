#pragma once

namespace push_to_talk {

// One logical push-to-talk button, polled once per tick
class IInputSource {
public:
    virtual ~IInputSource() = default;

    // False while the device is disconnected
    virtual bool IsAvailable() const = 0;

    // False when the device lacks the button feature; pressed is untouched then
    virtual bool TryGetPressed(bool& pressed) const = 0;
};

} // namespace push_to_talk
