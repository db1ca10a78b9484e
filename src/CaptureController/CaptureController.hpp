#pragma once

#include <cstdint>
#include <functional>
#include <utility>

#include "IClipSender.hpp"
#include "../AudioRecorder/ICaptureDevice.hpp"
#include "../Config/AppConfig.hpp"
#include "../Input/IInputSource.hpp"
#include "../Scheduler/TickScheduler.hpp"
#include "../common/Clock.hpp"
#include "../common/Diagnostics.hpp"

namespace push_to_talk {

// Hold the button to talk, release to send.
//
// Poll() is called once per tick. It derives press/release edges from the
// input source, starts a capture on press and commits it on release. A
// one-shot timer on the scheduler commits the capture when the button is
// held for maxDurationSeconds. Exactly one of release and timer commits a
// given session. Captures shorter than minValidDurationSeconds are dropped.
class CaptureController {
public:
    enum class State {
        Idle,
        Recording
    };

    enum class StopReason {
        Released,
        MaxDuration
    };

    using StateCallback = std::function<void(State)>;

    // Throws ConfigException for an invalid config. All collaborators must
    // outlive the controller.
    CaptureController(const CaptureConfig& config,
                      IInputSource& input,
                      ICaptureDevice& device,
                      IClipSender& sender,
                      TickScheduler& scheduler,
                      const IClock& clock,
                      IDiagnostics& diagnostics);
    ~CaptureController();

    CaptureController(const CaptureController&) = delete;
    CaptureController& operator=(const CaptureController&) = delete;

    void Poll();

    State GetState() const { return _state; }
    bool IsRecording() const { return _state == State::Recording; }
    const CaptureConfig& GetConfig() const { return _config; }

    // Seconds since the current capture started, 0 when idle
    double RecordingDuration() const;

    void SetStateCallback(StateCallback callback) { _stateCallback = std::move(callback); }

private:
    struct CaptureSession {
        uint64_t id = 0;
        CaptureHandle handle = 0;
        TimePoint startTimestamp{};
        TimerId timer = kInvalidTimer;
    };

    void BeginRecording();
    void StopRecordingAndCommit(StopReason reason);
    void OnMaxDurationReached(uint64_t sessionId);
    void ChangeState(State newState);

    const CaptureConfig _config;
    IInputSource& _input;
    ICaptureDevice& _device;
    IClipSender& _sender;
    TickScheduler& _scheduler;
    const IClock& _clock;
    IDiagnostics& _diagnostics;

    State _state;
    CaptureSession _session;
    uint64_t _next_session_id;
    bool _button_held;
    bool _input_available;
    StateCallback _stateCallback;
};

const char* ToString(CaptureController::State state);

} // namespace push_to_talk
