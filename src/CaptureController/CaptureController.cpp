#include "CaptureController.hpp"

#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace push_to_talk {

namespace {

std::string FormatSeconds(double seconds, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << seconds << "s";
    return oss.str();
}

} // namespace

const char* ToString(CaptureController::State state) {
    switch (state) {
        case CaptureController::State::Idle: return "Idle";
        case CaptureController::State::Recording: return "Recording";
    }
    return "Unknown";
}

CaptureController::CaptureController(const CaptureConfig& config,
                                     IInputSource& input,
                                     ICaptureDevice& device,
                                     IClipSender& sender,
                                     TickScheduler& scheduler,
                                     const IClock& clock,
                                     IDiagnostics& diagnostics)
    : _config(config)
    , _input(input)
    , _device(device)
    , _sender(sender)
    , _scheduler(scheduler)
    , _clock(clock)
    , _diagnostics(diagnostics)
    , _state(State::Idle)
    , _next_session_id(1)
    , _button_held(false)
    , _input_available(true) {
    ValidateCaptureConfig(_config);
}

CaptureController::~CaptureController() {
    if (_state != State::Recording) {
        return;
    }

    // Shutting down mid-capture: release the device, send nothing.
    _scheduler.Cancel(_session.timer);
    AudioClip dropped = _device.Stop(_session.handle);
    _diagnostics.Info("Dropped unfinished capture of " +
                      std::to_string(dropped.FrameCount()) + " frames on shutdown");
}

void CaptureController::Poll() {
    if (!_input.IsAvailable()) {
        if (_input_available) {
            _input_available = false;
            if (_state == State::Recording) {
                _diagnostics.Warning("Input source lost while recording; time limit still applies");
            } else {
                _diagnostics.Warning("Input source unavailable");
            }
        }
        return;
    }
    if (!_input_available) {
        _input_available = true;
        _diagnostics.Info("Input source available again");
    }

    bool pressed = false;
    if (!_input.TryGetPressed(pressed)) {
        return;
    }

    if (!_button_held && pressed) {
        BeginRecording();
        _button_held = true;
    } else if (_button_held && !pressed) {
        StopRecordingAndCommit(StopReason::Released);
        _button_held = false;
    }
}

double CaptureController::RecordingDuration() const {
    if (_state != State::Recording) {
        return 0.0;
    }
    return Seconds(_clock.Now() - _session.startTimestamp).count();
}

void CaptureController::BeginRecording() {
    if (_state == State::Recording) {
        return;
    }

    std::optional<CaptureHandle> handle =
        _device.Start(_config.sampleRate, _config.channels, _config.maxDurationSeconds);
    if (!handle) {
        _diagnostics.Error("Microphone failed to start");
        return;
    }

    _session.id = _next_session_id++;
    _session.handle = *handle;
    _session.startTimestamp = _clock.Now();

    const uint64_t sessionId = _session.id;
    _session.timer = _scheduler.ScheduleAfter(Seconds(_config.maxDurationSeconds),
                                              [this, sessionId]() { OnMaxDurationReached(sessionId); });

    ChangeState(State::Recording);
    _diagnostics.Info("REC started (session " + std::to_string(sessionId) + ")");
}

void CaptureController::OnMaxDurationReached(uint64_t sessionId) {
    if (_state != State::Recording || _session.id != sessionId) {
        return;
    }

    // The scheduler already dropped this timer.
    _session.timer = kInvalidTimer;
    _diagnostics.Info("Auto-stop (time limit)");
    StopRecordingAndCommit(StopReason::MaxDuration);
}

void CaptureController::StopRecordingAndCommit(StopReason reason) {
    if (_state != State::Recording) {
        return;
    }

    // Cancel first: once the commit begins the timer cannot fire for this session.
    if (_session.timer != kInvalidTimer) {
        _scheduler.Cancel(_session.timer);
        _session.timer = kInvalidTimer;
    }

    const size_t framesCaptured = _device.SamplesCaptured(_session.handle);
    AudioClip clip = _device.Stop(_session.handle);
    const uint64_t sessionId = _session.id;

    _session = CaptureSession();
    ChangeState(State::Idle);

    if (clip.sampleRate == 0) {
        clip.sampleRate = _config.sampleRate;
    }
    clip.TrimToFrames(framesCaptured);

    double seconds = _config.maxDurationSeconds;
    if (reason == StopReason::Released) {
        seconds = static_cast<double>(framesCaptured) / static_cast<double>(clip.sampleRate);
        if (seconds < _config.minValidDurationSeconds) {
            _diagnostics.Warning("Discarded " + FormatSeconds(seconds, 3) + " - too short");
            return;
        }
    }

    _sender.Submit(std::move(clip));
    _diagnostics.Info("SENT " + FormatSeconds(seconds, 2) +
                      " (session " + std::to_string(sessionId) + ")");
}

void CaptureController::ChangeState(State newState) {
    if (_state == newState) {
        return;
    }
    _state = newState;
    if (_stateCallback) {
        _stateCallback(newState);
    }
}

} // namespace push_to_talk
