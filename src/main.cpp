#include "AudioRecorder/AudioRecorder.hpp"
#include "BackendClient/BackendClient.hpp"
#include "CaptureController/CaptureController.hpp"
#include "Config/AppConfig.hpp"
#include "Input/ConsoleInputSource.hpp"
#include "SavingWorkers/WavWorker.hpp"
#include "Scheduler/TickScheduler.hpp"
#include "common/Clock.hpp"
#include "common/Diagnostics.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ptt = push_to_talk;

namespace {

// Sender that keeps a WAV copy of each clip before passing it on
class DumpingSender : public ptt::IClipSender {
public:
    DumpingSender(ptt::IClipSender& next, std::string path)
        : _next(next), _worker(std::move(path)) {}

    void Submit(ptt::AudioClip&& clip) override {
        _worker.SetClip(clip);
        if (!_worker.Save()) {
            std::cerr << "Could not write " << _worker.GetFilename() << std::endl;
        }
        _next.Submit(std::move(clip));
    }

private:
    ptt::IClipSender& _next;
    ptt::WavWorker _worker;
};

class PushToTalkApplication {
public:
    explicit PushToTalkApplication(const ptt::AppConfig& config)
        : _config(config)
        , _input(std::cin)
        , _scheduler(_clock)
        , _diagnostics("Recorder") {
    }

    bool Run() {
        try {
            _recorder = std::make_unique<ptt::AudioRecorder>(_config.inputDevice);
        } catch (const std::exception& e) {
            std::cerr << "Failed to open audio input: " << e.what() << std::endl;
            return false;
        }
        std::cout << "Using " << _recorder->GetDeviceName() << std::endl;

        _backend = std::make_unique<ptt::BackendClient>(_config.backendUrl, _config.endpoint);
        _backend->SetReplyCallback([](const ptt::BackendReply& reply) {
            std::cout << "[" << ptt::ToString(reply.type) << "] Transcript: " << reply.transcript << std::endl;
            if (!reply.response.empty()) {
                std::cout << "[" << ptt::ToString(reply.type) << "] Response  : " << reply.response << std::endl;
            }
        });
        _backend->SetReplyAudioCallback([](uint64_t requestId, const std::string& format,
                                           const std::vector<uint8_t>& audio) {
            std::cout << "Reply audio for request " << requestId << ": "
                      << audio.size() << " bytes (" << format << ")" << std::endl;
        });

        if (!_backend->Connect()) {
            std::cerr << "Backend " << _config.backendUrl
                      << " not reachable; captures will be dropped until it is" << std::endl;
        }

        ptt::IClipSender* sender = _backend.get();
        if (!_config.dumpWavPath.empty()) {
            _dumper = std::make_unique<DumpingSender>(*_backend, _config.dumpWavPath);
            sender = _dumper.get();
        }

        _controller = std::make_unique<ptt::CaptureController>(
            _config.capture, _input, *_recorder, *sender, _scheduler, _clock, _diagnostics);
        _controller->SetStateCallback([](ptt::CaptureController::State state) {
            std::cout << "[STATE] " << ptt::ToString(state) << std::endl;
        });

        _input.SetCommandCallback([this](const std::string& command) {
            ProcessCommand(command);
        });

        PrintHelp();
        _input.Start();

        const auto tick = std::chrono::milliseconds(_config.tickMilliseconds);
        while (!_input.QuitRequested()) {
            _scheduler.RunDue();
            _controller->Poll();
            std::this_thread::sleep_for(tick);
        }

        _controller.reset();
        _backend->Disconnect();
        return true;
    }

private:
    // Runs on the console reader thread; only touches the backend client.
    void ProcessCommand(const std::string& command) {
        if (command == "help") {
            PrintHelp();
        } else if (command == "connect") {
            _backend->Connect();
        } else if (command.rfind("ask ", 0) == 0) {
            _backend->Ask(command.substr(4));
        } else {
            std::cout << "Unknown command: " << command << std::endl;
            PrintHelp();
        }
    }

    void PrintHelp() {
        std::cout << "\n=== Push To Talk ===" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  down      - Hold the talk button" << std::endl;
        std::cout << "  up        - Release it and send" << std::endl;
        std::cout << "  toggle    - Flip the button state" << std::endl;
        std::cout << "  detach    - Simulate controller unplug" << std::endl;
        std::cout << "  attach    - Simulate controller plug-in" << std::endl;
        std::cout << "  ask TEXT  - Send a text prompt" << std::endl;
        std::cout << "  connect   - Reconnect to the backend" << std::endl;
        std::cout << "  help      - Show this help" << std::endl;
        std::cout << "  quit      - Exit application" << std::endl;
        std::cout << "Hold limit " << _config.capture.maxDurationSeconds
                  << "s, taps under " << _config.capture.minValidDurationSeconds
                  << "s are ignored" << std::endl;
        std::cout << "====================\n" << std::endl;
    }

    ptt::AppConfig _config;
    ptt::SteadyClock _clock;
    ptt::ConsoleInputSource _input;
    ptt::TickScheduler _scheduler;
    ptt::ConsoleDiagnostics _diagnostics;
    std::unique_ptr<ptt::AudioRecorder> _recorder;
    std::unique_ptr<ptt::BackendClient> _backend;
    std::unique_ptr<DumpingSender> _dumper;
    std::unique_ptr<ptt::CaptureController> _controller;
};

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [config.json] [--backend URL] [--list-devices]" << std::endl;
    std::cout << "Example: " << program << " ptt.json --backend ws://localhost:8000/ws" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string backendOverride;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--list-devices") {
            ptt::AudioRecorder::ListDevices();
            return 0;
        } else if (arg == "--backend" && i + 1 < argc) {
            backendOverride = argv[++i];
        } else if (configPath.empty() && arg.rfind("--", 0) != 0) {
            configPath = arg;
        } else {
            PrintUsage(argv[0]);
            return 1;
        }
    }

    ptt::AppConfig config;
    try {
        if (!configPath.empty()) {
            config = ptt::LoadConfigFile(configPath);
        }
    } catch (const ptt::ConfigException& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    if (!backendOverride.empty()) {
        config.backendUrl = backendOverride;
    }

    PushToTalkApplication app(config);
    return app.Run() ? 0 : 1;
}
