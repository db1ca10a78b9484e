#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

#include "../BackendClient/BackendProtocol.hpp"

namespace push_to_talk {

class ConfigException : public std::runtime_error {
public:
    explicit ConfigException(const std::string& message)
        : std::runtime_error(message) {}
};

struct CaptureConfig {
    unsigned int sampleRate = 44100;
    unsigned int channels = 1;
    double maxDurationSeconds = 30.0;
    // Shorter presses are accidental taps
    double minValidDurationSeconds = 0.25;
};

struct AppConfig {
    CaptureConfig capture;
    std::string backendUrl = "ws://127.0.0.1:8000/ws";
    // chat-with-audio or transcribe
    RequestType endpoint = RequestType::ChatWithAudio;
    unsigned int tickMilliseconds = 16;
    std::string inputDevice;
    std::string dumpWavPath;
};

// Throws ConfigException
void ValidateCaptureConfig(const CaptureConfig& config);

// Missing keys keep their defaults; the result is validated.
AppConfig ParseConfig(const nlohmann::json& document);
AppConfig LoadConfigFile(const std::string& path);

} // namespace push_to_talk
