#include "AppConfig.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>

namespace push_to_talk {

namespace {

template <typename T>
void ReadField(const nlohmann::json& document, const char* key, T& target) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::type_error&) {
        throw ConfigException(std::string("config key '") + key + "' has the wrong type");
    }
}

void ReadUnsigned(const nlohmann::json& document, const char* key, unsigned int& target) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return;
    }
    // Integers built in code are signed even when non-negative
    if (!it->is_number_integer() || (!it->is_number_unsigned() && it->get<int64_t>() < 0)) {
        throw ConfigException(std::string("config key '") + key + "' must be a non-negative integer");
    }
    const uint64_t value = it->get<uint64_t>();
    if (value > std::numeric_limits<unsigned int>::max()) {
        throw ConfigException(std::string("config key '") + key + "' is out of range");
    }
    target = static_cast<unsigned int>(value);
}

} // namespace

void ValidateCaptureConfig(const CaptureConfig& config) {
    if (config.sampleRate == 0) {
        throw ConfigException("sample_rate must be positive");
    }
    if (config.channels == 0) {
        throw ConfigException("channels must be positive");
    }
    if (!std::isfinite(config.maxDurationSeconds) || config.maxDurationSeconds <= 0.0) {
        throw ConfigException("max_duration_seconds must be positive");
    }
    if (!std::isfinite(config.minValidDurationSeconds) || config.minValidDurationSeconds < 0.0) {
        throw ConfigException("min_valid_duration_seconds must not be negative");
    }
    if (config.minValidDurationSeconds >= config.maxDurationSeconds) {
        throw ConfigException("min_valid_duration_seconds must be below max_duration_seconds");
    }
}

AppConfig ParseConfig(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ConfigException("config root must be a JSON object");
    }

    AppConfig config;
    ReadUnsigned(document, "sample_rate", config.capture.sampleRate);
    ReadUnsigned(document, "channels", config.capture.channels);
    ReadField(document, "max_duration_seconds", config.capture.maxDurationSeconds);
    ReadField(document, "min_valid_duration_seconds", config.capture.minValidDurationSeconds);
    ReadField(document, "backend_url", config.backendUrl);
    ReadUnsigned(document, "tick_milliseconds", config.tickMilliseconds);
    ReadField(document, "input_device", config.inputDevice);
    ReadField(document, "dump_wav_path", config.dumpWavPath);

    std::string endpoint = ToString(config.endpoint);
    ReadField(document, "endpoint", endpoint);
    if (!ParseRequestType(endpoint, config.endpoint) || config.endpoint == RequestType::Ask) {
        throw ConfigException("endpoint must be 'chat-with-audio' or 'transcribe'");
    }

    if (config.backendUrl.empty()) {
        throw ConfigException("backend_url must not be empty");
    }
    if (config.tickMilliseconds == 0) {
        throw ConfigException("tick_milliseconds must be positive");
    }

    ValidateCaptureConfig(config.capture);
    return config;
}

AppConfig LoadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigException("cannot open config file " + path);
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigException("cannot parse " + path + ": " + e.what());
    }
    return ParseConfig(document);
}

} // namespace push_to_talk
