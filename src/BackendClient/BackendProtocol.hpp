#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

#include "../AudioRecorder/AudioClip.hpp"

namespace push_to_talk {

// Message framing spoken with the speech backend over the WebSocket:
// a JSON text frame per request, followed by one binary frame with the
// WAV payload for clip requests. Replies mirror that layout, with an
// optional binary frame of reply audio after a chat-with-audio reply.
enum class RequestType {
    ChatWithAudio,
    Transcribe,
    Ask
};

const char* ToString(RequestType type);
bool ParseRequestType(const std::string& text, RequestType& type);

class ProtocolException : public std::runtime_error {
public:
    explicit ProtocolException(const std::string& message)
        : std::runtime_error(message) {}
};

struct BackendReply {
    uint64_t requestId = 0;
    RequestType type = RequestType::ChatWithAudio;
    std::string transcript;
    std::string response;
    // Non-empty when a binary frame with reply audio follows
    std::string audioFormat;
};

struct BackendError {
    uint64_t requestId = 0;
    std::string message;
};

using BackendMessage = std::variant<BackendReply, BackendError>;

nlohmann::json BuildClipRequest(RequestType type, uint64_t requestId,
                                const AudioClip& clip, size_t wavBytes);
nlohmann::json BuildAskRequest(uint64_t requestId, const std::string& prompt);

// Throws ProtocolException on malformed JSON or an unknown message type
BackendMessage ParseBackendMessage(const std::string& payload);

} // namespace push_to_talk
