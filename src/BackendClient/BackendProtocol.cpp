#include "BackendProtocol.hpp"

namespace push_to_talk {

namespace {

std::string StringField(const nlohmann::json& message, const char* key) {
    auto it = message.find(key);
    if (it == message.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

const char* ToString(RequestType type) {
    switch (type) {
        case RequestType::ChatWithAudio: return "chat-with-audio";
        case RequestType::Transcribe: return "transcribe";
        case RequestType::Ask: return "ask";
    }
    return "unknown";
}

bool ParseRequestType(const std::string& text, RequestType& type) {
    if (text == "chat-with-audio") {
        type = RequestType::ChatWithAudio;
    } else if (text == "transcribe") {
        type = RequestType::Transcribe;
    } else if (text == "ask") {
        type = RequestType::Ask;
    } else {
        return false;
    }
    return true;
}

nlohmann::json BuildClipRequest(RequestType type, uint64_t requestId,
                                const AudioClip& clip, size_t wavBytes) {
    if (type == RequestType::Ask) {
        throw ProtocolException("ask requests carry a prompt, not audio");
    }
    return {
        {"type", ToString(type)},
        {"request_id", requestId},
        {"format", "wav"},
        {"sample_rate", clip.sampleRate},
        {"channels", clip.channels},
        {"samples", clip.FrameCount()},
        {"bytes", wavBytes}
    };
}

nlohmann::json BuildAskRequest(uint64_t requestId, const std::string& prompt) {
    return {
        {"type", ToString(RequestType::Ask)},
        {"request_id", requestId},
        {"prompt", prompt}
    };
}

BackendMessage ParseBackendMessage(const std::string& payload) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolException(std::string("invalid JSON from backend: ") + e.what());
    }

    if (!message.is_object()) {
        throw ProtocolException("backend message is not an object");
    }

    const std::string type = StringField(message, "type");
    uint64_t requestId = 0;
    auto idIt = message.find("request_id");
    if (idIt != message.end() && idIt->is_number_unsigned()) {
        requestId = idIt->get<uint64_t>();
    }

    if (type == "error") {
        BackendError error;
        error.requestId = requestId;
        error.message = StringField(message, "message");
        if (error.message.empty()) {
            error.message = "backend reported an error";
        }
        return error;
    }

    BackendReply reply;
    if (!ParseRequestType(type, reply.type)) {
        throw ProtocolException("unknown backend message type '" + type + "'");
    }
    reply.requestId = requestId;
    reply.transcript = StringField(message, "transcript");
    reply.response = StringField(message, "response");
    reply.audioFormat = StringField(message, "audio_format");
    return reply;
}

} // namespace push_to_talk
