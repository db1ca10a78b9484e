#include "BackendClient.hpp"
#include "../SavingWorkers/WavWorker.hpp"
#include "../common/debug_log.hpp"

#include <chrono>
#include <iostream>
#include <utility>

using websocketpp::lib::placeholders::_1;
using websocketpp::lib::placeholders::_2;
using websocketpp::lib::bind;

namespace push_to_talk {

namespace {

constexpr auto kConnectTimeout = std::chrono::seconds(3);

} // namespace

BackendClient::BackendClient(const std::string& server_url, RequestType defaultEndpoint)
    : _server_url(server_url)
    , _default_endpoint(defaultEndpoint)
    , _connected(false)
    , _connect_pending(false)
    , _next_request_id(1)
    , _awaiting_audio_for(0) {

    _endpoint.clear_access_channels(websocketpp::log::alevel::all);
    _endpoint.clear_error_channels(websocketpp::log::elevel::all);

    _endpoint.init_asio();
    _endpoint.start_perpetual();

    _endpoint.set_open_handler(bind(&BackendClient::OnOpen, this, ::_1));
    _endpoint.set_close_handler(bind(&BackendClient::OnClose, this, ::_1));
    _endpoint.set_fail_handler(bind(&BackendClient::OnFail, this, ::_1));
    _endpoint.set_message_handler(bind(&BackendClient::OnMessage, this, ::_1, ::_2));
}

BackendClient::~BackendClient() {
    Disconnect();
    _endpoint.stop_perpetual();
    if (_thread && _thread->joinable()) {
        _thread->join();
    }
}

bool BackendClient::Connect() {
    if (_connected) return true;
    if (_connect_pending.exchange(true)) {
        std::cerr << "Connection to " << _server_url << " still in progress" << std::endl;
        return false;
    }

    try {
        websocketpp::lib::error_code ec;
        WsClient::connection_ptr con = _endpoint.get_connection(_server_url, ec);
        if (ec) {
            std::cerr << "Could not create connection to " << _server_url << ": " << ec.message() << std::endl;
            _connect_pending = false;
            return false;
        }

        _endpoint.connect(con);

        if (!_thread) {
            _thread.reset(new std::thread([this]() {
                try {
                    _endpoint.run();
                } catch (const std::exception& e) {
                    std::cerr << "WebSocket run error: " << e.what() << std::endl;
                }
            }));
        }

        const auto deadline = std::chrono::steady_clock::now() + kConnectTimeout;
        while (_connect_pending && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        return _connected;
    } catch (const std::exception& e) {
        std::cerr << "Connection error: " << e.what() << std::endl;
        _connect_pending = false;
        return false;
    }
}

void BackendClient::Disconnect() {
    if (_connected) {
        websocketpp::lib::error_code ec;
        _endpoint.close(_hdl, websocketpp::close::status::normal, "", ec);
        if (ec) {
            std::cerr << "Error closing connection: " << ec.message() << std::endl;
        }
        _connected = false;
    }
}

void BackendClient::Submit(AudioClip&& clip) {
    SendClip(_default_endpoint, std::move(clip));
}

uint64_t BackendClient::ChatWithAudio(AudioClip clip) {
    return SendClip(RequestType::ChatWithAudio, std::move(clip));
}

uint64_t BackendClient::Transcribe(AudioClip clip) {
    return SendClip(RequestType::Transcribe, std::move(clip));
}

uint64_t BackendClient::Ask(const std::string& prompt) {
    if (!_connected) {
        ReportError(0, "Not connected to backend");
        return 0;
    }

    const uint64_t requestId = _next_request_id++;
    if (!SendText(BuildAskRequest(requestId, prompt).dump())) {
        ReportError(requestId, "Failed to send ask request");
        return 0;
    }
    return requestId;
}

uint64_t BackendClient::SendClip(RequestType type, AudioClip clip) {
    if (!_connected) {
        ReportError(0, "Not connected to backend");
        return 0;
    }
    if (clip.samples.empty()) {
        ReportError(0, "Refusing to send an empty clip");
        return 0;
    }

    std::vector<uint8_t> wav;
    try {
        WavWorker worker;
        worker.SetClip(clip);
        wav = worker.Encode();
    } catch (const SavingWorkerException& e) {
        ReportError(0, std::string("Cannot package clip: ") + e.what());
        return 0;
    }
    if (wav.empty()) {
        ReportError(0, "WAV encoding produced no data");
        return 0;
    }

    const uint64_t requestId = _next_request_id++;
    const nlohmann::json header = BuildClipRequest(type, requestId, clip, wav.size());

    if (!SendText(header.dump()) || !SendBinary(wav)) {
        ReportError(requestId, std::string("Failed to send ") + ToString(type) + " request");
        return 0;
    }

    PTT_DEBUG_LOG("Sent " << ToString(type) << " request " << requestId << ": "
                  << clip.FrameCount() << " frames, " << wav.size() << " bytes" << PTT_DEBUG_LOG_ENDL);
    return requestId;
}

bool BackendClient::SendText(const std::string& payload) {
    websocketpp::lib::error_code ec;
    _endpoint.send(_hdl, payload, websocketpp::frame::opcode::text, ec);
    if (ec) {
        std::cerr << "Error sending message: " << ec.message() << std::endl;
        return false;
    }
    return true;
}

bool BackendClient::SendBinary(const std::vector<uint8_t>& payload) {
    websocketpp::lib::error_code ec;
    _endpoint.send(_hdl, payload.data(), payload.size(), websocketpp::frame::opcode::binary, ec);
    if (ec) {
        std::cerr << "Error sending audio: " << ec.message() << std::endl;
        return false;
    }
    return true;
}

void BackendClient::SetReplyCallback(ReplyCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _reply_callback = std::move(callback);
}

void BackendClient::SetReplyAudioCallback(ReplyAudioCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _reply_audio_callback = std::move(callback);
}

void BackendClient::SetErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _error_callback = std::move(callback);
}

void BackendClient::ReportError(uint64_t requestId, const std::string& message) {
    std::cerr << "Backend error";
    if (requestId != 0) std::cerr << " (request " << requestId << ")";
    std::cerr << ": " << message << std::endl;

    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _error_callback;
    }
    if (callback) {
        callback(requestId, message);
    }
}

void BackendClient::OnOpen(websocketpp::connection_hdl hdl) {
    _hdl = hdl;
    _connected = true;
    _connect_pending = false;
    std::cout << "Connected to backend " << _server_url << std::endl;
}

void BackendClient::OnClose(websocketpp::connection_hdl hdl) {
    _connected = false;
    _connect_pending = false;
    std::cout << "Disconnected from backend" << std::endl;
}

void BackendClient::OnFail(websocketpp::connection_hdl hdl) {
    _connected = false;
    _connect_pending = false;
    std::cerr << "Connection to backend failed" << std::endl;
}

void BackendClient::OnMessage(websocketpp::connection_hdl hdl, WsClient::message_ptr msg) {
    if (msg->get_opcode() == websocketpp::frame::opcode::binary) {
        OnBinaryMessage(msg->get_payload());
    } else {
        OnTextMessage(msg->get_payload());
    }
}

void BackendClient::OnTextMessage(const std::string& payload) {
    BackendMessage message;
    try {
        message = ParseBackendMessage(payload);
    } catch (const ProtocolException& e) {
        ReportError(0, e.what());
        return;
    }

    if (const BackendError* error = std::get_if<BackendError>(&message)) {
        ReportError(error->requestId, error->message);
        return;
    }

    const BackendReply& reply = std::get<BackendReply>(message);
    ReplyCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!reply.audioFormat.empty()) {
            _awaiting_audio_for = reply.requestId;
            _awaiting_audio_format = reply.audioFormat;
        }
        callback = _reply_callback;
    }
    if (callback) {
        callback(reply);
    }
}

void BackendClient::OnBinaryMessage(const std::string& payload) {
    uint64_t requestId = 0;
    std::string format;
    ReplyAudioCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        requestId = _awaiting_audio_for;
        format = std::move(_awaiting_audio_format);
        _awaiting_audio_for = 0;
        _awaiting_audio_format.clear();
        callback = _reply_audio_callback;
    }

    if (requestId == 0) {
        std::cerr << "Ignoring unexpected binary frame (" << payload.size() << " bytes)" << std::endl;
        return;
    }

    PTT_DEBUG_LOG("Reply audio for request " << requestId << ": "
                  << payload.size() << " bytes of " << format << PTT_DEBUG_LOG_ENDL);
    if (callback) {
        std::vector<uint8_t> audio(payload.begin(), payload.end());
        callback(requestId, format, audio);
    }
}

} // namespace push_to_talk
