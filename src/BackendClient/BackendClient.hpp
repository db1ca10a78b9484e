#pragma once

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "BackendProtocol.hpp"
#include "../CaptureController/IClipSender.hpp"

namespace push_to_talk {

// Talks to the speech/LLM backend over a WebSocket. Requests are
// fire-and-forget; results arrive on the connection's network thread
// through the callbacks.
class BackendClient : public IClipSender {
public:
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;
    using ReplyCallback = std::function<void(const BackendReply&)>;
    using ReplyAudioCallback = std::function<void(uint64_t requestId, const std::string& format,
                                                  const std::vector<uint8_t>& audio)>;
    using ErrorCallback = std::function<void(uint64_t requestId, const std::string& message)>;

    explicit BackendClient(const std::string& server_url,
                           RequestType defaultEndpoint = RequestType::ChatWithAudio);
    ~BackendClient() override;

    BackendClient(const BackendClient&) = delete;
    BackendClient& operator=(const BackendClient&) = delete;

    // Waits up to a few seconds for the handshake. While an earlier attempt
    // is still pending it returns false without opening another connection.
    bool Connect();
    void Disconnect();
    bool IsConnected() const { return _connected; }

    // Sends to the default endpoint
    void Submit(AudioClip&& clip) override;

    // Each returns the request id, or 0 if nothing was sent
    uint64_t ChatWithAudio(AudioClip clip);
    uint64_t Transcribe(AudioClip clip);
    uint64_t Ask(const std::string& prompt);

    void SetReplyCallback(ReplyCallback callback);
    void SetReplyAudioCallback(ReplyAudioCallback callback);
    void SetErrorCallback(ErrorCallback callback);

private:
    uint64_t SendClip(RequestType type, AudioClip clip);
    bool SendText(const std::string& payload);
    bool SendBinary(const std::vector<uint8_t>& payload);
    void ReportError(uint64_t requestId, const std::string& message);

    void OnMessage(websocketpp::connection_hdl hdl, WsClient::message_ptr msg);
    void OnTextMessage(const std::string& payload);
    void OnBinaryMessage(const std::string& payload);
    void OnOpen(websocketpp::connection_hdl hdl);
    void OnClose(websocketpp::connection_hdl hdl);
    void OnFail(websocketpp::connection_hdl hdl);

    WsClient _endpoint;
    websocketpp::connection_hdl _hdl;
    std::string _server_url;
    RequestType _default_endpoint;
    std::unique_ptr<std::thread> _thread;
    std::atomic<bool> _connected;
    std::atomic<bool> _connect_pending;
    std::atomic<uint64_t> _next_request_id;

    // Guards the callbacks and the pending reply-audio bookkeeping
    std::mutex _mutex;
    ReplyCallback _reply_callback;
    ReplyAudioCallback _reply_audio_callback;
    ErrorCallback _error_callback;
    uint64_t _awaiting_audio_for;
    std::string _awaiting_audio_format;
};

} // namespace push_to_talk
