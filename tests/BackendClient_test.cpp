#include "BackendClient/BackendClient.hpp"

#include <boost/asio.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace push_to_talk;

namespace {

// Nothing listens here, connections are refused straight away
const char* kUnreachableUrl = "ws://127.0.0.1:1/ws";

AudioClip OneSecondClip() {
    AudioClip clip;
    clip.sampleRate = 16000;
    clip.channels = 1;
    clip.samples.assign(16000, 100);
    return clip;
}

struct ErrorLog {
    std::vector<uint64_t> ids;
    std::vector<std::string> messages;
};

} // namespace

TEST(BackendClientTest, StartsDisconnected) {
    BackendClient client(kUnreachableUrl);
    EXPECT_FALSE(client.IsConnected());
}

TEST(BackendClientTest, SubmitWhileDisconnectedReportsError) {
    BackendClient client(kUnreachableUrl, RequestType::Transcribe);
    ErrorLog log;
    client.SetErrorCallback([&log](uint64_t id, const std::string& message) {
        log.ids.push_back(id);
        log.messages.push_back(message);
    });

    client.Submit(OneSecondClip());

    ASSERT_EQ(log.messages.size(), 1u);
    EXPECT_EQ(log.ids[0], 0u);
    EXPECT_NE(log.messages[0].find("Not connected"), std::string::npos);
}

TEST(BackendClientTest, RequestsWhileDisconnectedReturnNoId) {
    BackendClient client(kUnreachableUrl);
    int errors = 0;
    client.SetErrorCallback([&errors](uint64_t, const std::string&) { ++errors; });

    EXPECT_EQ(client.ChatWithAudio(OneSecondClip()), 0u);
    EXPECT_EQ(client.Transcribe(OneSecondClip()), 0u);
    EXPECT_EQ(client.Ask("hello"), 0u);
    EXPECT_EQ(errors, 3);
}

TEST(BackendClientTest, ConnectToClosedPortFails) {
    BackendClient client(kUnreachableUrl);
    EXPECT_FALSE(client.Connect());
    EXPECT_FALSE(client.IsConnected());

    client.Disconnect();
    EXPECT_FALSE(client.IsConnected());
}

TEST(BackendClientTest, MalformedUrlFailsWithoutThrowing) {
    BackendClient client("not a url");
    EXPECT_FALSE(client.Connect());
}

TEST(BackendClientTest, ConnectWhileHandshakePendingDoesNotOpenSecondSocket) {
    // Accepts TCP connections but never answers the WebSocket handshake
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor(
        io, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    acceptor.non_blocking(true);
    const std::string url = "ws://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) + "/ws";

    BackendClient client(url);
    EXPECT_FALSE(client.Connect());  // gives up waiting, handshake still open

    const auto before = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.Connect());
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::milliseconds(500));
    EXPECT_FALSE(client.IsConnected());

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    std::vector<std::unique_ptr<boost::asio::ip::tcp::socket>> accepted;
    while (true) {
        auto socket = std::make_unique<boost::asio::ip::tcp::socket>(io);
        boost::system::error_code ec;
        acceptor.accept(*socket, ec);
        if (ec) break;
        accepted.push_back(std::move(socket));
    }
    EXPECT_EQ(accepted.size(), 1u);
}
