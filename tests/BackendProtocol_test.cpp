#include "BackendClient/BackendProtocol.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>

using namespace push_to_talk;

TEST(BackendProtocolTest, ClipRequestDescribesPayload) {
    AudioClip clip;
    clip.sampleRate = 44100;
    clip.channels = 1;
    clip.samples.resize(11025);

    nlohmann::json request = BuildClipRequest(RequestType::ChatWithAudio, 7, clip, 22094);

    EXPECT_EQ(request["type"], "chat-with-audio");
    EXPECT_EQ(request["request_id"], 7);
    EXPECT_EQ(request["format"], "wav");
    EXPECT_EQ(request["sample_rate"], 44100);
    EXPECT_EQ(request["channels"], 1);
    EXPECT_EQ(request["samples"], 11025);
    EXPECT_EQ(request["bytes"], 22094);
}

TEST(BackendProtocolTest, AskCannotCarryAudio) {
    AudioClip clip;
    clip.sampleRate = 16000;
    clip.samples.resize(10);
    EXPECT_THROW(BuildClipRequest(RequestType::Ask, 1, clip, 64), ProtocolException);
}

TEST(BackendProtocolTest, AskRequestCarriesPrompt) {
    nlohmann::json request = BuildAskRequest(3, "what is this statue?");

    EXPECT_EQ(request["type"], "ask");
    EXPECT_EQ(request["request_id"], 3);
    EXPECT_EQ(request["prompt"], "what is this statue?");
}

TEST(BackendProtocolTest, ParsesChatReply) {
    BackendMessage message = ParseBackendMessage(
        R"({"type":"chat-with-audio","request_id":5,"transcript":"hello","response":"hi there","audio_format":"mp3"})");

    ASSERT_TRUE(std::holds_alternative<BackendReply>(message));
    const BackendReply& reply = std::get<BackendReply>(message);
    EXPECT_EQ(reply.requestId, 5u);
    EXPECT_EQ(reply.type, RequestType::ChatWithAudio);
    EXPECT_EQ(reply.transcript, "hello");
    EXPECT_EQ(reply.response, "hi there");
    EXPECT_EQ(reply.audioFormat, "mp3");
}

TEST(BackendProtocolTest, MissingFieldsBecomeEmpty) {
    BackendMessage message = ParseBackendMessage(R"({"type":"transcribe","transcript":null})");

    ASSERT_TRUE(std::holds_alternative<BackendReply>(message));
    const BackendReply& reply = std::get<BackendReply>(message);
    EXPECT_EQ(reply.requestId, 0u);
    EXPECT_EQ(reply.type, RequestType::Transcribe);
    EXPECT_TRUE(reply.transcript.empty());
    EXPECT_TRUE(reply.response.empty());
    EXPECT_TRUE(reply.audioFormat.empty());
}

TEST(BackendProtocolTest, ParsesError) {
    BackendMessage message = ParseBackendMessage(R"({"type":"error","request_id":9,"message":"model offline"})");

    ASSERT_TRUE(std::holds_alternative<BackendError>(message));
    EXPECT_EQ(std::get<BackendError>(message).requestId, 9u);
    EXPECT_EQ(std::get<BackendError>(message).message, "model offline");

    BackendMessage bare = ParseBackendMessage(R"({"type":"error"})");
    ASSERT_TRUE(std::holds_alternative<BackendError>(bare));
    EXPECT_FALSE(std::get<BackendError>(bare).message.empty());
}

TEST(BackendProtocolTest, RejectsMalformedMessages) {
    EXPECT_THROW(ParseBackendMessage("{oops"), ProtocolException);
    EXPECT_THROW(ParseBackendMessage("[1,2]"), ProtocolException);
    EXPECT_THROW(ParseBackendMessage(R"({"type":"weather"})"), ProtocolException);
    EXPECT_THROW(ParseBackendMessage(R"({"transcript":"no type"})"), ProtocolException);
}

TEST(BackendProtocolTest, RequestTypeNames) {
    RequestType type = RequestType::Ask;
    EXPECT_TRUE(ParseRequestType("transcribe", type));
    EXPECT_EQ(type, RequestType::Transcribe);
    EXPECT_FALSE(ParseRequestType("Transcribe", type));
    EXPECT_EQ(type, RequestType::Transcribe);
    EXPECT_STREQ(ToString(RequestType::ChatWithAudio), "chat-with-audio");
}
