#include "Input/ConsoleInputSource.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <sstream>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

using namespace push_to_talk;

namespace {

// Stream buffer that blocks readers like a quiet terminal until lines are fed
class BlockingStreamBuf : public std::streambuf {
public:
    void Feed(const std::string& text, bool thenClose) {
        std::lock_guard<std::mutex> lock(_mutex);
        _pending += text;
        _closed = thenClose;
        _cv.notify_all();
    }

    bool Drained() const { return _drained.load(); }

protected:
    int_type underflow() override {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [this]() { return !_pending.empty() || _closed; });
        if (_pending.empty()) {
            _drained = true;
            return traits_type::eof();
        }
        _current.swap(_pending);
        _pending.clear();
        setg(&_current[0], &_current[0], &_current[0] + _current.size());
        return traits_type::to_int_type(_current[0]);
    }

private:
    std::mutex _mutex;
    std::condition_variable _cv;
    std::string _pending;
    std::string _current;
    bool _closed = false;
    std::atomic<bool> _drained{false};
};

} // namespace

TEST(ConsoleInputSourceTest, ButtonCommands) {
    std::istringstream in;
    ConsoleInputSource input(in);
    bool pressed = true;

    ASSERT_TRUE(input.TryGetPressed(pressed));
    EXPECT_FALSE(pressed);

    EXPECT_TRUE(input.HandleLine("down"));
    input.TryGetPressed(pressed);
    EXPECT_TRUE(pressed);

    EXPECT_TRUE(input.HandleLine("  release \r"));
    input.TryGetPressed(pressed);
    EXPECT_FALSE(pressed);

    EXPECT_TRUE(input.HandleLine("toggle"));
    input.TryGetPressed(pressed);
    EXPECT_TRUE(pressed);
    EXPECT_TRUE(input.HandleLine("toggle"));
    input.TryGetPressed(pressed);
    EXPECT_FALSE(pressed);
}

TEST(ConsoleInputSourceTest, DetachAndAttach) {
    std::istringstream in;
    ConsoleInputSource input(in);
    EXPECT_TRUE(input.IsAvailable());

    EXPECT_TRUE(input.HandleLine("detach"));
    EXPECT_FALSE(input.IsAvailable());
    EXPECT_TRUE(input.HandleLine("attach"));
    EXPECT_TRUE(input.IsAvailable());
}

TEST(ConsoleInputSourceTest, OtherLinesAreNotButtonCommands) {
    std::istringstream in;
    ConsoleInputSource input(in);

    EXPECT_FALSE(input.HandleLine("ask what is this?"));
    EXPECT_FALSE(input.HandleLine(""));
    EXPECT_FALSE(input.QuitRequested());

    EXPECT_TRUE(input.HandleLine("quit"));
    EXPECT_TRUE(input.QuitRequested());
}

TEST(ConsoleInputSourceTest, ReaderForwardsCommandsAndStopsAtEnd) {
    std::istringstream in("down\nask hello there\n\nhelp\nup\n");
    ConsoleInputSource input(in);
    std::vector<std::string> commands;
    input.SetCommandCallback([&commands](const std::string& c) { commands.push_back(c); });

    input.Start();
    input.WaitUntilFinished();

    const std::vector<std::string> expected = {"ask hello there", "help"};
    EXPECT_EQ(commands, expected);
    EXPECT_TRUE(input.QuitRequested());
    EXPECT_FALSE(input.IsAvailable());

    bool pressed = true;
    input.TryGetPressed(pressed);
    EXPECT_FALSE(pressed);
}

TEST(ConsoleInputSourceTest, ReaderStopsAtQuit) {
    std::istringstream in("down\nexit\nask never read\n");
    ConsoleInputSource input(in);
    std::vector<std::string> commands;
    input.SetCommandCallback([&commands](const std::string& c) { commands.push_back(c); });

    input.Start();
    input.WaitUntilFinished();

    EXPECT_TRUE(commands.empty());
    EXPECT_TRUE(input.QuitRequested());
    bool pressed = false;
    input.TryGetPressed(pressed);
    EXPECT_TRUE(pressed);
}

TEST(ConsoleInputSourceTest, DestroyedWhileReaderBlockedDoesNotCallBack) {
    BlockingStreamBuf buffer;
    std::istream in(&buffer);
    std::atomic<int> calls{0};

    auto input = std::make_unique<ConsoleInputSource>(in);
    input->SetCommandCallback([&calls](const std::string&) { ++calls; });
    input->Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    input.reset();
    buffer.Feed("down\nask after shutdown\n", true);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!buffer.Drained() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(buffer.Drained());
    // Let the reader run its last statements on the shared state
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_EQ(calls.load(), 0);
}

TEST(ConsoleInputSourceTest, ReaderBlockedOnQuietStreamKeepsWorking) {
    BlockingStreamBuf buffer;
    std::istream in(&buffer);
    ConsoleInputSource input(in);
    std::vector<std::string> commands;
    input.SetCommandCallback([&commands](const std::string& c) { commands.push_back(c); });

    input.Start();
    buffer.Feed("down\nhelp\n", false);
    buffer.Feed("", true);
    input.WaitUntilFinished();

    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], "help");
    EXPECT_TRUE(input.QuitRequested());
    EXPECT_FALSE(input.IsAvailable());
}
