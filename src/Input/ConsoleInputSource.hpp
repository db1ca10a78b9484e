#pragma once

#include <atomic>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "IInputSource.hpp"

namespace push_to_talk {

// Button state driven by text lines:
//   down | press      hold the button
//   up | release      let it go
//   toggle            flip the current state
//   detach | attach   simulate unplugging / plugging the controller
//   quit | exit       stop the application
// Any other non-empty line goes to the command callback. The source is
// unavailable once the reader stops.
//
// The stream must outlive the reader thread. Destroying the source while the
// reader is blocked leaves the thread running on its own state until the
// next line arrives; the command callback is never invoked after that.
class ConsoleInputSource : public IInputSource {
public:
    using CommandCallback = std::function<void(const std::string&)>;

    explicit ConsoleInputSource(std::istream& in);
    ~ConsoleInputSource() override;

    void Start();
    // Blocks until the reader reaches the end of the stream or "quit"
    void WaitUntilFinished();

    bool IsAvailable() const override { return _state->attached.load(); }
    bool TryGetPressed(bool& pressed) const override;

    bool QuitRequested() const { return _state->quit.load(); }

    void SetCommandCallback(CommandCallback callback);

    // Returns false for lines that are not button/device commands
    bool HandleLine(const std::string& line);

private:
    // Owned jointly by the source and its reader thread
    struct SharedState {
        std::atomic<bool> pressed{false};
        std::atomic<bool> attached{true};
        std::atomic<bool> quit{false};
        std::mutex callbackMutex;
        CommandCallback commandCallback;
    };

    static bool ApplyCommand(SharedState& state, const std::string& line);
    static void ReadLoop(std::istream& in, std::shared_ptr<SharedState> state);

    std::istream& _in;
    std::shared_ptr<SharedState> _state;
    std::unique_ptr<std::thread> _thread;
};

} // namespace push_to_talk
