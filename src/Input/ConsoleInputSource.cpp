#include "ConsoleInputSource.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <utility>

namespace push_to_talk {

namespace {

std::string Trim(const std::string& text) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(text.begin(), text.end(), notSpace);
    auto end = std::find_if(text.rbegin(), text.rend(), notSpace).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

} // namespace

ConsoleInputSource::ConsoleInputSource(std::istream& in)
    : _in(in)
    , _state(std::make_shared<SharedState>()) {
}

ConsoleInputSource::~ConsoleInputSource() {
    if (!_thread || !_thread->joinable()) {
        return;
    }
    if (_state->quit) {
        _thread->join();
        return;
    }

    // std::getline cannot be interrupted. The reader keeps its own reference
    // to the state, so only the callback into the owner has to go.
    {
        std::lock_guard<std::mutex> lock(_state->callbackMutex);
        _state->commandCallback = nullptr;
    }
    _thread->detach();
}

void ConsoleInputSource::Start() {
    if (_thread) return;
    _thread = std::make_unique<std::thread>(&ConsoleInputSource::ReadLoop, std::ref(_in), _state);
}

void ConsoleInputSource::WaitUntilFinished() {
    if (_thread && _thread->joinable()) {
        _thread->join();
    }
}

void ConsoleInputSource::SetCommandCallback(CommandCallback callback) {
    std::lock_guard<std::mutex> lock(_state->callbackMutex);
    _state->commandCallback = std::move(callback);
}

bool ConsoleInputSource::TryGetPressed(bool& pressed) const {
    pressed = _state->pressed.load();
    return true;
}

bool ConsoleInputSource::HandleLine(const std::string& line) {
    return ApplyCommand(*_state, line);
}

bool ConsoleInputSource::ApplyCommand(SharedState& state, const std::string& line) {
    const std::string command = Trim(line);

    if (command == "down" || command == "press") {
        state.pressed = true;
    } else if (command == "up" || command == "release") {
        state.pressed = false;
    } else if (command == "toggle") {
        state.pressed = !state.pressed.load();
    } else if (command == "detach") {
        state.attached = false;
        PTT_DEBUG_LOG("Controller detached" << PTT_DEBUG_LOG_ENDL);
    } else if (command == "attach") {
        state.attached = true;
        PTT_DEBUG_LOG("Controller attached" << PTT_DEBUG_LOG_ENDL);
    } else if (command == "quit" || command == "exit") {
        state.quit = true;
    } else {
        return false;
    }
    return true;
}

void ConsoleInputSource::ReadLoop(std::istream& in, std::shared_ptr<SharedState> state) {
    std::string line;
    while (!state->quit && std::getline(in, line)) {
        if (ApplyCommand(*state, line)) continue;

        const std::string command = Trim(line);
        if (command.empty()) continue;

        // Held across the call so the owner cannot drop the callback mid-command
        std::lock_guard<std::mutex> lock(state->callbackMutex);
        if (state->commandCallback) {
            state->commandCallback(command);
        }
    }
    state->attached = false;
    state->quit = true;
}

} // namespace push_to_talk
