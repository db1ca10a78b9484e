#include "Diagnostics.hpp"
#include "debug_log.hpp"

#include <iostream>
#include <utility>

namespace push_to_talk {

ConsoleDiagnostics::ConsoleDiagnostics(std::string tag)
    : _tag(std::move(tag)) {
}

void ConsoleDiagnostics::Info(const std::string& message) {
    PTT_DEBUG_LOG("[INFO] [" << _tag << "] " << message << PTT_DEBUG_LOG_ENDL);
}

void ConsoleDiagnostics::Warning(const std::string& message) {
    std::cerr << "[WARN] [" << _tag << "] " << message << std::endl;
}

void ConsoleDiagnostics::Error(const std::string& message) {
    std::cerr << "[ERROR] [" << _tag << "] " << message << std::endl;
}

} // namespace push_to_talk
