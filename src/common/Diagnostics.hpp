#pragma once

#include <string>

namespace push_to_talk {

// Leveled log sink for state transitions and discard events
class IDiagnostics {
public:
    virtual ~IDiagnostics() = default;

    virtual void Info(const std::string& message) = 0;
    virtual void Warning(const std::string& message) = 0;
    virtual void Error(const std::string& message) = 0;
};

// Info goes through PTT_DEBUG_LOG (silent in release builds),
// warnings and errors always reach std::cerr.
class ConsoleDiagnostics : public IDiagnostics {
public:
    explicit ConsoleDiagnostics(std::string tag);

    void Info(const std::string& message) override;
    void Warning(const std::string& message) override;
    void Error(const std::string& message) override;

private:
    std::string _tag;
};

} // namespace push_to_talk
