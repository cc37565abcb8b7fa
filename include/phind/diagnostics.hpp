#pragma once

#include <string>

namespace phind {

// Receives non-fatal problems from the pattern resolver and the walker.
// Nothing in the core writes to the terminal directly.
class Diagnostics {
public:
    virtual ~Diagnostics() = default;

    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& path, const std::string& message) = 0;
};

// Forwards to phind::log.
class LogDiagnostics : public Diagnostics {
public:
    void warn(const std::string& message) override;
    void error(const std::string& path, const std::string& message) override;
};

} // namespace phind
