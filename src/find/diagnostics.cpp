#include <phind/diagnostics.hpp>
#include <phind/log.hpp>

namespace phind {

void LogDiagnostics::warn(const std::string& message) {
    log::warn("%s", message.c_str());
}

void LogDiagnostics::error(const std::string& path, const std::string& message) {
    log::error("%s: %s", path.c_str(), message.c_str());
}

} // namespace phind
