#pragma once

#include <optional>
#include <string>

namespace phind {

enum class Platform { Linux, MacOS, Windows, Other };

// Process environment as seen by path resolution. Tests substitute a fake
// to exercise every platform branch without touching the real environment.
class Environment {
public:
    virtual ~Environment() = default;

    // Value of an environment variable, or nullopt if unset.
    virtual std::optional<std::string> get(const std::string& name) const = 0;
    virtual std::string home_dir() const = 0;
    virtual Platform platform() const = 0;
};

class SystemEnvironment : public Environment {
public:
    std::optional<std::string> get(const std::string& name) const override;
    std::string home_dir() const override;
    Platform platform() const override;
};

// Location of the per-user ignore file:
//   $XDG_CONFIG_HOME/phind/ignore             if XDG_CONFIG_HOME is non-empty
//   %APPDATA%/phind/ignore                    on Windows with APPDATA set
//   <home>/.config/phind/ignore               otherwise
// env.home_dir() is consulted only in the last case.
std::string global_ignore_path(const Environment& env);

// config.toml in the same directory as the ignore file.
std::string global_config_path(const Environment& env);

} // namespace phind
