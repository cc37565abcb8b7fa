#include <phind/paths.hpp>
#include <cstdlib>
#include <filesystem>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#include <vector>
#endif

namespace fs = std::filesystem;

namespace phind {

std::optional<std::string> SystemEnvironment::get(const std::string& name) const {
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

std::string SystemEnvironment::home_dir() const {
#ifdef _WIN32
    if (auto p = get("USERPROFILE"); p && !p->empty()) return *p;
    return "";
#else
    if (auto h = get("HOME"); h && !h->empty()) return *h;

    long bufsize = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(bufsize > 0 ? static_cast<size_t>(bufsize) : 16384);
    struct passwd pw;
    struct passwd* result = nullptr;
    if (getpwuid_r(getuid(), &pw, buf.data(), buf.size(), &result) == 0 && result) {
        return result->pw_dir;
    }
    return "";
#endif
}

Platform SystemEnvironment::platform() const {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Other;
#endif
}

static std::string config_dir(const Environment& env) {
    if (auto xdg = env.get("XDG_CONFIG_HOME"); xdg && !xdg->empty()) {
        return *xdg;
    }
    if (env.platform() == Platform::Windows) {
        if (auto appdata = env.get("APPDATA"); appdata && !appdata->empty()) {
            return *appdata;
        }
    }
    return (fs::path(env.home_dir()) / ".config").string();
}

std::string global_ignore_path(const Environment& env) {
    return (fs::path(config_dir(env)) / "phind" / "ignore").string();
}

std::string global_config_path(const Environment& env) {
    return (fs::path(config_dir(env)) / "phind" / "config.toml").string();
}

} // namespace phind
