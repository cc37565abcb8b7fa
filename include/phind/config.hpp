#pragma once

#include <phind/log.hpp>
#include <phind/result.hpp>
#include <phind/walker.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace phind {

// Settings from config.toml. Unset fields leave the built-in behavior
// (or a lower layer) in place.
//
//   [search]
//   ignore-case = true
//   relative = true
//   max-depth = 4
//   type = "f"
//   name = ["*.cpp", "*.hpp"]
//   exclude = ["build"]
//   global-ignore = false
//
//   [log]
//   level = "debug"
struct Config {
    std::optional<bool> ignore_case;
    std::optional<bool> relative;
    std::optional<bool> global_ignore;
    std::optional<std::size_t> max_depth;
    std::optional<MatchType> type;
    std::optional<std::vector<std::string>> include;
    std::vector<std::string> exclude;
    std::optional<log::Level> log_level;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // other's explicitly-set fields win; excludes accumulate.
    void merge(const Config& other);
};

} // namespace phind
