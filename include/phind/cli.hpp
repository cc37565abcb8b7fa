#pragma once

#include <phind/config.hpp>
#include <phind/paths.hpp>
#include <phind/result.hpp>
#include <phind/walker.hpp>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace phind {

struct CliOptions {
    std::string path = ".";
    std::optional<std::vector<std::string>> include;  // -n/--name
    std::vector<std::string> exclude;                 // -e/--exclude
    bool skip_global_ignore = false;
    std::optional<MatchType> type;
    std::optional<std::size_t> max_depth;
    bool ignore_case = false;
    bool relative = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;

    // Fold these options over a config file's settings.
    Config as_config() const;
};

// Parse argv. Unknown options, bad values and extra positionals are
// InvalidArg errors.
Result<CliOptions> parse_args(int argc, char** argv);

std::string usage(const std::string& ignore_path, const std::string& default_excludes);

// Run one invocation: load config and ignore files, walk, print matches
// to out. Returns the process exit status.
int run(const CliOptions& opts, const Environment& env,
        std::ostream& out, std::ostream& err);

} // namespace phind
