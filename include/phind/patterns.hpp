#pragma once

#include <phind/diagnostics.hpp>
#include <phind/paths.hpp>
#include <phind/result.hpp>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace phind {

using PatternList = std::vector<std::string>;

// Reads the whole ignore file. Must return a NotFound error when the file
// does not exist; any other error is reported as a warning.
using IgnoreFileReader = std::function<Result<std::string>(const std::string& path)>;

Result<std::string> read_ignore_file(const std::string& path);

// Split on \n or \r\n, trim each line, drop blanks and '#' comments.
PatternList parse_ignore_patterns(const std::string& content);

// Exclude patterns from three sources, concatenated as
// defaults ++ global ++ cli with order and duplicates preserved.
// The concatenation is cached until any source changes.
class PatternConfig {
public:
    static const PatternList& builtin_defaults();

    explicit PatternConfig(const Environment& env,
                           Diagnostics& diag,
                           PatternList defaults = builtin_defaults(),
                           IgnoreFileReader reader = read_ignore_file);

    const std::string& global_ignore_path() const { return global_path_; }

    void set_global(PatternList patterns);
    void set_cli(PatternList patterns);

    // No-op when !force_reload and global patterns are already present.
    void load_global(bool force_reload = false);
    std::future<void> load_global_async(bool force_reload = false);

    // Returns the same instance until the next mutation.
    std::shared_ptr<const PatternList> effective() const;

    PatternList defaults() const;
    PatternList global() const;
    PatternList cli() const;

    // "node_modules", ".git"
    std::string describe_defaults() const;

private:
    Diagnostics& diag_;
    IgnoreFileReader reader_;
    std::string global_path_;

    mutable std::mutex mu_;
    const PatternList defaults_;
    PatternList global_;
    PatternList cli_;
    mutable std::shared_ptr<const PatternList> effective_;
};

} // namespace phind
