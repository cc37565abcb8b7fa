#pragma once

#include <phind/diagnostics.hpp>
#include <phind/result.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace phind {

enum class MatchType { Any, File, Directory };
enum class EntryType { File, Directory, Other };

// "f", "d" or "any"
Result<MatchType> parse_match_type(const std::string& s);
const char* match_type_name(MatchType t);
const char* entry_type_name(EntryType t);

struct WalkOptions {
    std::vector<std::string> include_patterns{"*"};
    std::vector<std::string> exclude_patterns;
    MatchType match_type = MatchType::Any;
    std::optional<std::size_t> max_depth;  // nullopt = unbounded
    bool ignore_case = false;
};

// A node visited during the walk. The root has depth 0 and relative
// path "."; everything below uses '/' separators.
struct Entry {
    std::filesystem::path absolute_path;
    std::string relative_path;
    std::string name;
    std::size_t depth = 0;
    EntryType type = EntryType::Other;
};

struct DirEntry {
    std::string name;
    EntryType type = EntryType::Other;
};

// Source of directory listings. Symlinks must be reported as Other and
// never followed.
class DirectoryLister {
public:
    virtual ~DirectoryLister() = default;
    virtual Result<std::vector<DirEntry>> list(const std::filesystem::path& dir) = 0;
};

class FilesystemLister : public DirectoryLister {
public:
    Result<std::vector<DirEntry>> list(const std::filesystem::path& dir) override;
};

using MatchSink = std::function<void(const Entry&)>;

// Depth-first walk from root. For every entry below the root, exclusion is
// checked first: an excluded directory is pruned (never reported, never
// listed). Survivors are then filtered by depth, type and include patterns
// and reported to sink in visit order. Unreadable directories are reported
// to diag and treated as empty.
//
// Returns the number of matches, or a Pattern error before any I/O if a
// pattern is malformed, or NotFound/InvalidArg if root is not a directory.
Result<std::size_t> walk(const std::filesystem::path& root,
                         const WalkOptions& opts,
                         const MatchSink& sink,
                         Diagnostics& diag);

Result<std::size_t> walk(const std::filesystem::path& root,
                         const WalkOptions& opts,
                         const MatchSink& sink,
                         Diagnostics& diag,
                         DirectoryLister& lister);

} // namespace phind
