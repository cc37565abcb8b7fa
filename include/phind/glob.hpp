#pragma once

#include <phind/result.hpp>
#include <string>
#include <vector>

namespace phind {

struct GlobOptions {
    bool ignore_case = false;
};

// Match a glob pattern against a path (both normalized: '/' separators,
// with any leading "./" and trailing "/" dropped). '\\' is a separator only
// on Windows; elsewhere it is an ordinary file-name character.
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
// Names starting with '.' get no special treatment.
bool glob_match(const std::string& pattern, const std::string& path,
                GlobOptions opts = {});

// True if any pattern in the list matches.
bool glob_match_any(const std::vector<std::string>& patterns,
                    const std::string& path, GlobOptions opts = {});

// Reject patterns glob_match() cannot interpret: empty patterns and
// unterminated character classes.
Status glob_validate(const std::string& pattern);

// True for patterns anchored at a filesystem root ("/x", "C:/x").
bool glob_is_absolute(const std::string& pattern);

// Normalize separators the same way glob_match() does.
std::string glob_normalize(const std::string& path);

} // namespace phind
