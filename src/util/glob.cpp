#include <phind/glob.hpp>
#include <cctype>

namespace phind {

// ---- Helpers ----

std::string glob_normalize(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
#ifdef _WIN32
        if (c == '\\') c = '/';
#endif
        // Collapse consecutive slashes
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    // Drop "./" prefixes so "./src/a.cpp" and "src/a.cpp" compare equal
    size_t start = 0;
    while (out.size() - start > 2 && out[start] == '.' && out[start + 1] == '/') {
        start += 2;
    }
    if (start > 0) out.erase(0, start);
    // Remove trailing slash (unless the entire string is "/")
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

static std::string fold_case(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segs.push_back(cur);
    return segs;
}

// Match a single segment against a pattern segment (no '/' in either).
// A '**' inside a segment ("**.txt") behaves like '*'.
static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size() && si < str.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (pc == '?') {
            pi++;
            si++;
            continue;
        }

        if (pc == '[') {
            pi++; // skip '['
            bool negate = false;
            if (pi < pat.size() && pat[pi] == '!') {
                negate = true;
                pi++;
            }
            bool matched = false;
            char sc = str[si];
            while (pi < pat.size() && pat[pi] != ']') {
                char lo = pat[pi];
                if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
                    char hi = pat[pi + 2];
                    if (sc >= lo && sc <= hi) matched = true;
                    pi += 3;
                } else {
                    if (sc == lo) matched = true;
                    pi++;
                }
            }
            if (pi < pat.size()) pi++; // skip ']'
            if (negate) matched = !matched;
            if (!matched) return false;
            si++;
            continue;
        }

        if (pc != str[si]) return false;
        pi++;
        si++;
    }

    while (pi < pat.size() && pat[pi] == '*') pi++;

    return pi == pat.size() && si == str.size();
}

// Recursive matching over path segments, handling '**'.
static bool match_segments(const std::vector<std::string>& pat_segs, size_t pi,
                           const std::vector<std::string>& path_segs, size_t si) {
    while (pi < pat_segs.size() && si < path_segs.size()) {
        const auto& ps = pat_segs[pi];

        if (ps == "**") {
            while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;
            if (pi == pat_segs.size()) return true;
            for (size_t k = si; k <= path_segs.size(); k++) {
                if (match_segments(pat_segs, pi, path_segs, k)) return true;
            }
            return false;
        }

        if (!match_segment(ps, 0, path_segs[si], 0)) return false;
        pi++;
        si++;
    }

    while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;

    return pi == pat_segs.size() && si == path_segs.size();
}

// ---- Public API ----

bool glob_match(const std::string& pattern, const std::string& path,
                GlobOptions opts) {
    auto norm_pat = glob_normalize(pattern);
    auto norm_path = glob_normalize(path);
    if (opts.ignore_case) {
        norm_pat = fold_case(std::move(norm_pat));
        norm_path = fold_case(std::move(norm_path));
    }

    return match_segments(split_segments(norm_pat), 0,
                          split_segments(norm_path), 0);
}

bool glob_match_any(const std::vector<std::string>& patterns,
                    const std::string& path, GlobOptions opts) {
    for (const auto& pat : patterns) {
        if (glob_match(pat, path, opts)) return true;
    }
    return false;
}

bool glob_is_absolute(const std::string& pattern) {
    auto norm = glob_normalize(pattern);
    if (!norm.empty() && norm[0] == '/') return true;
    return norm.size() >= 3 && std::isalpha(static_cast<unsigned char>(norm[0])) &&
           norm[1] == ':' && norm[2] == '/';
}

Status glob_validate(const std::string& pattern) {
    if (pattern.empty()) {
        return PhindError{PhindError::Pattern, "empty glob pattern"};
    }
    for (size_t i = 0; i < pattern.size(); i++) {
        if (pattern[i] != '[') continue;
        size_t j = i + 1;
        if (j < pattern.size() && pattern[j] == '!') j++;
        while (j < pattern.size() && pattern[j] != ']' && pattern[j] != '/') j++;
        if (j >= pattern.size() || pattern[j] != ']') {
            return PhindError{PhindError::Pattern,
                "unterminated character class in glob pattern: " + pattern,
                "close the class with ']'"};
        }
        i = j;
    }
    return ok_status();
}

} // namespace phind
