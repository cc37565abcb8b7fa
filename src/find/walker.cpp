#include <phind/walker.hpp>
#include <phind/glob.hpp>
#include <phind/log.hpp>
#include <system_error>

namespace fs = std::filesystem;

namespace phind {

Result<MatchType> parse_match_type(const std::string& s) {
    if (s == "f" || s == "file") return Result<MatchType>::ok(MatchType::File);
    if (s == "d" || s == "dir" || s == "directory")
        return Result<MatchType>::ok(MatchType::Directory);
    if (s == "any") return Result<MatchType>::ok(MatchType::Any);
    return PhindError{PhindError::InvalidArg,
        "invalid type '" + s + "'", "expected 'f' (files) or 'd' (directories)"};
}

const char* match_type_name(MatchType t) {
    switch (t) {
        case MatchType::Any:       return "any";
        case MatchType::File:      return "f";
        case MatchType::Directory: return "d";
    }
    return "any";
}

const char* entry_type_name(EntryType t) {
    switch (t) {
        case EntryType::File:      return "file";
        case EntryType::Directory: return "directory";
        case EntryType::Other:     return "other";
    }
    return "other";
}

static EntryType to_entry_type(fs::file_type t) {
    switch (t) {
        case fs::file_type::regular:   return EntryType::File;
        case fs::file_type::directory: return EntryType::Directory;
        default:                       return EntryType::Other;
    }
}

static PhindError list_error(const fs::path& dir, const std::error_code& ec) {
    auto code = ec == std::errc::permission_denied ||
                ec == std::errc::operation_not_permitted
        ? PhindError::Permission : PhindError::IO;
    return PhindError{code, ec.message(), "", dir.string(), 0};
}

Result<std::vector<DirEntry>> FilesystemLister::list(const fs::path& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return list_error(dir, ec);

    std::vector<DirEntry> out;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return list_error(dir, ec);
        std::error_code st_ec;
        auto st = it->symlink_status(st_ec);
        DirEntry de;
        de.name = it->path().filename().string();
        de.type = st_ec ? EntryType::Other : to_entry_type(st.type());
        out.push_back(std::move(de));
    }
    if (ec) return list_error(dir, ec);
    return Result<std::vector<DirEntry>>::ok(std::move(out));
}

namespace {

class Walker {
public:
    Walker(const WalkOptions& opts, const MatchSink& sink,
           Diagnostics& diag, DirectoryLister& lister)
        : opts_(opts), sink_(sink), diag_(diag), lister_(lister),
          glob_{opts.ignore_case},
          abs_include_(absolute_only(opts.include_patterns)),
          abs_exclude_(absolute_only(opts.exclude_patterns)) {}

    std::size_t run(Entry root) {
        stack_.push_back(std::move(root));
        while (!stack_.empty()) {
            Entry e = std::move(stack_.back());
            stack_.pop_back();
            visit(e);
        }
        return matches_;
    }

private:
    static std::vector<std::string> absolute_only(const std::vector<std::string>& patterns) {
        std::vector<std::string> out;
        for (const auto& p : patterns) {
            if (glob_is_absolute(p)) out.push_back(p);
        }
        return out;
    }

    // Every pattern sees the name and the path relative to the root. Only
    // absolute patterns see the absolute path, so nothing above the root
    // can match.
    bool matches(const Entry& e, const std::vector<std::string>& patterns,
                 const std::vector<std::string>& abs_patterns) const {
        if (patterns.empty()) return false;
        return glob_match_any(patterns, e.name, glob_) ||
               glob_match_any(patterns, e.relative_path, glob_) ||
               (!abs_patterns.empty() &&
                glob_match_any(abs_patterns, e.absolute_path.generic_string(), glob_));
    }

    bool type_matches(const Entry& e) const {
        switch (opts_.match_type) {
            case MatchType::Any:       return true;
            case MatchType::File:      return e.type == EntryType::File;
            case MatchType::Directory: return e.type == EntryType::Directory;
        }
        return true;
    }

    bool within_depth(std::size_t depth) const {
        return !opts_.max_depth || depth <= *opts_.max_depth;
    }

    void visit(const Entry& e) {
        // The root itself is never excluded; pruning applies to descendants.
        if (e.depth > 0 && matches(e, opts_.exclude_patterns, abs_exclude_)) {
            log::trace("%s %s %s", e.type == EntryType::Directory ? "prune" : "skip",
                       entry_type_name(e.type), e.relative_path.c_str());
            return;
        }
        if (!within_depth(e.depth)) return;

        if (type_matches(e) && matches(e, opts_.include_patterns, abs_include_)) {
            matches_++;
            sink_(e);
        }

        if (e.type == EntryType::Directory && within_depth(e.depth + 1)) {
            descend(e);
        }
    }

    void descend(const Entry& dir) {
        auto children = lister_.list(dir.absolute_path);
        if (children.is_err()) {
            diag_.error(dir.absolute_path.string(), children.error().message);
            return;
        }

        // Push in reverse so siblings pop in enumeration order.
        auto& list = children.value();
        for (auto it = list.rbegin(); it != list.rend(); ++it) {
            Entry child;
            child.absolute_path = dir.absolute_path / it->name;
            child.relative_path = dir.depth == 0
                ? it->name : dir.relative_path + "/" + it->name;
            child.name = std::move(it->name);
            child.depth = dir.depth + 1;
            child.type = it->type;
            stack_.push_back(std::move(child));
        }
    }

    const WalkOptions& opts_;
    const MatchSink& sink_;
    Diagnostics& diag_;
    DirectoryLister& lister_;
    GlobOptions glob_;
    std::vector<std::string> abs_include_;
    std::vector<std::string> abs_exclude_;
    std::vector<Entry> stack_;
    std::size_t matches_ = 0;
};

Status validate_patterns(const std::vector<std::string>& patterns, const char* what) {
    for (const auto& p : patterns) {
        auto st = glob_validate(p);
        if (st.is_err()) {
            auto err = std::move(st).error();
            err.hint = std::string("check the ") + what + " patterns";
            return err;
        }
    }
    return ok_status();
}

} // namespace

Result<std::size_t> walk(const fs::path& root,
                         const WalkOptions& opts,
                         const MatchSink& sink,
                         Diagnostics& diag) {
    FilesystemLister lister;
    return walk(root, opts, sink, diag, lister);
}

Result<std::size_t> walk(const fs::path& root,
                         const WalkOptions& opts,
                         const MatchSink& sink,
                         Diagnostics& diag,
                         DirectoryLister& lister) {
    PHIND_TRY(validate_patterns(opts.include_patterns, "include"));
    PHIND_TRY(validate_patterns(opts.exclude_patterns, "exclude"));

    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    if (ec) {
        return PhindError{PhindError::IO,
            "cannot resolve start path \"" + root.string() + "\": " + ec.message()};
    }
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_relative_path()) {
        abs = abs.parent_path();
    }

    auto st = fs::status(abs, ec);
    if (st.type() == fs::file_type::not_found) {
        return PhindError{PhindError::NotFound,
            "start path \"" + root.string() + "\" not found"};
    }
    if (ec) {
        return PhindError{PhindError::IO,
            "cannot access start path \"" + root.string() + "\": " + ec.message()};
    }
    if (st.type() != fs::file_type::directory) {
        return PhindError{PhindError::InvalidArg,
            "start path \"" + root.string() + "\" is not a directory"};
    }

    Entry entry;
    entry.absolute_path = abs;
    entry.relative_path = ".";
    entry.name = abs.has_filename() ? abs.filename().string() : abs.string();
    entry.depth = 0;
    entry.type = EntryType::Directory;

    Walker w(opts, sink, diag, lister);
    auto count = w.run(std::move(entry));
    log::debug("walk of %s finished with %zu match(es)", abs.string().c_str(), count);
    return Result<std::size_t>::ok(count);
}

} // namespace phind
