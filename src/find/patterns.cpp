#include <phind/patterns.hpp>
#include <phind/log.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace phind {

Result<std::string> read_ignore_file(const std::string& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        return PhindError{PhindError::NotFound, "no such file: " + path};
    }
    if (st.type() == fs::file_type::directory) {
        return PhindError{PhindError::IO, "is a directory: " + path};
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        int err = errno;
        auto code = (err == EACCES || err == EPERM) ? PhindError::Permission
                                                    : PhindError::IO;
        return PhindError{code, "cannot open " + path + ": " +
            (err ? std::strerror(err) : "unknown error")};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return PhindError{PhindError::IO, "error reading " + path};
    }
    return Result<std::string>::ok(ss.str());
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

PatternList parse_ignore_patterns(const std::string& content) {
    PatternList out;
    // Strip a UTF-8 byte order mark
    static const std::string bom = "\xEF\xBB\xBF";
    std::istringstream in(content.compare(0, bom.size(), bom) == 0
                              ? content.substr(bom.size()) : content);
    std::string line;
    while (std::getline(in, line)) {
        // getline leaves the '\r' of a CRLF ending; trim() removes it
        auto pat = trim(line);
        if (pat.empty() || pat[0] == '#') continue;
        out.push_back(std::move(pat));
    }
    return out;
}

const PatternList& PatternConfig::builtin_defaults() {
    static const PatternList defaults = {"node_modules", ".git"};
    return defaults;
}

PatternConfig::PatternConfig(const Environment& env,
                             Diagnostics& diag,
                             PatternList defaults,
                             IgnoreFileReader reader)
    : diag_(diag),
      reader_(std::move(reader)),
      global_path_(phind::global_ignore_path(env)),
      defaults_(std::move(defaults)) {}

void PatternConfig::set_global(PatternList patterns) {
    std::lock_guard<std::mutex> lock(mu_);
    global_ = std::move(patterns);
    effective_.reset();
}

void PatternConfig::set_cli(PatternList patterns) {
    std::lock_guard<std::mutex> lock(mu_);
    cli_ = std::move(patterns);
    effective_.reset();
}

void PatternConfig::load_global(bool force_reload) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!force_reload && !global_.empty()) return;
    }

    // Read outside the lock; concurrent loads are last-writer-wins.
    PatternList loaded;
    auto content = reader_(global_path_);
    if (content.is_ok()) {
        loaded = parse_ignore_patterns(content.value());
        log::debug("loaded %zu pattern(s) from %s", loaded.size(),
                   global_path_.c_str());
    } else if (content.error().code != PhindError::NotFound) {
        diag_.warn("could not read global ignore file at " + global_path_ +
                   ": " + content.error().message);
    }

    std::lock_guard<std::mutex> lock(mu_);
    global_ = std::move(loaded);
    effective_.reset();
}

std::future<void> PatternConfig::load_global_async(bool force_reload) {
    return std::async(std::launch::async,
                      [this, force_reload] { load_global(force_reload); });
}

std::shared_ptr<const PatternList> PatternConfig::effective() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!effective_) {
        auto merged = std::make_shared<PatternList>();
        merged->reserve(defaults_.size() + global_.size() + cli_.size());
        merged->insert(merged->end(), defaults_.begin(), defaults_.end());
        merged->insert(merged->end(), global_.begin(), global_.end());
        merged->insert(merged->end(), cli_.begin(), cli_.end());
        effective_ = std::move(merged);
    }
    return effective_;
}

PatternList PatternConfig::defaults() const {
    return defaults_;
}

PatternList PatternConfig::global() const {
    std::lock_guard<std::mutex> lock(mu_);
    return global_;
}

PatternList PatternConfig::cli() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cli_;
}

std::string PatternConfig::describe_defaults() const {
    std::string out;
    for (const auto& p : defaults_) {
        if (!out.empty()) out += ", ";
        out += "\"" + p + "\"";
    }
    return out;
}

} // namespace phind
