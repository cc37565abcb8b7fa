#include <phind/config.hpp>
#include <toml++/toml.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace phind {

static PhindError bad_value(const std::string& key, const char* expected) {
    return PhindError{PhindError::Config,
        "config key '" + key + "' must be " + expected};
}

static Result<std::optional<bool>> read_bool(const toml::table& tbl, const char* key) {
    auto node = tbl[key];
    if (!node) return Result<std::optional<bool>>::ok(std::nullopt);
    auto v = node.value<bool>();
    if (!v || !node.is_boolean()) return bad_value(key, "a boolean");
    return Result<std::optional<bool>>::ok(*v);
}

static Result<std::optional<std::string>> read_string(const toml::table& tbl,
                                                      const char* key) {
    auto node = tbl[key];
    if (!node) return Result<std::optional<std::string>>::ok(std::nullopt);
    if (!node.is_string()) return bad_value(key, "a string");
    return Result<std::optional<std::string>>::ok(
        std::string(*node.value<std::string>()));
}

static Result<std::optional<std::vector<std::string>>> read_strings(
    const toml::table& tbl, const char* key)
{
    using Out = std::optional<std::vector<std::string>>;
    auto node = tbl[key];
    if (!node) return Result<Out>::ok(std::nullopt);

    // A bare string is accepted as a one-element list.
    if (node.is_string()) {
        return Result<Out>::ok(std::vector<std::string>{
            std::string(*node.value<std::string>())});
    }
    auto* arr = node.as_array();
    if (!arr) return bad_value(key, "a string or an array of strings");

    std::vector<std::string> out;
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s || !el.is_string()) return bad_value(key, "an array of strings");
        out.push_back(std::string(*s));
    }
    return Result<Out>::ok(std::move(out));
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PhindError{PhindError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [search] section
    if (auto node = doc["search"]; node) {
        auto* search = node.as_table();
        if (!search) return bad_value("search", "a table");

        auto ic = read_bool(*search, "ignore-case");
        PHIND_TRY(ic);
        cfg.ignore_case = ic.value();

        auto rel = read_bool(*search, "relative");
        PHIND_TRY(rel);
        cfg.relative = rel.value();

        auto gi = read_bool(*search, "global-ignore");
        PHIND_TRY(gi);
        cfg.global_ignore = gi.value();

        if (auto depth = (*search)["max-depth"]; depth) {
            auto v = depth.value<int64_t>();
            if (!v || !depth.is_integer() || *v < 0) {
                return bad_value("max-depth", "a non-negative integer");
            }
            cfg.max_depth = static_cast<std::size_t>(*v);
        }

        auto type = read_string(*search, "type");
        PHIND_TRY(type);
        if (type.value()) {
            auto mt = parse_match_type(*type.value());
            if (mt.is_err()) return bad_value("type", "\"f\", \"d\" or \"any\"");
            cfg.type = mt.value();
        }

        auto name = read_strings(*search, "name");
        PHIND_TRY(name);
        cfg.include = std::move(name.value());

        auto exclude = read_strings(*search, "exclude");
        PHIND_TRY(exclude);
        if (exclude.value()) cfg.exclude = std::move(*exclude.value());
    }

    // [log] section
    if (auto node = doc["log"]; node) {
        auto* logtbl = node.as_table();
        if (!logtbl) return bad_value("log", "a table");
        auto level = read_string(*logtbl, "level");
        PHIND_TRY(level);
        if (level.value()) {
            auto lvl = log::parse_level(*level.value());
            if (!lvl) return bad_value("level", "one of trace, debug, info, warn, error");
            cfg.log_level = *lvl;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return PhindError{PhindError::NotFound, "no config file at " + path};
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        return PhindError{PhindError::IO, "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err() && cfg.error().file.empty()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.ignore_case) ignore_case = other.ignore_case;
    if (other.relative) relative = other.relative;
    if (other.global_ignore) global_ignore = other.global_ignore;
    if (other.max_depth) max_depth = other.max_depth;
    if (other.type) type = other.type;
    if (other.include) include = other.include;
    if (other.log_level) log_level = other.log_level;
    exclude.insert(exclude.end(), other.exclude.begin(), other.exclude.end());
}

} // namespace phind
