#include <phind/cli.hpp>
#include <phind/diagnostics.hpp>
#include <phind/log.hpp>
#include <phind/patterns.hpp>
#include <cerrno>
#include <cstdlib>
#include <getopt.h>
#include <ostream>

#ifndef PHIND_VERSION
#define PHIND_VERSION "unknown"
#endif

namespace phind {

namespace {

enum LongOnly {
    OPT_SKIP_GLOBAL_IGNORE = 256,
    OPT_VERSION,
};

const struct option long_options[] = {
    {"name",               required_argument, nullptr, 'n'},
    {"exclude",            required_argument, nullptr, 'e'},
    {"skip-global-ignore", no_argument,       nullptr, OPT_SKIP_GLOBAL_IGNORE},
    {"type",               required_argument, nullptr, 't'},
    {"maxdepth",           required_argument, nullptr, 'd'},
    {"ignore-case",        no_argument,       nullptr, 'i'},
    {"relative",           no_argument,       nullptr, 'r'},
    {"verbose",            no_argument,       nullptr, 'v'},
    {"quiet",              no_argument,       nullptr, 'q'},
    {"help",               no_argument,       nullptr, 'h'},
    {"version",            no_argument,       nullptr, OPT_VERSION},
    {nullptr, 0, nullptr, 0},
};

const char* short_options = ":n:e:t:d:irvqh";

Result<std::size_t> parse_depth(const char* arg) {
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(arg, &end, 10);
    if (errno != 0 || end == arg || *end != '\0' || v < 0) {
        return PhindError{PhindError::InvalidArg,
            std::string("invalid maxdepth '") + arg + "'",
            "maxdepth must be a non-negative integer"};
    }
    return Result<std::size_t>::ok(static_cast<std::size_t>(v));
}

// The option getopt_long() just rejected.
std::string offending_option(char** argv) {
    if (optopt > 0 && optopt < 256) return std::string("-") + static_cast<char>(optopt);
    return optind > 0 ? argv[optind - 1] : "?";
}

} // namespace

Result<CliOptions> parse_args(int argc, char** argv) {
    CliOptions opts;

    optind = 0;  // full re-initialization for repeated parses
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, short_options, long_options, nullptr)) != -1) {
        switch (opt) {
            case 'n':
                if (!opts.include) opts.include.emplace();
                opts.include->push_back(optarg);
                break;
            case 'e':
                opts.exclude.push_back(optarg);
                break;
            case OPT_SKIP_GLOBAL_IGNORE:
                opts.skip_global_ignore = true;
                break;
            case 't': {
                auto t = parse_match_type(optarg);
                if (t.is_err() || t.value() == MatchType::Any) {
                    return PhindError{PhindError::InvalidArg,
                        std::string("invalid value for --type: '") + optarg + "'",
                        "choices: f, d"};
                }
                opts.type = t.value();
                break;
            }
            case 'd': {
                auto d = parse_depth(optarg);
                PHIND_TRY(d);
                opts.max_depth = d.value();
                break;
            }
            case 'i': opts.ignore_case = true; break;
            case 'r': opts.relative = true; break;
            case 'v': opts.verbose = true; break;
            case 'q': opts.quiet = true; break;
            case 'h': opts.help = true; break;
            case OPT_VERSION: opts.version = true; break;
            case ':':
                return PhindError{PhindError::InvalidArg,
                    "missing value for option " + offending_option(argv),
                    "run 'phind --help' for usage"};
            default:
                return PhindError{PhindError::InvalidArg,
                    "unknown option " + offending_option(argv),
                    "run 'phind --help' for usage"};
        }
    }

    if (optind < argc) {
        opts.path = argv[optind++];
    }
    if (optind < argc) {
        return PhindError{PhindError::InvalidArg,
            std::string("unexpected argument '") + argv[optind] + "'",
            "only one start path may be given"};
    }
    if (opts.verbose && opts.quiet) {
        return PhindError{PhindError::InvalidArg,
            "--verbose and --quiet are mutually exclusive"};
    }

    return Result<CliOptions>::ok(std::move(opts));
}

Config CliOptions::as_config() const {
    Config cfg;
    if (ignore_case) cfg.ignore_case = true;
    if (relative) cfg.relative = true;
    if (skip_global_ignore) cfg.global_ignore = false;
    cfg.max_depth = max_depth;
    cfg.type = type;
    cfg.include = include;
    cfg.exclude = exclude;
    if (verbose) cfg.log_level = log::Debug;
    if (quiet) cfg.log_level = log::Error;
    return cfg;
}

std::string usage(const std::string& ignore_path, const std::string& default_excludes) {
    std::string u;
    u += "Usage: phind [path] [options]\n";
    u += "\n";
    u += "Find files and directories recursively.\n";
    u += "\n";
    u += "Arguments:\n";
    u += "  path                       Directory to search in (default: \".\")\n";
    u += "\n";
    u += "Options:\n";
    u += "  -n, --name PATTERN         Glob pattern for names/paths to include;\n";
    u += "                             repeatable (default: \"*\")\n";
    u += "  -e, --exclude PATTERN      Glob pattern to exclude; repeatable.\n";
    u += "                             Always excluded: " + default_excludes + "\n";
    u += "                             Also read from " + ignore_path + "\n";
    u += "      --skip-global-ignore   Do not load the global ignore file\n";
    u += "  -t, --type f|d             Match only files (f) or directories (d)\n";
    u += "  -d, --maxdepth N           Maximum depth to descend (0 = start path only)\n";
    u += "  -i, --ignore-case          Case-insensitive matching\n";
    u += "  -r, --relative             Print paths relative to the start path\n";
    u += "  -v, --verbose              Log debug details to stderr\n";
    u += "  -q, --quiet                Log errors only\n";
    u += "  -h, --help                 Show this help\n";
    u += "      --version              Show version\n";
    return u;
}

namespace {

// Config file errors other than "missing" stop the run.
Result<Config> load_settings(const CliOptions& opts, const Environment& env) {
    Config cfg;
    auto path = global_config_path(env);
    auto file = Config::load(path);
    if (file.is_ok()) {
        log::debug("using config %s", path.c_str());
        cfg = std::move(file.value());
    } else if (!file.has_code(PhindError::NotFound)) {
        return std::move(file).error();
    }
    cfg.merge(opts.as_config());
    return Result<Config>::ok(std::move(cfg));
}

} // namespace

int run(const CliOptions& opts, const Environment& env,
        std::ostream& out, std::ostream& err) {
    LogDiagnostics diag;
    PatternConfig patterns(env, diag);

    if (opts.help) {
        out << usage(patterns.global_ignore_path(), patterns.describe_defaults());
        return 0;
    }
    if (opts.version) {
        out << "phind " << PHIND_VERSION << "\n";
        return 0;
    }

    auto settings = load_settings(opts, env);
    if (settings.is_err()) {
        err << settings.error().format() << "\n";
        return 1;
    }
    const Config& cfg = settings.value();
    if (cfg.log_level) log::set_level(*cfg.log_level);

    if (cfg.global_ignore.value_or(true)) {
        patterns.load_global();
    }
    patterns.set_cli(cfg.exclude);

    WalkOptions wo;
    if (cfg.include) wo.include_patterns = *cfg.include;
    wo.exclude_patterns = *patterns.effective();
    wo.match_type = cfg.type.value_or(MatchType::Any);
    wo.max_depth = cfg.max_depth;
    wo.ignore_case = cfg.ignore_case.value_or(false);

    log::debug("searching %s (type %s, %zu include, %zu exclude pattern(s))",
               opts.path.c_str(), match_type_name(wo.match_type),
               wo.include_patterns.size(), wo.exclude_patterns.size());

    const bool relative = cfg.relative.value_or(false);
    auto count = walk(opts.path, wo, [&](const Entry& e) {
        out << (relative ? e.relative_path : e.absolute_path.string()) << "\n";
    }, diag);

    if (count.is_err()) {
        err << count.error().format() << "\n";
        return 1;
    }
    log::debug("%zu match(es)", count.value());
    return 0;
}

} // namespace phind
