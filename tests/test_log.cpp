#include <catch2/catch.hpp>
#include <phind/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace phind::log;

// Run fn with the logger pointed at a temporary file and return what it wrote.
static std::string capture_log(const std::function<void()>& fn) {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_stream(tmp);
    fn();
    set_stream(nullptr);

    std::fflush(tmp);
    std::rewind(tmp);
    std::string output;
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (auto lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name and parse_level agree", "[log]") {
    for (auto lvl : {Trace, Debug, Info, Warn, Error}) {
        auto parsed = parse_level(level_name(lvl));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == lvl);
    }
    REQUIRE(parse_level("warning") == Warn);
    REQUIRE_FALSE(parse_level("loud").has_value());
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled());
    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] { info("should not appear"); });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at and above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] {
        warn("could not read %s", "/tmp/ignore");
        error("%s: %s", "/srv/locked", "Permission denied");
    });
    REQUIRE(output == "warn: could not read /tmp/ignore\n"
                      "error: /srv/locked: Permission denied\n");

    set_level(Info);
}

TEST_CASE("Colored output wraps the level tag", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_log([] { error("boom"); });
    REQUIRE(output.find("\033[31merror\033[0m: boom") != std::string::npos);

    set_color_enabled(false);
}
