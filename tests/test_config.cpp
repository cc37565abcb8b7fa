#include <catch2/catch.hpp>
#include <phind/config.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace phind;
namespace fs = std::filesystem;

using List = std::vector<std::string>;

// ===== Parsing =====

TEST_CASE("parse config with search section", "[config]") {
    auto r = Config::parse(R"(
[search]
ignore-case = true
relative = false
max-depth = 4
type = "f"
name = ["*.cpp", "*.hpp"]
exclude = ["build", "out"]
global-ignore = false
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.ignore_case == true);
    REQUIRE(cfg.relative == false);
    REQUIRE(cfg.max_depth == std::size_t(4));
    REQUIRE(cfg.type == MatchType::File);
    REQUIRE(cfg.include == List{"*.cpp", "*.hpp"});
    REQUIRE(cfg.exclude == List{"build", "out"});
    REQUIRE(cfg.global_ignore == false);
}

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
}

TEST_CASE("parse empty config leaves everything unset", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE_FALSE(cfg.ignore_case.has_value());
    REQUIRE_FALSE(cfg.max_depth.has_value());
    REQUIRE_FALSE(cfg.include.has_value());
    REQUIRE(cfg.exclude.empty());
    REQUIRE_FALSE(cfg.log_level.has_value());
}

TEST_CASE("parse accepts a single string for pattern lists", "[config]") {
    auto r = Config::parse(R"(
[search]
name = "*.md"
exclude = "target"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().include == List{"*.md"});
    REQUIRE(r.value().exclude == List{"target"});
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.has_code(PhindError::Parse));
}

TEST_CASE("parse rejects wrongly typed values", "[config]") {
    REQUIRE(Config::parse("[search]\nignore-case = \"yes\"\n").has_code(PhindError::Config));
    REQUIRE(Config::parse("[search]\nmax-depth = -1\n").has_code(PhindError::Config));
    REQUIRE(Config::parse("[search]\nmax-depth = 1.5\n").has_code(PhindError::Config));
    REQUIRE(Config::parse("[search]\ntype = \"x\"\n").has_code(PhindError::Config));
    REQUIRE(Config::parse("[search]\nname = [1, 2]\n").has_code(PhindError::Config));
    REQUIRE(Config::parse("search = 3\n").has_code(PhindError::Config));
    REQUIRE(Config::parse("[log]\nlevel = \"loud\"\n").has_code(PhindError::Config));
}

// ===== Merge =====

TEST_CASE("merge overrides only explicitly set fields", "[config]") {
    auto base = Config::parse(R"(
[search]
ignore-case = true
max-depth = 3
name = ["*.txt"]
)").value();

    Config overlay;
    overlay.max_depth = 1;
    overlay.type = MatchType::Directory;

    base.merge(overlay);
    REQUIRE(base.ignore_case == true);          // preserved
    REQUIRE(base.max_depth == std::size_t(1));  // overridden
    REQUIRE(base.type == MatchType::Directory); // added
    REQUIRE(base.include == List{"*.txt"});     // preserved
}

TEST_CASE("merge appends excludes in layer order", "[config]") {
    Config base;
    base.exclude = {"build"};
    Config overlay;
    overlay.exclude = {"out", "build"};
    base.merge(overlay);
    REQUIRE(base.exclude == List{"build", "out", "build"});
}

// ===== Loading =====

TEST_CASE("load reports a missing file as NotFound", "[config]") {
    auto r = Config::load((fs::temp_directory_path() / "phind_no_such_config.toml").string());
    REQUIRE(r.has_code(PhindError::NotFound));
}

TEST_CASE("load reads and tags errors with the file", "[config]") {
    auto path = fs::temp_directory_path() / ("phind_config_test_" + std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count()) + ".toml");

    {
        std::ofstream f(path);
        f << "[search]\nrelative = true\n";
    }
    auto ok = Config::load(path.string());
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().relative == true);

    {
        std::ofstream f(path);
        f << "[search\n";
    }
    auto bad = Config::load(path.string());
    REQUIRE(bad.has_code(PhindError::Parse));
    REQUIRE(bad.error().file == path.string());

    std::error_code ec;
    fs::remove(path, ec);
}
