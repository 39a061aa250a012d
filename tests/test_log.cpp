#include <catch2/catch.hpp>
#include <ulidgen/generator.hpp>
#include <ulidgen/log.hpp>
#include <cstdio>
#include <functional>
#include <string>
#include <unistd.h>

using namespace ulidgen;

// Runs fn with stderr redirected into a pipe and returns what was written.
static std::string capture_stderr(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved, fileno(stderr));
    close(saved);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

// Resets the logger so later tests see the defaults.
struct LogDefaults {
    ~LogDefaults() {
        log::set_level(log::Info);
        log::set_color_enabled(false);
    }
};

TEST_CASE("level setting round-trips", "[log]") {
    LogDefaults reset;
    for (auto lvl : {log::Trace, log::Debug, log::Info, log::Warn, log::Error}) {
        log::set_level(lvl);
        REQUIRE(log::get_level() == lvl);
    }
}

TEST_CASE("level names", "[log]") {
    REQUIRE(std::string(log::level_name(log::Trace)) == "trace");
    REQUIRE(std::string(log::level_name(log::Warn)) == "warn");
    REQUIRE(std::string(log::level_name(log::Error)) == "error");
}

TEST_CASE("parse_level accepts names in any case", "[log]") {
    REQUIRE(log::parse_level("debug") == log::Debug);
    REQUIRE(log::parse_level("INFO") == log::Info);
    REQUIRE(log::parse_level("Warning") == log::Warn);
    REQUIRE(log::parse_level("warn") == log::Warn);
    REQUIRE_FALSE(log::parse_level("verbose").has_value());
    REQUIRE_FALSE(log::parse_level("").has_value());
}

TEST_CASE("color can be forced off and on", "[log]") {
    LogDefaults reset;
    log::set_color_enabled(true);
    REQUIRE(log::is_color_enabled());
    log::set_color_enabled(false);
    REQUIRE_FALSE(log::is_color_enabled());
}

TEST_CASE("messages below the threshold are dropped", "[log]") {
    LogDefaults reset;
    log::set_level(log::Warn);
    log::set_color_enabled(false);

    auto output = capture_stderr([] { log::info("hidden"); });
    REQUIRE(output.empty());
}

TEST_CASE("messages at or above the threshold are written", "[log]") {
    LogDefaults reset;
    log::set_level(log::Warn);
    log::set_color_enabled(false);

    auto output = capture_stderr([] {
        log::warn("clock went back %d ms", 5);
        log::error("giving up on %s", "01ARZ3NDEKTSV4RRFFQ69G5FAV");
    });
    REQUIRE(output.find("warn: clock went back 5 ms\n") != std::string::npos);
    REQUIRE(output.find("error: giving up on 01ARZ3NDEKTSV4RRFFQ69G5FAV\n") != std::string::npos);
}

TEST_CASE("long messages are written in full", "[log]") {
    LogDefaults reset;
    log::set_level(log::Info);
    log::set_color_enabled(false);

    std::string path = "/" + std::string(3000, 'x') + "/ulidgen.toml";
    auto output = capture_stderr([&path] {
        log::error("cannot read %s: end of path", path.c_str());
    });
    REQUIRE(output == "error: cannot read " + path + ": end of path\n");
}

TEST_CASE("colored output wraps the level name", "[log]") {
    LogDefaults reset;
    log::set_level(log::Info);
    log::set_color_enabled(true);

    auto output = capture_stderr([] { log::info("hello"); });
    REQUIRE(output.find("\033[32minfo\033[0m: hello") != std::string::npos);
}

TEST_CASE("generator failures are logged at debug level", "[log]") {
    LogDefaults reset;
    log::set_level(log::Debug);
    log::set_color_enabled(false);

    auto output = capture_stderr([] {
        Generator gen(no_entropy_source());
        REQUIRE_FALSE(gen.generate().has_value());
    });
    REQUIRE(output.find("debug:") != std::string::npos);
}
