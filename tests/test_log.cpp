#include <catch2/catch.hpp>
#include <wharf/log.hpp>
#include <cstdio>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

using namespace wharf::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

// Collects sink output for the lifetime of the object
struct SinkCapture {
    std::vector<std::pair<Level, std::string>> lines;

    SinkCapture() {
        set_sink([this](Level lvl, const std::string& line) {
            lines.emplace_back(lvl, line);
        });
    }
    ~SinkCapture() {
        set_sink(nullptr);
        set_level(Info);
    }
};

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    set_level(Trace);
    REQUIRE(get_level() == Trace);
    set_level(Error);
    REQUIRE(get_level() == Error);
    set_level(Info);
    REQUIRE(get_level() == Info);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level accepts names case-insensitively", "[log]") {
    Level lvl = Info;
    REQUIRE(parse_level("DEBUG", lvl));
    REQUIRE(lvl == Debug);
    REQUIRE(parse_level("warning", lvl));
    REQUIRE(lvl == Warn);
    REQUIRE(parse_level("trace", lvl));
    REQUIRE(lvl == Trace);

    lvl = Error;
    REQUIRE_FALSE(parse_level("verbose", lvl));
    REQUIRE(lvl == Error);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("should not appear");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("stderr lines carry level and timestamp", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("value: %d, name: %s", 42, "test");
    });
    REQUIRE(output.compare(0, 6, "warn: ") == 0);
    // "warn: HH:MM:SS.mmm value: 42, name: test\n"
    REQUIRE(output.size() > 19);
    REQUIRE(output[8] == ':');
    REQUIRE(output[11] == ':');
    REQUIRE(output[14] == '.');
    REQUIRE(output.find("value: 42, name: test\n") != std::string::npos);
}

TEST_CASE("Sink receives formatted lines instead of stderr", "[log]") {
    set_color_enabled(false);
    std::string output;
    {
        SinkCapture capture;
        set_level(Debug);
        output = capture_stderr([] {
            debug("fetching %s", "main");
            trace("hidden");
        });
        REQUIRE(capture.lines.size() == 1);
        REQUIRE(capture.lines[0].first == Debug);
        REQUIRE(capture.lines[0].second.find("fetching main") != std::string::npos);
    }
    REQUIRE(output.empty());
}

TEST_CASE("Sink is safe to use from several threads", "[log]") {
    SinkCapture capture;
    set_level(Info);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; ++i) info("thread %d line %d", t, i);
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(capture.lines.size() == 200);
}
