#include <catch2/catch_test_macros.hpp>
#include "structree/logger.hpp"
#include "structree/perf.hpp"

#include <filesystem>
#include <sstream>

using namespace structree;

namespace {

// Restores the process-wide logger after each test.
class LoggerCapture {
public:
    explicit LoggerCapture(LogLevel level)
        : previous_{Logger::instance().level()} {
        Logger::instance().set_output(&stream_);
        Logger::instance().set_level(level);
    }

    ~LoggerCapture() {
        Logger::instance().set_output(nullptr);
        Logger::instance().set_level(previous_);
    }

    std::string text() const { return stream_.str(); }

private:
    std::ostringstream stream_;
    LogLevel previous_;
};

} // namespace

TEST_CASE("messages above the threshold are dropped") {
    LoggerCapture capture{LogLevel::Warn};
    Logger::instance().debug("hidden {}", 1);
    Logger::instance().info("hidden too");
    CHECK(capture.text().empty());

    Logger::instance().warn("kept {}", "warning");
    CHECK(capture.text().find("warn | kept warning") != std::string::npos);
}

TEST_CASE("lines carry a timestamp and the level") {
    LoggerCapture capture{LogLevel::Trace};
    Logger::instance().error("failure in {}", "walk");
    const auto text = capture.text();
    REQUIRE(text.size() > 9);
    CHECK(text[2] == ':');
    CHECK(text[5] == ':');
    CHECK(text.find(" error | failure in walk\n") != std::string::npos);
}

TEST_CASE("scoped timers log at debug") {
    LoggerCapture capture{LogLevel::Debug};
    {
        ScopedTimer timer{"phase"};
    }
    CHECK(capture.text().find("debug | phase took ") != std::string::npos);
    CHECK(capture.text().find("item(s)") == std::string::npos);
}

TEST_CASE("scoped timers name the path and the result size") {
    LoggerCapture capture{LogLevel::Debug};
    const std::filesystem::path root{"/srv/project"};
    {
        ScopedTimer timer{"search", root};
        CHECK(timer.label() == "search " + root.string());
        timer.set_items(3);
    }
    const auto text = capture.text();
    CHECK(text.find("debug | search " + root.string() + " took ") != std::string::npos);
    CHECK(text.find(" us, 3 item(s)\n") != std::string::npos);
}

TEST_CASE("scoped timers respect the logger threshold") {
    LoggerCapture capture{LogLevel::Info};
    {
        ScopedTimer timer{"tree walk", std::filesystem::path{"/tmp"}};
    }
    CHECK(capture.text().empty());
}

TEST_CASE("level names") {
    CHECK(Logger::level_to_string(LogLevel::Error) == "error");
    CHECK(Logger::level_to_string(LogLevel::Trace) == "trace");
}
