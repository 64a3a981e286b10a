#include <catch2/catch_test_macros.hpp>

#include <mcp_relay/core/log.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_relay;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back(
            {level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

// ===========================================================================
// ConsoleSink
// ===========================================================================

TEST_CASE("ConsoleSink: timestamp, level, component and message", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(oss);

    sink.Write(LogLevel::Info, "http", "POST /mcp/tools/call 200");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[http]") != std::string::npos);
    CHECK(output.find("POST /mcp/tools/call 200") != std::string::npos);
    // ISO-8601 UTC timestamp first.
    CHECK(output.find('T') == 10);
    CHECK(output.find('Z') != std::string::npos);
    CHECK(output.back() == '\n');
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "process", "started");

    auto line = oss.str();
    CHECK(line.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(line.find("\"component\":\"process\"") != std::string::npos);
    CHECK(line.find("\"message\":\"started\"") != std::string::npos);
    CHECK(line.find("\"ts\":\"") != std::string::npos);
    // Must end with newline
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: each write produces one line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "a", "first");
    sink.Write(LogLevel::Warn, "b", "second");

    auto output = oss.str();
    // Count newlines — should be exactly 2
    auto count = std::count(output.begin(), output.end(), '\n');
    CHECK(count == 2);
}

TEST_CASE("JsonSink: all log levels produce correct names", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "x", "d");
    sink.Write(LogLevel::Info, "x", "i");
    sink.Write(LogLevel::Warn, "x", "w");
    sink.Write(LogLevel::Error, "x", "e");

    auto output = oss.str();
    CHECK(output.find("\"level\":\"DEBUG\"") != std::string::npos);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"level\":\"WARN\"") != std::string::npos);
    CHECK(output.find("\"level\":\"ERROR\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "line1\nline2\ttab \"quoted\" back\\slash");

    auto output = oss.str();
    CHECK(output.find("\\n") != std::string::npos);
    CHECK(output.find("\\t") != std::string::npos);
    CHECK(output.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(output.find("back\\\\slash") != std::string::npos);
}

// ===========================================================================
// Logger: level filtering
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "should be filtered");
    logger.Info("c", "should be filtered");
    logger.Warn("c", "should pass");
    logger.Error("c", "should pass");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: Debug level passes all messages", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.Debug("c", "d");
    logger.Info("c", "i");
    logger.Warn("c", "w");
    logger.Error("c", "e");

    CHECK(sink_ptr->messages.size() == 4);
}

TEST_CASE("Logger: Error level only passes errors", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Debug("c", "d");
    logger.Info("c", "i");
    logger.Warn("c", "w");
    logger.Error("c", "e");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering dynamically", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());

    logger.SetLevel(LogLevel::Info);
    logger.Info("c", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].message == "now passes");
}

// ===========================================================================
// Logger: message content
// ===========================================================================

TEST_CASE("Logger: preserves component and message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.Info("router", "tools/call dispatched");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "router");
    CHECK(sink_ptr->messages[0].message == "tools/call dispatched");
    CHECK(sink_ptr->messages[0].level == LogLevel::Info);
}

// ===========================================================================
// Logger: thread safety
// ===========================================================================

TEST_CASE("Logger: concurrent logging does not crash", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("thread-" + std::to_string(t),
                            "msg-" + std::to_string(i));
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->messages.size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// FileSink / TeeSink
// ===========================================================================

namespace {

std::string TempLogPath(const std::string& name) {
    return "/tmp/mcp_relay_test_" + name + "_" +
           std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) + ".log";
}

std::string ReadAll(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // anonymous namespace

TEST_CASE("FileSink: appends plain lines", "[log]") {
    auto path = TempLogPath("plain");
    std::remove(path.c_str());
    {
        FileSink sink(path, false);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Warn, "server", "restarting");
    }
    {
        FileSink sink(path, false);
        sink.Write(LogLevel::Info, "server", "ready");
    }

    auto content = ReadAll(path);
    CHECK(std::count(content.begin(), content.end(), '\n') == 2);
    CHECK(content.find("[WARN] [server] restarting") != std::string::npos);
    CHECK(content.find("[INFO] [server] ready") != std::string::npos);
    std::remove(path.c_str());
}

TEST_CASE("FileSink: JSON mode", "[log]") {
    auto path = TempLogPath("json");
    std::remove(path.c_str());
    {
        FileSink sink(path, true);
        sink.Write(LogLevel::Error, "audit", "decision=deny");
    }
    auto content = ReadAll(path);
    CHECK(content.find("\"component\":\"audit\"") != std::string::npos);
    CHECK(content.find("\"message\":\"decision=deny\"") != std::string::npos);
    std::remove(path.c_str());
}

TEST_CASE("FileSink: unopenable path is not open", "[log]") {
    FileSink sink("/nonexistent/dir/relay.log", false);
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Info, "x", "dropped");
}

TEST_CASE("TeeSink: writes to every sink", "[log]") {
    auto first = std::make_unique<CaptureSink>();
    auto second = std::make_unique<CaptureSink>();
    auto* first_ptr = first.get();
    auto* second_ptr = second.get();

    std::vector<std::unique_ptr<ILogSink>> sinks;
    sinks.push_back(std::move(first));
    sinks.push_back(std::move(second));
    TeeSink tee(std::move(sinks));

    tee.Write(LogLevel::Info, "bridge", "connected");

    REQUIRE(first_ptr->messages.size() == 1);
    REQUIRE(second_ptr->messages.size() == 1);
    CHECK(second_ptr->messages[0].message == "connected");
}

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: known names, any case", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("warn") == LogLevel::Warn);
    CHECK(ParseLogLevel("Warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
}

TEST_CASE("ParseLogLevel: unknown name", "[log]") {
    CHECK_FALSE(ParseLogLevel("verbose").has_value());
    CHECK_FALSE(ParseLogLevel("").has_value());
}
