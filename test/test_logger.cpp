#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include "certscan/utils/logger.hpp"

using namespace certscan::utils;

namespace {

// 收集日志行的输出
class CaptureOutput : public LogOutput {
public:
    explicit CaptureOutput(std::vector<std::string>& lines) : lines_(lines) {}
    void Write(const std::string& message) override { lines_.push_back(message); }

private:
    std::vector<std::string>& lines_;
};

// 测试结束后恢复全局日志器
class LoggerGuard {
public:
    LoggerGuard() : previous_(GetLogger().GetLevel()) {}
    ~LoggerGuard() { GetLogger().Initialize(LogLevelToString(previous_), "text", "console"); }

private:
    LogLevel previous_;
};

} // namespace

TEST_CASE("日志级别解析", "[logger]") {
    REQUIRE(ParseLogLevel("debug") == LogLevel::Debug);
    REQUIRE(ParseLogLevel("INFO") == LogLevel::Info);
    REQUIRE(ParseLogLevel("warning") == LogLevel::Warn);
    REQUIRE(ParseLogLevel("error") == LogLevel::Error);
    REQUIRE(ParseLogLevel("FATAL") == LogLevel::Fatal);
    REQUIRE(ParseLogLevel("bogus") == LogLevel::Warn);

    REQUIRE(LogLevelToString(LogLevel::Warn) == "WARN");
    REQUIRE(LogLevelToString(LogLevel::Fatal) == "FATAL");
}

TEST_CASE("格式化器输出", "[logger]") {
    LogEntry entry;
    entry.level = LogLevel::Error;
    entry.message = "Failed to describe artifact";
    entry.time = "2024-01-01 00:00:00.000";
    entry.fields = {{"path", "/ca/root.pem"}, {"error", "bad"}};

    SECTION("文本格式") {
        TextFormatter formatter;
        REQUIRE(formatter.Format(entry) ==
                "[2024-01-01 00:00:00.000] [ERROR] Failed to describe artifact {error=bad, path=/ca/root.pem}");
    }

    SECTION("JSON格式") {
        JSONFormatter formatter;
        auto j = nlohmann::json::parse(formatter.Format(entry));
        REQUIRE(j["level"] == "ERROR");
        REQUIRE(j["msg"] == "Failed to describe artifact");
        REQUIRE(j["path"] == "/ca/root.pem");
        REQUIRE(j["error"] == "bad");
    }
}

TEST_CASE("Logger按级别过滤", "[logger]") {
    LoggerGuard guard;
    auto& logger = GetLogger();

    std::vector<std::string> lines;
    logger.ClearOutputs();
    logger.AddOutput(std::make_unique<CaptureOutput>(lines));
    logger.SetFormatter(std::make_unique<TextFormatter>());
    logger.SetLevel("warn");

    logger.Debug("hidden");
    logger.Info("hidden");
    logger.Warn("shown", LogContext().With("path", "a.pem"));
    logger.Error("also shown");

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("[WARN] shown {path=a.pem}") != std::string::npos);
    REQUIRE(lines[1].find("[ERROR] also shown") != std::string::npos);
}
