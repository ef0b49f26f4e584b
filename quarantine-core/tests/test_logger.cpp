//
// Created by WhySkyDie on 21.07.2025.
//

#include "test_helpers.h"
#include "logger.h"

#include <json/json.h>

#include <iostream>
#include <sstream>

using namespace testing;

namespace QuarantineTests {

class LoggerTest : public TempDirFixture {};

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    // Arrange
    auto observed = MakeSilentLogger(LoggingSystem::LogLevel::WARNING);
    auto destination = std::make_shared<StrictMock<MockLogDestination>>();
    observed->AddCustomDestination(destination);

    EXPECT_CALL(*destination, WriteLog(Field(&LoggingSystem::LogEntry::level, LoggingSystem::LogLevel::ERROR), _))
        .WillOnce(Return(true));
    EXPECT_CALL(*destination, Flush()).Times(AnyNumber());

    // Act
    LOG_INFO(observed, LoggingSystem::LogCategory::GENERAL, "ignored");
    LOG_DEBUG(observed, LoggingSystem::LogCategory::GENERAL, "ignored");
    LOG_ERROR(observed, LoggingSystem::LogCategory::GENERAL, "kept");
}

TEST_F(LoggerTest, MacroAttachesSourceLocationAndCategory) {
    auto observed = MakeSilentLogger(LoggingSystem::LogLevel::TRACE);
    auto destination = std::make_shared<NiceMock<MockLogDestination>>();
    observed->AddCustomDestination(destination);

    LoggingSystem::LogEntry captured;
    EXPECT_CALL(*destination, WriteLog(_, _))
        .WillOnce(DoAll(SaveArg<0>(&captured), Return(true)));

    LOG_INFO(observed, LoggingSystem::LogCategory::RESTORE, "restored something");

    EXPECT_EQ(captured.category, LoggingSystem::LogCategory::RESTORE);
    EXPECT_EQ(captured.message, "restored something");
    EXPECT_THAT(captured.file_name, HasSubstr("test_logger.cpp"));
    EXPECT_GT(captured.line_number, 0);
    EXPECT_EQ(captured.logger_name, "test");
}

TEST_F(LoggerTest, StructuredFormatSortsFields) {
    auto observed = MakeSilentLogger(LoggingSystem::LogLevel::TRACE);
    auto destination = std::make_shared<NiceMock<MockLogDestination>>();
    observed->AddCustomDestination(destination);

    std::string formatted;
    EXPECT_CALL(*destination, WriteLog(_, _))
        .WillOnce(DoAll(SaveArg<1>(&formatted), Return(true)));

    observed->LogWithFields(LoggingSystem::LogLevel::INFO, LoggingSystem::LogCategory::JOURNAL, "done",
                            {{"zeta", "1"}, {"alpha", "2"}});

    EXPECT_THAT(formatted, HasSubstr("[INFO] [JOURNAL] done {alpha=2, zeta=1}"));
}

TEST_F(LoggerTest, JsonFormatIsOneObjectPerLine) {
    LoggingSystem::LoggerConfig config;
    config.name = "json";
    config.min_level = LoggingSystem::LogLevel::TRACE;
    config.format = LoggingSystem::LogFormat::JSON;
    config.destinations.clear();
    LoggingSystem::Logger json_logger(config);
    json_logger.Initialize();

    auto destination = std::make_shared<NiceMock<MockLogDestination>>();
    json_logger.AddCustomDestination(destination);

    std::string formatted;
    EXPECT_CALL(*destination, WriteLog(_, _))
        .WillOnce(DoAll(SaveArg<1>(&formatted), Return(true)));

    json_logger.Log(LoggingSystem::LogLevel::WARNING, LoggingSystem::LogCategory::GENERAL, "careful");

    EXPECT_EQ(formatted.find('\n'), std::string::npos);
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(formatted);
    ASSERT_TRUE(Json::parseFromStream(builder, stream, &root, &errors)) << errors;
    EXPECT_EQ(root["level"].asString(), "WARNING");
    EXPECT_EQ(root["message"].asString(), "careful");
    EXPECT_EQ(root["logger"].asString(), "json");
}

TEST_F(LoggerTest, FileDestinationAppends) {
    LoggingSystem::LoggerConfig config;
    config.name = "filelog";
    config.min_level = LoggingSystem::LogLevel::INFO;
    config.destinations = {LoggingSystem::LogDestination::FILE};
    config.log_directory = test_dir / "logs";

    {
        LoggingSystem::Logger file_logger(config);
        ASSERT_TRUE(file_logger.Initialize());
        file_logger.Log(LoggingSystem::LogLevel::INFO, LoggingSystem::LogCategory::GENERAL, "first line");
        file_logger.Log(LoggingSystem::LogLevel::INFO, LoggingSystem::LogCategory::GENERAL, "second line");
        file_logger.Shutdown();
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(test_dir / "logs")) {
        files.push_back(entry.path());
    }
    ASSERT_EQ(files.size(), 1u);
    EXPECT_THAT(files[0].filename().string(), StartsWith("filelog_"));

    const std::string content = ReadFile(files[0]);
    EXPECT_THAT(content, HasSubstr("first line"));
    EXPECT_THAT(content, HasSubstr("second line"));
}

TEST_F(LoggerTest, NotInitializedLoggerDropsEntries) {
    LoggingSystem::LoggerConfig config;
    config.min_level = LoggingSystem::LogLevel::TRACE;
    config.destinations.clear();
    LoggingSystem::Logger idle(config);

    auto destination = std::make_shared<StrictMock<MockLogDestination>>();
    EXPECT_CALL(*destination, Flush()).Times(AnyNumber());
    idle.AddCustomDestination(destination);

    idle.Log(LoggingSystem::LogLevel::ERROR, LoggingSystem::LogCategory::GENERAL, "nobody hears this");
    EXPECT_FALSE(idle.IsInitialized());
}

TEST_F(LoggerTest, ConsoleOutputNeverTouchesStdout) {
    LoggingSystem::LoggerConfig config;
    config.name = "console";
    config.min_level = LoggingSystem::LogLevel::TRACE;
    config.destinations = {LoggingSystem::LogDestination::CONSOLE};
    config.colored_console = false;

    std::ostringstream captured_out;
    std::ostringstream captured_err;
    std::streambuf* old_out = std::cout.rdbuf(captured_out.rdbuf());
    std::streambuf* old_err = std::cerr.rdbuf(captured_err.rdbuf());
    {
        LoggingSystem::Logger console_logger(config);
        console_logger.Initialize();
        console_logger.Log(LoggingSystem::LogLevel::INFO, LoggingSystem::LogCategory::DISCOVERY, "info line");
        console_logger.Log(LoggingSystem::LogLevel::ERROR, LoggingSystem::LogCategory::DISCOVERY, "error line");
        console_logger.Shutdown();
    }
    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);

    EXPECT_TRUE(captured_out.str().empty());
    EXPECT_THAT(captured_err.str(), HasSubstr("info line"));
    EXPECT_THAT(captured_err.str(), HasSubstr("error line"));
}

TEST(LoggerManagerTest, GetLoggerReturnsSameInstance) {
    auto& manager = LoggingSystem::LoggerManager::Instance();

    auto first = manager.GetLogger("manager_test");
    auto second = manager.GetLogger("manager_test");

    EXPECT_EQ(first, second);
    EXPECT_TRUE(first->IsInitialized());
    EXPECT_EQ(first->GetConfig().name, "manager_test");
}

TEST(LoggerUtilsTest, LevelParsing) {
    using namespace LoggingSystem;

    EXPECT_EQ(Utils::StringToLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Utils::StringToLogLevel("WARN"), LogLevel::WARNING);
    EXPECT_EQ(Utils::StringToLogLevel("garbage"), LogLevel::WARNING);
    EXPECT_TRUE(Utils::IsValidLogLevel("Error"));
    EXPECT_FALSE(Utils::IsValidLogLevel("loud"));
    EXPECT_EQ(Utils::LogLevelToString(LogLevel::FATAL), "FATAL");
    EXPECT_EQ(Utils::StringToLogFormat("json"), LogFormat::JSON);
    EXPECT_THAT(Utils::FormatTimestamp(std::chrono::system_clock::now()),
                MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}\\.[0-9]{3}Z"));
}

} // namespace QuarantineTests
