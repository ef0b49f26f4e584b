//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <fstream>
#include <sstream>
#include <string>
#include <filesystem>
#include <unistd.h>

#include "logger.h"

namespace QuarantineTests {

// ============================================================================
// Mock классы для зависимостей
// ============================================================================

class MockLogDestination : public LoggingSystem::LogDestinationInterface {
public:
    MOCK_METHOD(bool, WriteLog, (const LoggingSystem::LogEntry& entry, const std::string& formatted_message), (override));
    MOCK_METHOD(void, Flush, (), (override));
    MOCK_METHOD(std::string, GetName, (), (const, override));
};

// Логгер без вывода в консоль
inline std::shared_ptr<LoggingSystem::Logger> MakeSilentLogger(LoggingSystem::LogLevel level = LoggingSystem::LogLevel::OFF) {
    LoggingSystem::LoggerConfig config;
    config.name = "test";
    config.min_level = level;
    config.destinations.clear();
    auto logger = std::make_shared<LoggingSystem::Logger>(config);
    logger->Initialize();
    return logger;
}

// ============================================================================
// Базовая фикстура: отдельный временный каталог на каждый тест
// ============================================================================

class TempDirFixture : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = std::filesystem::temp_directory_path() /
                   ("quarantine_test_" + std::to_string(::getpid()) + "_" +
                    info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);

        logger = MakeSilentLogger();
    }

    void TearDown() override {
        // Очистка тестовой директории
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    std::filesystem::path CreateFile(const std::filesystem::path& relative, const std::string& content = "") {
        std::filesystem::path file_path = test_dir / relative;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream file(file_path, std::ios::binary);
        file << content;
        file.close();
        return file_path;
    }

    static std::string ReadFile(const std::filesystem::path& file_path) {
        std::ifstream file(file_path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path test_dir;
    std::shared_ptr<LoggingSystem::Logger> logger;
};

} // namespace QuarantineTests

#endif // TEST_HELPERS_H
