//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef LOGGER_H
#define LOGGER_H

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <mutex>
#include <chrono>
#include <filesystem>
#include <unordered_map>

namespace LoggingSystem {

    // Уровни логирования
    enum class LogLevel {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARNING = 3,
        ERROR = 4,
        FATAL = 5,
        OFF = 6
    };

    // Категории логов
    enum class LogCategory {
        GENERAL,
        DISCOVERY,
        QUARANTINE,
        RESTORE,
        JOURNAL,
        CONFIG
    };

    // Места назначения логов
    enum class LogDestination {
        CONSOLE,
        FILE,
        CUSTOM
    };

    // Формат логов
    enum class LogFormat {
        PLAIN_TEXT,
        JSON,
        STRUCTURED
    };

    // Запись лога
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        LogCategory category;
        std::string logger_name;
        std::string message;
        std::string process_id;
        std::string function_name;
        std::string file_name;
        int line_number;

        std::unordered_map<std::string, std::string> fields;

        LogEntry() : level(LogLevel::INFO), category(LogCategory::GENERAL), line_number(0) {
            timestamp = std::chrono::system_clock::now();
        }
    };

    // Конфигурация логгера
    struct LoggerConfig {
        std::string name;
        LogLevel min_level = LogLevel::WARNING;
        std::vector<LogDestination> destinations;
        LogFormat format = LogFormat::STRUCTURED;

        // Файловые настройки
        std::filesystem::path log_directory;
        std::string file_name_pattern = "%Y%m%d";
        bool auto_flush = true;

        bool colored_console = true;

        LoggerConfig() {
            destinations = {LogDestination::CONSOLE};
        }
    };

    // Интерфейс для пользовательских назначений
    class LogDestinationInterface {
    public:
        virtual ~LogDestinationInterface() = default;
        virtual bool WriteLog(const LogEntry& entry, const std::string& formatted_message) = 0;
        virtual void Flush() = 0;
        virtual std::string GetName() const = 0;
    };

    using ErrorCallback = std::function<void(const std::string& error_message)>;

    // Основной класс логгера
    class Logger {
    public:
        explicit Logger(const LoggerConfig& config);
        ~Logger();

        bool Initialize();
        void Shutdown();
        bool IsInitialized() const;

        const LoggerConfig& GetConfig() const;

        void Log(LogLevel level, LogCategory category, const std::string& message);
        void Log(const LogEntry& entry);

        void Fatal(const std::string& message);

        // Логирование с категорией
        void LogConfig(LogLevel level, const std::string& message);

        void LogWithFields(LogLevel level, LogCategory category, const std::string& message,
                          const std::unordered_map<std::string, std::string>& fields);

        bool AddCustomDestination(std::shared_ptr<LogDestinationInterface> destination);
        void SetErrorCallback(ErrorCallback callback);

    private:
        class Impl;
        std::unique_ptr<Impl> pImpl;
    };

    // Менеджер логгеров (Singleton)
    class LoggerManager {
    public:
        static LoggerManager& Instance();

        std::shared_ptr<Logger> GetLogger(const std::string& name = "default");
        std::shared_ptr<Logger> CreateLogger(const std::string& name, const LoggerConfig& config);

        void SetGlobalConfig(const LoggerConfig& config);
        void ShutdownAll();

    private:
        LoggerManager();
        ~LoggerManager();
        LoggerManager(const LoggerManager&) = delete;
        LoggerManager& operator=(const LoggerManager&) = delete;

        class Impl;
        std::unique_ptr<Impl> pImpl;
    };

    // Макросы для удобного логирования с информацией о файле/строке
    #define LOGGING_SYSTEM_LOG(logger, lvl, cat, msg) \
        do { if (logger) { \
            ::LoggingSystem::LogEntry log_entry_; \
            log_entry_.level = (lvl); \
            log_entry_.category = (cat); \
            log_entry_.message = (msg); \
            log_entry_.file_name = __FILE__; \
            log_entry_.line_number = __LINE__; \
            log_entry_.function_name = __FUNCTION__; \
            (logger)->Log(log_entry_); \
        } } while(0)

    #define LOG_DEBUG(logger, cat, message) \
        LOGGING_SYSTEM_LOG(logger, ::LoggingSystem::LogLevel::DEBUG, cat, message)
    #define LOG_INFO(logger, cat, message) \
        LOGGING_SYSTEM_LOG(logger, ::LoggingSystem::LogLevel::INFO, cat, message)
    #define LOG_WARNING(logger, cat, message) \
        LOGGING_SYSTEM_LOG(logger, ::LoggingSystem::LogLevel::WARNING, cat, message)
    #define LOG_ERROR(logger, cat, message) \
        LOGGING_SYSTEM_LOG(logger, ::LoggingSystem::LogLevel::ERROR, cat, message)

    // Утилитарные функции
    namespace Utils {
        std::string LogLevelToString(LogLevel level);
        LogLevel StringToLogLevel(const std::string& level_str);
        bool IsValidLogLevel(const std::string& level_str);

        std::string LogCategoryToString(LogCategory category);

        LogFormat StringToLogFormat(const std::string& format_str);

        std::string FormatTimestamp(const std::chrono::system_clock::time_point& timestamp);
        std::string GetCurrentProcessId();
        bool CreateDirectories(const std::filesystem::path& path);
    }
}

#endif // LOGGER_H
