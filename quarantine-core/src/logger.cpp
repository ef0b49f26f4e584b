//
// Created by WhySkyDie on 21.07.2025.
//


#include "logger.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <ctime>
#include <cctype>
#include <cstdio>
#include <json/json.h>

#include <unistd.h>

namespace LoggingSystem {

    // Реализация Logger::Impl
    class Logger::Impl {
    public:
        LoggerConfig config;
        bool initialized = false;

        mutable std::mutex write_mutex;

        ErrorCallback error_callback;
        std::vector<std::shared_ptr<LogDestinationInterface>> custom_destinations;

        std::unique_ptr<std::ofstream> file_stream;
        std::filesystem::path current_file;

        ~Impl() {
            Shutdown();
        }

        bool InitializeImpl() {
            std::lock_guard<std::mutex> lock(write_mutex);
            if (initialized) {
                return true;
            }

            for (auto destination : config.destinations) {
                if (destination == LogDestination::FILE && !InitializeFileDestination()) {
                    ReportError("Failed to initialize file destination in " +
                                config.log_directory.string());
                }
            }

            initialized = true;
            return true;
        }

        void Shutdown() {
            std::lock_guard<std::mutex> lock(write_mutex);
            if (!initialized) {
                return;
            }

            FlushImpl();
            if (file_stream && file_stream->is_open()) {
                file_stream->close();
            }
            file_stream.reset();
            initialized = false;
        }

        bool InitializeFileDestination() {
            if (config.log_directory.empty()) {
                return false;
            }
            if (!Utils::CreateDirectories(config.log_directory)) {
                return false;
            }

            std::filesystem::path file_path = config.log_directory / GenerateFileName();
            auto stream = std::make_unique<std::ofstream>(file_path, std::ios::app);
            if (!stream->is_open()) {
                return false;
            }

            current_file = file_path;
            file_stream = std::move(stream);
            return true;
        }

        std::string GenerateFileName() const {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm_buf{};
            localtime_r(&now, &tm_buf);

            std::ostringstream oss;
            oss << (config.name.empty() ? "log" : config.name) << "_"
                << std::put_time(&tm_buf, config.file_name_pattern.c_str()) << ".log";
            return oss.str();
        }

        bool ShouldLog(const LogEntry& entry) const {
            if (config.min_level == LogLevel::OFF || entry.level == LogLevel::OFF) {
                return false;
            }
            return entry.level >= config.min_level;
        }

        void ProcessLogEntry(const LogEntry& entry) {
            std::lock_guard<std::mutex> lock(write_mutex);

            std::string formatted_message = FormatLogEntry(entry);

            for (auto destination : config.destinations) {
                try {
                    switch (destination) {
                        case LogDestination::CONSOLE:
                            WriteToConsole(entry, formatted_message);
                            break;
                        case LogDestination::FILE:
                            WriteToFile(formatted_message);
                            break;
                        default:
                            break;
                    }
                } catch (const std::exception& e) {
                    ReportError("Error writing to destination: " + std::string(e.what()));
                }
            }

            for (auto& custom_dest : custom_destinations) {
                try {
                    custom_dest->WriteLog(entry, formatted_message);
                } catch (const std::exception& e) {
                    ReportError("Custom destination " + custom_dest->GetName() + " error: " + e.what());
                }
            }
        }

        std::string FormatLogEntry(const LogEntry& entry) const {
            switch (config.format) {
                case LogFormat::JSON:
                    return FormatAsJson(entry);
                case LogFormat::STRUCTURED:
                    return FormatAsStructured(entry);
                default:
                    return FormatAsPlainText(entry);
            }
        }

        std::string FormatAsJson(const LogEntry& entry) const {
            Json::Value root;

            root["timestamp"] = Utils::FormatTimestamp(entry.timestamp);
            root["level"] = Utils::LogLevelToString(entry.level);
            root["category"] = Utils::LogCategoryToString(entry.category);
            root["logger"] = entry.logger_name;
            root["message"] = entry.message;
            root["process_id"] = entry.process_id;

            if (!entry.function_name.empty()) root["function"] = entry.function_name;
            if (!entry.file_name.empty()) {
                root["file"] = std::filesystem::path(entry.file_name).filename().string();
                root["line"] = entry.line_number;
            }

            if (!entry.fields.empty()) {
                Json::Value fields;
                for (const auto& field : entry.fields) {
                    fields[field.first] = field.second;
                }
                root["fields"] = fields;
            }

            Json::StreamWriterBuilder builder;
            builder["indentation"] = "";
            return Json::writeString(builder, root);
        }

        std::string FormatAsStructured(const LogEntry& entry) const {
            std::ostringstream oss;

            oss << "[" << Utils::FormatTimestamp(entry.timestamp) << "] "
                << "[" << Utils::LogLevelToString(entry.level) << "] "
                << "[" << Utils::LogCategoryToString(entry.category) << "] "
                << entry.message;

            if (!entry.fields.empty()) {
                // Стабильный порядок полей
                std::vector<std::pair<std::string, std::string>> sorted(entry.fields.begin(),
                                                                        entry.fields.end());
                std::sort(sorted.begin(), sorted.end());

                oss << " {";
                bool first = true;
                for (const auto& field : sorted) {
                    if (!first) oss << ", ";
                    oss << field.first << "=" << field.second;
                    first = false;
                }
                oss << "}";
            }

            if (!entry.file_name.empty() && entry.line_number > 0) {
                oss << " (" << std::filesystem::path(entry.file_name).filename().string()
                    << ":" << entry.line_number << ")";
            }

            return oss.str();
        }

        std::string FormatAsPlainText(const LogEntry& entry) const {
            std::ostringstream oss;
            oss << Utils::FormatTimestamp(entry.timestamp) << " "
                << Utils::LogLevelToString(entry.level) << " "
                << entry.message;
            return oss.str();
        }

        void WriteToConsole(const LogEntry& entry, const std::string& formatted_message) {
            // stdout занят выводом команд, журнал всегда идёт в stderr
            const bool colored = config.colored_console && ::isatty(STDERR_FILENO);

            const char* color_code = "";
            const char* reset_code = "";

            if (colored) {
                reset_code = "\033[0m";
                switch (entry.level) {
                    case LogLevel::ERROR:
                    case LogLevel::FATAL:
                        color_code = "\033[1;31m"; // Красный
                        break;
                    case LogLevel::WARNING:
                        color_code = "\033[1;33m"; // Желтый
                        break;
                    case LogLevel::INFO:
                        color_code = "\033[1;32m"; // Зеленый
                        break;
                    case LogLevel::DEBUG:
                        color_code = "\033[1;34m"; // Синий
                        break;
                    default:
                        reset_code = "";
                        break;
                }
            }

            std::cerr << color_code << formatted_message << reset_code << std::endl;
        }

        void WriteToFile(const std::string& formatted_message) {
            if (!file_stream || !file_stream->is_open()) {
                return;
            }

            *file_stream << formatted_message << '\n';
            if (config.auto_flush) {
                file_stream->flush();
            }
        }

        void FlushImpl() {
            if (file_stream && file_stream->is_open()) {
                file_stream->flush();
            }
            for (auto& custom_dest : custom_destinations) {
                custom_dest->Flush();
            }
            std::cerr.flush();
        }

        void ReportError(const std::string& message) const {
            if (error_callback) {
                error_callback(message);
            }
        }
    };

    // Реализация LoggerManager::Impl
    class LoggerManager::Impl {
    public:
        std::unordered_map<std::string, std::shared_ptr<Logger>> loggers;
        mutable std::mutex loggers_mutex;
        LoggerConfig global_config;

        std::shared_ptr<Logger> GetOrCreateLogger(const std::string& name) {
            std::lock_guard<std::mutex> lock(loggers_mutex);

            auto it = loggers.find(name);
            if (it != loggers.end()) {
                return it->second;
            }

            LoggerConfig config = global_config;
            config.name = name;

            auto logger = std::make_shared<Logger>(config);
            logger->Initialize();

            loggers[name] = logger;
            return logger;
        }
    };

    // Logger
    Logger::Logger(const LoggerConfig& config) : pImpl(std::make_unique<Impl>()) {
        pImpl->config = config;
    }

    Logger::~Logger() = default;

    bool Logger::Initialize() {
        return pImpl->InitializeImpl();
    }

    void Logger::Shutdown() {
        pImpl->Shutdown();
    }

    bool Logger::IsInitialized() const {
        std::lock_guard<std::mutex> lock(pImpl->write_mutex);
        return pImpl->initialized;
    }

    const LoggerConfig& Logger::GetConfig() const {
        return pImpl->config;
    }

    void Logger::Log(LogLevel level, LogCategory category, const std::string& message) {
        LogEntry entry;
        entry.level = level;
        entry.category = category;
        entry.message = message;
        Log(entry);
    }

    void Logger::Log(const LogEntry& entry) {
        if (!IsInitialized() || !pImpl->ShouldLog(entry)) {
            return;
        }

        LogEntry processed_entry = entry;
        if (processed_entry.logger_name.empty()) {
            processed_entry.logger_name = pImpl->config.name;
        }
        if (processed_entry.process_id.empty()) {
            processed_entry.process_id = Utils::GetCurrentProcessId();
        }

        pImpl->ProcessLogEntry(processed_entry);
    }

    void Logger::Fatal(const std::string& message) {
        Log(LogLevel::FATAL, LogCategory::GENERAL, message);
    }

    void Logger::LogConfig(LogLevel level, const std::string& message) {
        Log(level, LogCategory::CONFIG, message);
    }

    void Logger::LogWithFields(LogLevel level, LogCategory category, const std::string& message,
                               const std::unordered_map<std::string, std::string>& fields) {
        LogEntry entry;
        entry.level = level;
        entry.category = category;
        entry.message = message;
        entry.fields = fields;
        Log(entry);
    }

    bool Logger::AddCustomDestination(std::shared_ptr<LogDestinationInterface> destination) {
        if (!destination) {
            return false;
        }
        std::lock_guard<std::mutex> lock(pImpl->write_mutex);
        pImpl->custom_destinations.push_back(std::move(destination));
        return true;
    }

    void Logger::SetErrorCallback(ErrorCallback callback) {
        std::lock_guard<std::mutex> lock(pImpl->write_mutex);
        pImpl->error_callback = std::move(callback);
    }

    // LoggerManager
    LoggerManager::LoggerManager() : pImpl(std::make_unique<Impl>()) {}

    LoggerManager::~LoggerManager() = default;

    LoggerManager& LoggerManager::Instance() {
        static LoggerManager instance;
        return instance;
    }

    std::shared_ptr<Logger> LoggerManager::GetLogger(const std::string& name) {
        return pImpl->GetOrCreateLogger(name);
    }

    std::shared_ptr<Logger> LoggerManager::CreateLogger(const std::string& name, const LoggerConfig& config) {
        std::lock_guard<std::mutex> lock(pImpl->loggers_mutex);

        LoggerConfig named_config = config;
        if (named_config.name.empty()) {
            named_config.name = name;
        }

        auto logger = std::make_shared<Logger>(named_config);
        logger->Initialize();

        pImpl->loggers[name] = logger;
        return logger;
    }

    void LoggerManager::SetGlobalConfig(const LoggerConfig& config) {
        std::lock_guard<std::mutex> lock(pImpl->loggers_mutex);
        pImpl->global_config = config;
    }

    void LoggerManager::ShutdownAll() {
        std::lock_guard<std::mutex> lock(pImpl->loggers_mutex);
        for (auto& pair : pImpl->loggers) {
            pair.second->Shutdown();
        }
        pImpl->loggers.clear();
    }

    // Утилитарные функции
    namespace Utils {

        std::string LogLevelToString(LogLevel level) {
            switch (level) {
                case LogLevel::TRACE: return "TRACE";
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO: return "INFO";
                case LogLevel::WARNING: return "WARNING";
                case LogLevel::ERROR: return "ERROR";
                case LogLevel::FATAL: return "FATAL";
                case LogLevel::OFF: return "OFF";
                default: return "UNKNOWN";
            }
        }

        LogLevel StringToLogLevel(const std::string& level_str) {
            std::string upper = level_str;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });

            if (upper == "TRACE") return LogLevel::TRACE;
            if (upper == "DEBUG") return LogLevel::DEBUG;
            if (upper == "INFO") return LogLevel::INFO;
            if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
            if (upper == "ERROR") return LogLevel::ERROR;
            if (upper == "FATAL") return LogLevel::FATAL;
            if (upper == "OFF") return LogLevel::OFF;
            return LogLevel::WARNING; // default
        }

        bool IsValidLogLevel(const std::string& level_str) {
            std::string upper = level_str;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
            static const std::vector<std::string> known = {
                "TRACE", "DEBUG", "INFO", "WARNING", "WARN", "ERROR", "FATAL", "OFF"
            };
            return std::find(known.begin(), known.end(), upper) != known.end();
        }

        std::string LogCategoryToString(LogCategory category) {
            switch (category) {
                case LogCategory::GENERAL: return "GENERAL";
                case LogCategory::DISCOVERY: return "DISCOVERY";
                case LogCategory::QUARANTINE: return "QUARANTINE";
                case LogCategory::RESTORE: return "RESTORE";
                case LogCategory::JOURNAL: return "JOURNAL";
                case LogCategory::CONFIG: return "CONFIG";
                default: return "UNKNOWN";
            }
        }

        LogFormat StringToLogFormat(const std::string& format_str) {
            if (format_str == "plain") return LogFormat::PLAIN_TEXT;
            if (format_str == "json") return LogFormat::JSON;
            return LogFormat::STRUCTURED;
        }

        std::string FormatTimestamp(const std::chrono::system_clock::time_point& timestamp) {
            auto time_t = std::chrono::system_clock::to_time_t(timestamp);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                timestamp.time_since_epoch()) % 1000;

            std::tm tm_buf{};
            gmtime_r(&time_t, &tm_buf);

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
            oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

            return oss.str();
        }

        std::string GetCurrentProcessId() {
            return std::to_string(::getpid());
        }

        bool CreateDirectories(const std::filesystem::path& path) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            return !ec && std::filesystem::is_directory(path, ec);
        }
    }
}
