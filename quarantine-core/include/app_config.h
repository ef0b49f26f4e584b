//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef APP_CONFIG_H
#define APP_CONFIG_H

#pragma once

#include "logger.h"
#include "file_utils.h"
#include "quarantine/quarantine.h"
#include <string>
#include <filesystem>

namespace AppConfig {

    // Настройки приложения; флаги командной строки перекрывают значения из файла
    struct Config {
        std::filesystem::path base_directory;      // задаётся в main из текущего каталога
        std::string hidden_marker = ".";
        std::string quarantine_prefix = QuarantineEngine::DEFAULT_QUARANTINE_PREFIX;
        std::string journal_file_name = QuarantineEngine::DEFAULT_JOURNAL_FILE_NAME;

        bool recursive = true;
        bool ignore_hidden = true;
        bool skip_quarantine_directories = true;
        bool preserve_structure = false;
        bool dry_run = false;
        bool assume_yes = false;
        bool overwrite_on_restore = false;

        // Логирование
        std::string log_level = "WARNING";
        std::filesystem::path log_directory;       // пусто - только консоль
        std::string log_format = "structured";
    };

    class ConfigManager {
    public:
        ConfigManager();
        explicit ConfigManager(const Config& config);

        // Отсутствующие ключи сохраняют текущие значения, неизвестные игнорируются
        bool Load(const std::filesystem::path& config_path);
        bool Save(const std::filesystem::path& config_path) const;

        const Config& GetConfig() const;
        Config& GetMutableConfig();

        const std::string& GetLastError() const;

        static std::string ToJson(const Config& config);
        static bool FromJson(const std::string& json_str, Config& config, std::string* error_message = nullptr);

    private:
        Config config;
        mutable std::string last_error;
    };

    namespace Utils {
        FileUtils::ScanOptions ToScanOptions(const Config& config);
        QuarantineEngine::QuarantineConfig ToQuarantineConfig(const Config& config);
        LoggingSystem::LoggerConfig ToLoggerConfig(const Config& config);
    }
}

#endif // APP_CONFIG_H
