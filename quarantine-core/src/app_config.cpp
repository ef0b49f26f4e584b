//
// Created by WhySkyDie on 21.07.2025.
//

#include "app_config.h"
#include <fstream>
#include <sstream>
#include <json/json.h>

namespace AppConfig {

    namespace {

        bool ReadString(const Json::Value& root, const char* key, std::string& value, std::string& error) {
            if (!root.isMember(key)) return true;
            if (!root[key].isString()) {
                error = std::string("'") + key + "' must be a string";
                return false;
            }
            value = root[key].asString();
            return true;
        }

        bool ReadPath(const Json::Value& root, const char* key, std::filesystem::path& value, std::string& error) {
            std::string str = value.string();
            if (!ReadString(root, key, str, error)) return false;
            value = str;
            return true;
        }

        bool ReadBool(const Json::Value& root, const char* key, bool& value, std::string& error) {
            if (!root.isMember(key)) return true;
            if (!root[key].isBool()) {
                error = std::string("'") + key + "' must be a boolean";
                return false;
            }
            value = root[key].asBool();
            return true;
        }
    }

    ConfigManager::ConfigManager() = default;

    ConfigManager::ConfigManager(const Config& config) : config(config) {}

    bool ConfigManager::Load(const std::filesystem::path& config_path) {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            last_error = "Cannot open config file: " + config_path.string();
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        // Применяем только при успешном разборе всего файла
        Config loaded = config;
        std::string error;
        if (!FromJson(buffer.str(), loaded, &error)) {
            last_error = "Invalid config file " + config_path.string() + ": " + error;
            return false;
        }

        config = loaded;
        last_error.clear();
        return true;
    }

    bool ConfigManager::Save(const std::filesystem::path& config_path) const {
        try {
            if (config_path.has_parent_path()) {
                std::filesystem::create_directories(config_path.parent_path());
            }

            std::ofstream file(config_path, std::ios::trunc);
            if (!file.is_open()) {
                last_error = "Cannot write config file: " + config_path.string();
                return false;
            }
            file << ToJson(config) << '\n';
            if (!file) {
                last_error = "Failed writing config file: " + config_path.string();
                return false;
            }
            return true;
        } catch (const std::exception& e) {
            last_error = "Failed to save config: " + std::string(e.what());
            return false;
        }
    }

    const Config& ConfigManager::GetConfig() const {
        return config;
    }

    Config& ConfigManager::GetMutableConfig() {
        return config;
    }

    const std::string& ConfigManager::GetLastError() const {
        return last_error;
    }

    std::string ConfigManager::ToJson(const Config& config) {
        Json::Value root;
        root["base_directory"] = config.base_directory.string();
        root["hidden_marker"] = config.hidden_marker;
        root["quarantine_prefix"] = config.quarantine_prefix;
        root["journal_file_name"] = config.journal_file_name;

        root["recursive"] = config.recursive;
        root["ignore_hidden"] = config.ignore_hidden;
        root["skip_quarantine_directories"] = config.skip_quarantine_directories;
        root["preserve_structure"] = config.preserve_structure;
        root["dry_run"] = config.dry_run;
        root["assume_yes"] = config.assume_yes;
        root["overwrite_on_restore"] = config.overwrite_on_restore;

        root["log_level"] = config.log_level;
        root["log_directory"] = config.log_directory.string();
        root["log_format"] = config.log_format;

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return Json::writeString(builder, root);
    }

    bool ConfigManager::FromJson(const std::string& json_str, Config& config, std::string* error_message) {
        Json::Value root;
        Json::CharReaderBuilder builder;
        std::string errors;
        std::istringstream stream(json_str);

        if (!Json::parseFromStream(builder, stream, &root, &errors)) {
            if (error_message) *error_message = errors;
            return false;
        }

        if (!root.isObject()) {
            if (error_message) *error_message = "top-level value must be an object";
            return false;
        }

        std::string error;
        bool ok = ReadPath(root, "base_directory", config.base_directory, error) &&
                  ReadString(root, "hidden_marker", config.hidden_marker, error) &&
                  ReadString(root, "quarantine_prefix", config.quarantine_prefix, error) &&
                  ReadString(root, "journal_file_name", config.journal_file_name, error) &&
                  ReadBool(root, "recursive", config.recursive, error) &&
                  ReadBool(root, "ignore_hidden", config.ignore_hidden, error) &&
                  ReadBool(root, "skip_quarantine_directories", config.skip_quarantine_directories, error) &&
                  ReadBool(root, "preserve_structure", config.preserve_structure, error) &&
                  ReadBool(root, "dry_run", config.dry_run, error) &&
                  ReadBool(root, "assume_yes", config.assume_yes, error) &&
                  ReadBool(root, "overwrite_on_restore", config.overwrite_on_restore, error) &&
                  ReadString(root, "log_level", config.log_level, error) &&
                  ReadPath(root, "log_directory", config.log_directory, error) &&
                  ReadString(root, "log_format", config.log_format, error);

        if (ok && !LoggingSystem::Utils::IsValidLogLevel(config.log_level)) {
            error = "unknown log_level '" + config.log_level + "'";
            ok = false;
        }
        if (ok && (config.quarantine_prefix.empty() || config.journal_file_name.empty())) {
            error = "quarantine_prefix and journal_file_name must not be empty";
            ok = false;
        }

        if (!ok && error_message) {
            *error_message = error;
        }
        return ok;
    }

    namespace Utils {

        FileUtils::ScanOptions ToScanOptions(const Config& config) {
            FileUtils::ScanOptions options;
            options.recursive = config.recursive;
            options.ignore_hidden = config.ignore_hidden;
            options.hidden_marker = config.hidden_marker;
            options.skip_directory_prefix = config.skip_quarantine_directories ? config.quarantine_prefix : "";
            return options;
        }

        QuarantineEngine::QuarantineConfig ToQuarantineConfig(const Config& config) {
            QuarantineEngine::QuarantineConfig quarantine_config;
            quarantine_config.directory_prefix = config.quarantine_prefix;
            quarantine_config.journal_file_name = config.journal_file_name;
            return quarantine_config;
        }

        LoggingSystem::LoggerConfig ToLoggerConfig(const Config& config) {
            LoggingSystem::LoggerConfig logger_config;
            logger_config.min_level = LoggingSystem::Utils::StringToLogLevel(config.log_level);
            logger_config.format = LoggingSystem::Utils::StringToLogFormat(config.log_format);
            logger_config.destinations = {LoggingSystem::LogDestination::CONSOLE};
            if (!config.log_directory.empty()) {
                logger_config.log_directory = config.log_directory;
                logger_config.destinations.push_back(LoggingSystem::LogDestination::FILE);
            }
            return logger_config;
        }
    }
}
