//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef COMMAND_LINE_H
#define COMMAND_LINE_H

#pragma once

#include "app_config.h"
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace QuarantineCli {

    // Параметры командной строки; пустые optional не перекрывают конфигурацию
    struct CommandLineOptions {
        std::filesystem::path target = ".";
        std::optional<std::filesystem::path> quarantine;
        std::optional<std::filesystem::path> config_file;

        bool restore = false;
        bool list_quarantines = false;
        bool help = false;
        bool verbose = false;

        std::optional<bool> recursive;
        std::optional<bool> ignore_hidden;
        std::optional<bool> dry_run;
        std::optional<bool> assume_yes;
        std::optional<bool> preserve_structure;
        std::optional<bool> overwrite;

        std::optional<std::string> log_level;
        std::optional<std::filesystem::path> log_directory;
    };

    struct ParseResult {
        bool success;
        std::string error_message;
        CommandLineOptions options;

        ParseResult() : success(false) {}
    };

    ParseResult ParseCommandLine(const std::vector<std::string>& arguments);
    ParseResult ParseCommandLine(int argc, char* argv[]);

    // Флаги поверх значений из файла конфигурации
    void ApplyOverrides(const CommandLineOptions& options, AppConfig::Config& config);

    std::string Usage(const std::string& program_name);
}

#endif // COMMAND_LINE_H
