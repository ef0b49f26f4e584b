//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef CLI_APP_H
#define CLI_APP_H

#pragma once

#include "app_config.h"
#include "quarantine/restore.h"
#include <iosfwd>
#include <memory>
#include <optional>
#include <filesystem>

namespace QuarantineCli {

    // Коды возврата
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_INVALID_ARGUMENTS = 1;

    // Сценарии командной строки: сканирование, восстановление, список
    class Application {
    public:
        Application(const AppConfig::Config& config,
                    std::shared_ptr<LoggingSystem::Logger> logger,
                    std::istream& input, std::ostream& output, std::ostream& error_output);

        // quarantine_base пусто - берётся base_directory из конфигурации
        int RunScan(const std::filesystem::path& target,
                    const std::optional<std::filesystem::path>& quarantine_base);

        // quarantine_directory пусто - последний карантин в base_directory
        int RunRestore(const std::optional<std::filesystem::path>& quarantine_directory);

        int RunList(const std::filesystem::path& base);

    private:
        bool Confirm(const std::string& question);

        void PrintScanPlan(const QuarantineEngine::QuarantineBatchResult& plan);
        void PrintScanSummary(const QuarantineEngine::QuarantineBatchResult& result);
        void PrintRestoreSummary(const QuarantineEngine::RestoreReport& report);

        AppConfig::Config config;
        std::shared_ptr<LoggingSystem::Logger> logger;
        std::istream& input;
        std::ostream& output;
        std::ostream& error_output;
    };
}

#endif // CLI_APP_H
