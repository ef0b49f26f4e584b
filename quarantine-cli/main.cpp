//
// Created by WhySkyDie on 21.07.2025.
//

#include <iostream>
#include <memory>
#include <filesystem>

#include "logger.h"
#include "app_config.h"
#include "command_line.h"
#include "cli_app.h"

int main(int argc, char* argv[]) {
    const std::string program_name = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "quarantine-cli";

    // Обработка аргументов командной строки
    const QuarantineCli::ParseResult parsed = QuarantineCli::ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << parsed.error_message << "\n\n" << QuarantineCli::Usage(program_name);
        return QuarantineCli::EXIT_INVALID_ARGUMENTS;
    }

    const QuarantineCli::CommandLineOptions& options = parsed.options;
    if (options.help) {
        std::cout << QuarantineCli::Usage(program_name);
        return QuarantineCli::EXIT_OK;
    }

    // Текущий каталог читается только здесь
    AppConfig::ConfigManager config_manager;
    {
        std::error_code ec;
        const std::filesystem::path cwd = std::filesystem::current_path(ec);
        config_manager.GetMutableConfig().base_directory = ec ? std::filesystem::path(".") : cwd;
    }

    if (options.config_file && !config_manager.Load(*options.config_file)) {
        std::cerr << config_manager.GetLastError() << "\n";
        return QuarantineCli::EXIT_INVALID_ARGUMENTS;
    }

    AppConfig::Config config = config_manager.GetConfig();
    QuarantineCli::ApplyOverrides(options, config);

    // Логгер
    LoggingSystem::LoggerConfig logger_config = AppConfig::Utils::ToLoggerConfig(config);
    logger_config.name = QuarantineEngine::DEFAULT_LOGGER_NAME;
    LoggingSystem::LoggerManager::Instance().SetGlobalConfig(logger_config);
    auto logger = LoggingSystem::LoggerManager::Instance().CreateLogger(QuarantineEngine::DEFAULT_LOGGER_NAME,
                                                                        logger_config);
    logger->SetErrorCallback([](const std::string& error_message) {
        std::cerr << "Logger error: " << error_message << "\n";
    });
    if (options.config_file) {
        logger->LogConfig(LoggingSystem::LogLevel::INFO, "Loaded configuration from " + options.config_file->string());
    }

    int exit_code = QuarantineCli::EXIT_OK;
    try {
        QuarantineCli::Application app(config, logger, std::cin, std::cout, std::cerr);

        if (options.list_quarantines) {
            exit_code = app.RunList(options.target);
        } else if (options.restore) {
            exit_code = app.RunRestore(options.quarantine);
        } else {
            exit_code = app.RunScan(options.target, options.quarantine);
        }
    } catch (const std::exception& e) {
        logger->Fatal(std::string("Unhandled exception: ") + e.what());
        std::cerr << "Exception: " << e.what() << "\n";
        exit_code = QuarantineCli::EXIT_INVALID_ARGUMENTS;
    }

    LoggingSystem::LoggerManager::Instance().ShutdownAll();
    return exit_code;
}
