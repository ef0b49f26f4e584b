//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef QUARANTINE_H
#define QUARANTINE_H

#pragma once

#include "move_record.h"
#include "mover.h"
#include "journal.h"
#include "quarantine_directory.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <filesystem>

namespace LoggingSystem {
    class Logger;
}

namespace QuarantineEngine {

    // Конфигурация карантина
    struct QuarantineConfig {
        std::string directory_prefix = DEFAULT_QUARANTINE_PREFIX;
        std::string journal_file_name = DEFAULT_JOURNAL_FILE_NAME;
    };

    struct QuarantineFailure {
        std::filesystem::path source;
        std::string error_message;
    };

    // Результат одного прохода карантина
    struct QuarantineBatchResult {
        bool success;                       // каталог карантина готов
        std::string error_message;
        std::filesystem::path quarantine_directory;
        bool dry_run;

        std::vector<MoveOutcome> outcomes;  // в порядке обнаружения, включая dry-run
        std::vector<QuarantineFailure> failures;

        bool journal_written;
        std::string journal_error;

        QuarantineBatchResult() : success(false), dry_run(false), journal_written(false) {}

        std::vector<MoveRecord> Records() const;
    };

    // Callback типы
    using MoveCallback = std::function<void(const std::filesystem::path& source, const MoveOutcome& outcome)>;
    using ErrorCallback = std::function<void(const std::string& error_message,
                                           const std::filesystem::path& file_path)>;

    // Основной класс управления карантином
    class QuarantineManager {
    public:
        explicit QuarantineManager(const QuarantineConfig& config,
                                   std::shared_ptr<LoggingSystem::Logger> logger = nullptr);
        ~QuarantineManager();

        QuarantineBatchResult Run(const std::vector<std::filesystem::path>& discovered_files,
                                  const std::filesystem::path& quarantine_directory,
                                  bool preserve_structure,
                                  const std::filesystem::path& structure_root,
                                  bool dry_run);

        void SetMoveCallback(MoveCallback callback);
        void SetErrorCallback(ErrorCallback callback);

    private:
        class Impl;
        std::unique_ptr<Impl> pImpl;
    };
}

#endif // QUARANTINE_H
