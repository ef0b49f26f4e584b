//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef RESTORE_H
#define RESTORE_H

#pragma once

#include "quarantine.h"
#include <string>
#include <vector>
#include <memory>
#include <filesystem>

namespace QuarantineEngine {

    struct RestoreItem {
        std::filesystem::path original;
        std::filesystem::path moved_to;
        std::filesystem::path restored_to; // original или соседний file_N
        std::string message;               // причина пропуска или текст ошибки
    };

    struct RestoreReport {
        std::filesystem::path quarantine_directory;
        JournalStatus journal_status;
        bool dry_run;

        std::vector<RestoreItem> restored;
        std::vector<RestoreItem> skipped;
        std::vector<RestoreItem> errors;

        RestoreReport() : journal_status(JournalStatus::ABSENT), dry_run(false) {}
    };

    // Возврат файлов по журналу на исходные места
    class RestoreEngine {
    public:
        explicit RestoreEngine(const QuarantineConfig& config,
                               std::shared_ptr<LoggingSystem::Logger> logger = nullptr);
        ~RestoreEngine();

        // Журнал не изменяется; исключения не выходят за пределы вызова
        RestoreReport Restore(const std::filesystem::path& quarantine_directory,
                              bool dry_run, bool overwrite) const;

    private:
        class Impl;
        std::unique_ptr<Impl> pImpl;
    };

    namespace Utils {
        extern const char* const SKIP_REASON_MOVED_FILE_MISSING;
        extern const char* const SKIP_REASON_DRY_RUN_RECORD;
    }
}

#endif // RESTORE_H
