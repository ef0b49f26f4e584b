//
// Created by WhySkyDie on 21.07.2025.
//

#include "restore.h"
#include "path_namer.h"
#include "file_utils.h"
#include "logger.h"

namespace QuarantineEngine {

    namespace fs = std::filesystem;

    namespace Utils {
        const char* const SKIP_REASON_MOVED_FILE_MISSING = "moved file missing";
        const char* const SKIP_REASON_DRY_RUN_RECORD = "dry-run record, not replayed";
    }

    // Реализация RestoreEngine::Impl
    class RestoreEngine::Impl {
    public:
        QuarantineConfig config;
        std::shared_ptr<LoggingSystem::Logger> logger;
        Mover mover;

        Impl(const QuarantineConfig& config, std::shared_ptr<LoggingSystem::Logger> logger)
            : config(config), logger(Utils::ResolveLogger(std::move(logger))), mover(this->logger) {}

        void Skip(RestoreReport& report, const MoveRecord& record, const std::string& reason) const {
            RestoreItem item;
            item.original = record.original;
            item.moved_to = record.moved_to;
            item.message = reason;
            report.skipped.push_back(item);

            LOG_INFO(logger, LoggingSystem::LogCategory::RESTORE,
                     "Skipped " + record.moved_to.string() + " -> " + record.original.string() + ": " + reason);
        }

        void Fail(RestoreReport& report, const MoveRecord& record, const std::string& error_message) const {
            RestoreItem item;
            item.original = record.original;
            item.moved_to = record.moved_to;
            item.message = error_message;
            report.errors.push_back(item);

            LOG_ERROR(logger, LoggingSystem::LogCategory::RESTORE,
                      "Error restoring " + record.moved_to.string() + " -> " + record.original.string() +
                      ": " + error_message);
        }

        void Succeed(RestoreReport& report, const MoveRecord& record, const fs::path& restored_to) const {
            RestoreItem item;
            item.original = record.original;
            item.moved_to = record.moved_to;
            item.restored_to = restored_to;
            report.restored.push_back(item);

            LOG_INFO(logger, LoggingSystem::LogCategory::RESTORE,
                     std::string(report.dry_run ? "Would restore " : "Restored ") +
                     restored_to.string() + " <- " + record.moved_to.string());
        }

        // Перемещение в свободное соседнее имя; возвращает итоговый путь
        fs::path RelocateToSibling(const MoveRecord& record, bool dry_run) const {
            const fs::path candidate = PathNamer::Unique(record.original);
            if (!dry_run) {
                mover.Relocate(record.moved_to, candidate);
            }
            return candidate;
        }

        void RemoveOriginal(const fs::path& original) const {
            std::error_code ec;
            if (fs::is_directory(fs::symlink_status(original, ec))) {
                throw IOError("Original is a directory: " + original.string(), original,
                              std::make_error_code(std::errc::is_a_directory));
            }
            if (!fs::remove(original, ec) || ec) {
                throw IOError("Cannot remove " + original.string(), original, ec);
            }
        }

        void RestoreWithOverwrite(RestoreReport& report, const MoveRecord& record, bool dry_run) const {
            if (dry_run) {
                // Каталог перезаписать нельзя, реальный проход уйдёт в соседнее имя
                std::error_code ec;
                if (fs::is_directory(fs::symlink_status(record.original, ec))) {
                    Succeed(report, record, RelocateToSibling(record, true));
                } else {
                    Succeed(report, record, record.original);
                }
                return;
            }

            // Не удаляем original, если возвращать уже нечего
            if (!FileUtils::PathUtils::PathExists(record.moved_to)) {
                Skip(report, record, Utils::SKIP_REASON_MOVED_FILE_MISSING);
                return;
            }

            std::string overwrite_error;
            try {
                RemoveOriginal(record.original);
                mover.Relocate(record.moved_to, record.original);
                Succeed(report, record, record.original);
                return;
            } catch (const std::exception& e) {
                overwrite_error = e.what();
                LOG_WARNING(logger, LoggingSystem::LogCategory::RESTORE,
                            "Overwrite failed for " + record.original.string() + ", trying a sibling name: " +
                            overwrite_error);
            }

            try {
                Succeed(report, record, RelocateToSibling(record, dry_run));
            } catch (const std::exception& e) {
                Fail(report, record, "overwrite error: " + overwrite_error + "; fallback failed: " + e.what());
            }
        }

        void RestoreRecord(RestoreReport& report, const MoveRecord& record, bool dry_run, bool overwrite) const {
            if (record.action == MoveAction::DRY_RUN) {
                Skip(report, record, Utils::SKIP_REASON_DRY_RUN_RECORD);
                return;
            }

            if (!FileUtils::PathUtils::PathExists(record.moved_to)) {
                Skip(report, record, Utils::SKIP_REASON_MOVED_FILE_MISSING);
                return;
            }

            const fs::path target_parent = record.original.parent_path();
            std::error_code ec;
            if (!target_parent.empty() && !fs::exists(target_parent, ec)) {
                if (!dry_run) {
                    fs::create_directories(target_parent, ec);
                    if (ec) {
                        Fail(report, record, "failed to create parent: " + ec.message());
                        return;
                    }
                }
            }

            if (FileUtils::PathUtils::PathExists(record.original)) {
                if (overwrite) {
                    RestoreWithOverwrite(report, record, dry_run);
                    return;
                }

                // Без перезаписи original не трогаем
                try {
                    Succeed(report, record, RelocateToSibling(record, dry_run));
                } catch (const std::exception& e) {
                    Fail(report, record, "collision handling error: " + std::string(e.what()));
                }
                return;
            }

            try {
                if (!dry_run) {
                    mover.Relocate(record.moved_to, record.original);
                }
                Succeed(report, record, record.original);
            } catch (const std::exception& e) {
                Fail(report, record, "move error: " + std::string(e.what()));
            }
        }
    };

    RestoreEngine::RestoreEngine(const QuarantineConfig& config, std::shared_ptr<LoggingSystem::Logger> logger)
        : pImpl(std::make_unique<Impl>(config, std::move(logger))) {}

    RestoreEngine::~RestoreEngine() = default;

    RestoreReport RestoreEngine::Restore(const fs::path& quarantine_directory, bool dry_run, bool overwrite) const {
        RestoreReport report;
        report.quarantine_directory = quarantine_directory;
        report.dry_run = dry_run;

        Journal journal(quarantine_directory, pImpl->logger, pImpl->config.journal_file_name);
        const std::vector<MoveRecord> records = journal.Load(&report.journal_status);

        if (report.journal_status != JournalStatus::OK) {
            LOG_WARNING(pImpl->logger, LoggingSystem::LogCategory::RESTORE,
                        "Nothing to restore from " + quarantine_directory.string() + ": journal " +
                        Utils::JournalStatusToString(report.journal_status));
            return report;
        }

        for (const auto& record : records) {
            pImpl->RestoreRecord(report, record, dry_run, overwrite);
        }

        pImpl->logger->LogWithFields(LoggingSystem::LogLevel::INFO, LoggingSystem::LogCategory::RESTORE,
                                     dry_run ? "Restore plan prepared" : "Restore finished",
                                     {{"directory", quarantine_directory.string()},
                                      {"restored", std::to_string(report.restored.size())},
                                      {"skipped", std::to_string(report.skipped.size())},
                                      {"errors", std::to_string(report.errors.size())}});
        return report;
    }
}
