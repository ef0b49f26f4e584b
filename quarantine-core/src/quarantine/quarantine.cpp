//
// Created by WhySkyDie on 21.07.2025.
//

#include "quarantine.h"
#include "file_utils.h"
#include "logger.h"

namespace QuarantineEngine {

    namespace fs = std::filesystem;

    std::vector<MoveRecord> QuarantineBatchResult::Records() const {
        std::vector<MoveRecord> records;
        records.reserve(outcomes.size());
        for (const auto& outcome : outcomes) {
            records.push_back(outcome.record);
        }
        return records;
    }

    // Реализация QuarantineManager::Impl
    class QuarantineManager::Impl {
    public:
        QuarantineConfig config;
        std::shared_ptr<LoggingSystem::Logger> logger;
        Mover mover;
        QuarantineDirectory directories;

        // Callbacks
        MoveCallback move_callback;
        ErrorCallback error_callback;

        Impl(const QuarantineConfig& config, std::shared_ptr<LoggingSystem::Logger> logger)
            : config(config), logger(Utils::ResolveLogger(std::move(logger))), mover(this->logger),
              directories(config.directory_prefix, config.journal_file_name, this->logger) {}

        bool InitializeDirectory(QuarantineBatchResult& result) {
            try {
                directories.Create(result.quarantine_directory);
                return true;
            } catch (const IOError& e) {
                result.error_message = e.what();
                LOG_ERROR(logger, LoggingSystem::LogCategory::QUARANTINE,
                          "Failed to create quarantine directory: " + std::string(e.what()));
                if (error_callback) {
                    error_callback(result.error_message, e.GetPath());
                }
                return false;
            }
        }

        void ProcessFile(const fs::path& file_path, bool preserve_structure,
                         const fs::path& structure_root, QuarantineBatchResult& result) {
            try {
                MoveOutcome outcome = mover.Move(file_path, result.quarantine_directory,
                                                 preserve_structure, structure_root, result.dry_run);
                if (move_callback) {
                    move_callback(file_path, outcome);
                }
                result.outcomes.push_back(std::move(outcome));
            } catch (const std::exception& e) {
                // Ошибка одного файла не прерывает проход
                QuarantineFailure failure;
                failure.source = file_path;
                failure.error_message = e.what();
                result.failures.push_back(failure);

                LOG_ERROR(logger, LoggingSystem::LogCategory::QUARANTINE,
                          "Could not move " + file_path.string() + ": " + e.what());
                if (error_callback) {
                    error_callback(failure.error_message, file_path);
                }
            }
        }

        void PersistJournal(QuarantineBatchResult& result) {
            try {
                Journal journal(result.quarantine_directory, logger, config.journal_file_name);
                journal.Append(result.Records());
                result.journal_written = true;
            } catch (const std::exception& e) {
                result.journal_error = e.what();
                LOG_ERROR(logger, LoggingSystem::LogCategory::JOURNAL,
                          "Failed to write journal: " + result.journal_error);
                if (error_callback) {
                    error_callback(result.journal_error, result.quarantine_directory);
                }
            }
        }
    };

    QuarantineManager::QuarantineManager(const QuarantineConfig& config,
                                         std::shared_ptr<LoggingSystem::Logger> logger)
        : pImpl(std::make_unique<Impl>(config, std::move(logger))) {}

    QuarantineManager::~QuarantineManager() = default;

    QuarantineBatchResult QuarantineManager::Run(const std::vector<fs::path>& discovered_files,
                                                 const fs::path& quarantine_directory,
                                                 bool preserve_structure,
                                                 const fs::path& structure_root,
                                                 bool dry_run) {
        QuarantineBatchResult result;
        result.quarantine_directory = quarantine_directory;
        result.dry_run = dry_run;

        if (!dry_run && !pImpl->InitializeDirectory(result)) {
            return result;
        }
        result.success = true;

        for (const auto& file_path : discovered_files) {
            pImpl->ProcessFile(file_path, preserve_structure, structure_root, result);
        }

        if (!dry_run && !result.outcomes.empty()) {
            pImpl->PersistJournal(result);
        }

        pImpl->logger->LogWithFields(LoggingSystem::LogLevel::INFO, LoggingSystem::LogCategory::QUARANTINE,
                                     dry_run ? "Quarantine plan prepared" : "Quarantine pass finished",
                                     {{"directory", quarantine_directory.string()},
                                      {"moved", std::to_string(result.outcomes.size())},
                                      {"failed", std::to_string(result.failures.size())},
                                      {"journal", result.journal_written ? "written" : "not written"}});
        return result;
    }

    void QuarantineManager::SetMoveCallback(MoveCallback callback) {
        pImpl->move_callback = std::move(callback);
    }

    void QuarantineManager::SetErrorCallback(ErrorCallback callback) {
        pImpl->error_callback = std::move(callback);
    }
}
