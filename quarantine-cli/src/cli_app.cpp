//
// Created by WhySkyDie on 21.07.2025.
//

#include "cli_app.h"
#include "file_utils.h"
#include "logger.h"
#include <istream>
#include <ostream>
#include <algorithm>
#include <cctype>

namespace QuarantineCli {

    namespace fs = std::filesystem;

    Application::Application(const AppConfig::Config& config,
                             std::shared_ptr<LoggingSystem::Logger> logger,
                             std::istream& input, std::ostream& output, std::ostream& error_output)
        : config(config), logger(QuarantineEngine::Utils::ResolveLogger(std::move(logger))),
          input(input), output(output), error_output(error_output) {}

    bool Application::Confirm(const std::string& question) {
        output << question << std::flush;

        std::string answer;
        if (!std::getline(input, answer)) {
            return false;
        }

        // trim + lower
        auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
        answer.erase(answer.begin(), std::find_if(answer.begin(), answer.end(), not_space));
        answer.erase(std::find_if(answer.rbegin(), answer.rend(), not_space).base(), answer.end());
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

        return answer == "yes";
    }

    int Application::RunScan(const fs::path& target, const std::optional<fs::path>& quarantine_base) {
        const fs::path scan_root = FileUtils::PathUtils::ResolvePath(target);

        std::error_code ec;
        if (!fs::is_directory(scan_root, ec)) {
            error_output << "Target directory does not exist or is not a directory: " << scan_root.string() << "\n";
            return EXIT_INVALID_ARGUMENTS;
        }

        FileUtils::EmptyFileScanner scanner(AppConfig::Utils::ToScanOptions(config), logger);
        const FileUtils::ScanResult scan = scanner.Find(scan_root);
        if (!scan.complete) {
            error_output << "Warning: directory walk stopped early (" << scan.stop_reason
                         << "), the list below may be incomplete.\n";
        }

        if (scan.empty_files.empty()) {
            output << "No empty files found.\n";
            return EXIT_OK;
        }

        output << "Empty files found:\n";
        for (const auto& file : scan.empty_files) {
            output << " - " << file.string() << "\n";
        }

        QuarantineEngine::QuarantineDirectory directories(config.quarantine_prefix, config.journal_file_name, logger);
        const fs::path base = FileUtils::PathUtils::ResolvePath(
            quarantine_base ? *quarantine_base : config.base_directory);
        const fs::path quarantine_directory = directories.MakePath(base, std::chrono::system_clock::now());

        QuarantineEngine::QuarantineManager manager(AppConfig::Utils::ToQuarantineConfig(config), logger);

        if (config.dry_run) {
            const auto plan = manager.Run(scan.empty_files, quarantine_directory,
                                          config.preserve_structure, scan_root, true);
            PrintScanPlan(plan);
            output << "\nDry-run: no files were moved.\n";
            return EXIT_OK;
        }

        output << "\nQuarantine folder (will be used): " << quarantine_directory.string() << "\n";

        if (!config.assume_yes &&
            !Confirm("\nMove these files to quarantine? Type 'yes' to confirm: ")) {
            output << "Aborted by user.\n";
            return EXIT_OK;
        }

        manager.SetMoveCallback([this](const fs::path& source, const QuarantineEngine::MoveOutcome& outcome) {
            output << "[MOVED] " << source.string() << " -> " << outcome.final_destination.string() << "\n";
        });

        const auto result = manager.Run(scan.empty_files, quarantine_directory,
                                        config.preserve_structure, scan_root, false);
        PrintScanSummary(result);
        return EXIT_OK;
    }

    void Application::PrintScanPlan(const QuarantineEngine::QuarantineBatchResult& plan) {
        output << "\nPlanned quarantine folder: " << plan.quarantine_directory.string() << "\n";
        for (const auto& outcome : plan.outcomes) {
            output << "[DRY-RUN] " << outcome.record.original.string()
                   << " -> " << outcome.final_destination.string() << "\n";
        }
        for (const auto& failure : plan.failures) {
            output << "[ERROR] Could not plan " << failure.source.string() << ": " << failure.error_message << "\n";
        }
    }

    void Application::PrintScanSummary(const QuarantineEngine::QuarantineBatchResult& result) {
        if (!result.success) {
            error_output << "Could not create quarantine folder: " << result.error_message << "\n";
        }

        for (const auto& failure : result.failures) {
            output << "[ERROR] Could not move " << failure.source.string() << ": " << failure.error_message << "\n";
        }

        if (!result.journal_error.empty()) {
            output << "Warning: failed to write " << config.journal_file_name << ": " << result.journal_error << "\n";
        }

        output << "\nSummary:\n";
        output << "Files moved: " << result.outcomes.size() << "\n";
        if (!result.outcomes.empty()) {
            output << "Quarantine location: " << result.quarantine_directory.string() << "\n";
        } else {
            output << "No files were moved.\n";
        }
    }

    int Application::RunRestore(const std::optional<fs::path>& quarantine_directory) {
        QuarantineEngine::QuarantineDirectory directories(config.quarantine_prefix, config.journal_file_name, logger);

        fs::path restore_directory;
        if (quarantine_directory) {
            restore_directory = FileUtils::PathUtils::ResolvePath(*quarantine_directory);
            std::error_code ec;
            if (!fs::is_directory(restore_directory, ec)) {
                output << "Provided quarantine path does not exist or is not a directory: "
                       << restore_directory.string() << "\n";
                return EXIT_OK;
            }
        } else {
            auto latest = directories.FindLatest(config.base_directory);
            if (!latest) {
                output << "No quarantine directories found in " << config.base_directory.string() << ".\n";
                return EXIT_OK;
            }
            restore_directory = *latest;
            output << "No --quarantine provided. Using latest quarantine: " << restore_directory.string() << "\n";
        }

        if (config.dry_run) {
            output << "Dry-run: no files will be moved. Showing restore plan...\n";
        }

        if (!config.assume_yes) {
            const bool confirmed = Confirm("\nRestore files from " + restore_directory.string() +
                                           "? Type 'yes' to confirm: ");
            // dry-run ничего не меняет, поэтому продолжаем и без подтверждения
            if (!confirmed && !config.dry_run) {
                output << "Aborted by user.\n";
                return EXIT_OK;
            }
        }

        // --yes при восстановлении также означает перезапись
        const bool overwrite = config.assume_yes || config.overwrite_on_restore;

        QuarantineEngine::RestoreEngine engine(AppConfig::Utils::ToQuarantineConfig(config), logger);
        const auto report = engine.Restore(restore_directory, config.dry_run, overwrite);

        if (report.journal_status == QuarantineEngine::JournalStatus::ABSENT) {
            output << "No " << config.journal_file_name << " found in " << restore_directory.string()
                   << ". Cannot restore reliably.\n";
            return EXIT_OK;
        }
        if (report.journal_status == QuarantineEngine::JournalStatus::CORRUPT) {
            output << "Failed to read " << config.journal_file_name << " in " << restore_directory.string()
                   << ": the journal is corrupt.\n";
            return EXIT_OK;
        }

        PrintRestoreSummary(report);
        return EXIT_OK;
    }

    void Application::PrintRestoreSummary(const QuarantineEngine::RestoreReport& report) {
        const char* verb = report.dry_run ? "Would restore" : "Restored";

        output << "\nRestore Summary for: " << report.quarantine_directory.string() << "\n";
        output << (report.dry_run ? "Files that would be restored: " : "Files restored/moved: ")
               << report.restored.size() << "\n";
        for (const auto& item : report.restored) {
            output << " - " << verb << ": " << item.restored_to.string() << " <- " << item.moved_to.string() << "\n";
        }

        if (!report.skipped.empty()) {
            output << "\nSkipped: " << report.skipped.size() << "\n";
            for (const auto& item : report.skipped) {
                output << " - Skipped: " << item.moved_to.string() << " -> " << item.original.string()
                       << " | " << item.message << "\n";
            }
        }

        if (!report.errors.empty()) {
            output << "\nErrors: " << report.errors.size() << "\n";
            for (const auto& item : report.errors) {
                output << " - Error restoring " << item.moved_to.string() << " -> " << item.original.string()
                       << " : " << item.message << "\n";
            }
        }
    }

    int Application::RunList(const fs::path& base) {
        const fs::path resolved_base = FileUtils::PathUtils::ResolvePath(base);
        QuarantineEngine::QuarantineDirectory directories(config.quarantine_prefix, config.journal_file_name, logger);
        const auto listings = directories.List(resolved_base);

        if (listings.empty()) {
            output << "No quarantine directories found in " << resolved_base.string() << "\n";
            return EXIT_OK;
        }

        output << "Quarantine directories:\n";
        for (const auto& listing : listings) {
            output << " - " << listing.directory.string() << "  (items recorded: "
                   << (listing.item_count ? std::to_string(*listing.item_count) : std::string("?")) << ")\n";
        }
        return EXIT_OK;
    }
}
