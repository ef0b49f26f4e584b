//
// Created by WhySkyDie on 21.07.2025.
//

#include "mover.h"
#include "path_namer.h"
#include "file_utils.h"
#include "logger.h"

namespace QuarantineEngine {

    namespace fs = std::filesystem;

    Mover::Mover(std::shared_ptr<LoggingSystem::Logger> logger)
        : logger(Utils::ResolveLogger(std::move(logger))) {}

    fs::path Mover::DestinationBase(const fs::path& source,
                                    const fs::path& destination_directory,
                                    bool preserve_structure,
                                    const fs::path& structure_root) {
        if (preserve_structure) {
            auto relative = FileUtils::PathUtils::RelativeTo(FileUtils::PathUtils::ResolvePath(source),
                                                             FileUtils::PathUtils::ResolvePath(structure_root));
            if (relative) {
                return destination_directory / *relative;
            }
            // Вне корня - только имя файла
        }
        return destination_directory / source.filename();
    }

    MoveOutcome Mover::Move(const fs::path& source,
                            const fs::path& destination_directory,
                            bool preserve_structure,
                            const fs::path& structure_root,
                            bool dry_run) const {
        const fs::path destination_base = DestinationBase(source, destination_directory,
                                                          preserve_structure, structure_root);
        const fs::path final_destination = PathNamer::Unique(destination_base);

        MoveOutcome outcome;
        outcome.final_destination = final_destination;
        outcome.record.original = FileUtils::PathUtils::ResolvePath(source);
        outcome.record.moved_to = FileUtils::PathUtils::ResolvePath(final_destination);

        // Иначе запись журнала нельзя будет прочитать обратно в тот же путь
        for (const fs::path* journal_path : {&outcome.record.original, &outcome.record.moved_to}) {
            if (!FileUtils::PathUtils::IsValidUtf8(*journal_path)) {
                throw IOError("Path is not valid UTF-8, cannot be journaled", *journal_path,
                              std::make_error_code(std::errc::illegal_byte_sequence));
            }
        }

        if (dry_run) {
            outcome.record.action = MoveAction::DRY_RUN;
            outcome.record.size = FileUtils::Utils::TryGetFileSize(source);
            outcome.record.time = Utils::FormatRecordTime(std::chrono::system_clock::now());

            LOG_DEBUG(logger, LoggingSystem::LogCategory::QUARANTINE,
                      "Would move " + source.string() + " -> " + final_destination.string());
            return outcome;
        }

        Relocate(source, final_destination);

        outcome.record.action = MoveAction::MOVED;
        outcome.record.size = FileUtils::Utils::TryGetFileSize(final_destination);
        outcome.record.time = Utils::FormatRecordTime(std::chrono::system_clock::now());

        LOG_INFO(logger, LoggingSystem::LogCategory::QUARANTINE,
                 "Moved " + source.string() + " -> " + final_destination.string());
        return outcome;
    }

    void Mover::Relocate(const fs::path& source, const fs::path& destination) const {
        std::error_code ec;

        if (!FileUtils::PathUtils::PathExists(source)) {
            throw IOError("Source does not exist: " + source.string(), source,
                          std::make_error_code(std::errc::no_such_file_or_directory));
        }

        const fs::path parent = destination.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                throw IOError("Cannot create directory " + parent.string(), parent, ec);
            }
        }

        fs::rename(source, destination, ec);
        if (!ec) {
            return;
        }

        if (ec != std::errc::cross_device_link) {
            throw IOError("Cannot move " + source.string() + " -> " + destination.string(), source, ec);
        }

        LOG_WARNING(logger, LoggingSystem::LogCategory::QUARANTINE,
                    "Cross-device move, falling back to copy: " + source.string() + " -> " + destination.string());
        CopyAcrossDevices(source, destination);
    }

    void Mover::CopyAcrossDevices(const fs::path& source, const fs::path& destination) const {
        std::error_code ec;

        if (FileUtils::PathUtils::PathExists(destination)) {
            throw IOError("Destination already exists: " + destination.string(), destination,
                          std::make_error_code(std::errc::file_exists));
        }

        auto remove_partial = [&destination]() {
            std::error_code cleanup_ec;
            fs::remove(destination, cleanup_ec);
        };

        const bool is_symlink = fs::is_symlink(fs::symlink_status(source, ec));

        if (is_symlink) {
            // Переносим саму ссылку, а не её цель
            fs::copy_symlink(source, destination, ec);
            if (ec) {
                remove_partial();
                throw IOError("Cannot copy symlink " + source.string(), source, ec);
            }
        } else {
            fs::copy_file(source, destination, fs::copy_options::none, ec);
            if (ec) {
                remove_partial();
                throw IOError("Cannot copy " + source.string() + " -> " + destination.string(), source, ec);
            }

            FileUtils::HashUtils hash_utils;
            if (!hash_utils.CompareFilesByHash(source, destination)) {
                remove_partial();
                throw IOError("Checksum mismatch after copy: " + destination.string(), destination);
            }
        }

        fs::remove(source, ec);
        if (ec) {
            remove_partial();
            throw IOError("Cannot remove source after copy: " + source.string(), source, ec);
        }

        LOG_DEBUG(logger, LoggingSystem::LogCategory::QUARANTINE,
                  "Copied and verified " + source.string() + " -> " + destination.string());
    }
}
