//
// Created by WhySkyDie on 21.07.2025.
//

#include "journal.h"
#include "file_utils.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <json/json.h>

namespace QuarantineEngine {

    namespace fs = std::filesystem;

    // Реализация Journal::Impl
    class Journal::Impl {
    public:
        fs::path journal_path;
        std::shared_ptr<LoggingSystem::Logger> logger;

        Impl(const fs::path& quarantine_directory, std::shared_ptr<LoggingSystem::Logger> logger,
             const std::string& file_name)
            : journal_path(quarantine_directory / file_name), logger(std::move(logger)) {}

        // Сырой массив из файла; записи не проверяются
        Json::Value ReadArray(JournalStatus& status) const {
            if (!FileUtils::PathUtils::PathExists(journal_path)) {
                status = JournalStatus::ABSENT;
                return Json::Value(Json::arrayValue);
            }

            std::ifstream file(journal_path);
            if (!file.is_open()) {
                status = JournalStatus::CORRUPT;
                LOG_WARNING(logger, LoggingSystem::LogCategory::JOURNAL,
                            "Cannot open journal " + journal_path.string());
                return Json::Value(Json::arrayValue);
            }

            Json::Value root;
            Json::CharReaderBuilder builder;
            std::string errors;
            if (!Json::parseFromStream(builder, file, &root, &errors)) {
                status = JournalStatus::CORRUPT;
                LOG_WARNING(logger, LoggingSystem::LogCategory::JOURNAL,
                            "Corrupt journal " + journal_path.string() + ": " + errors);
                return Json::Value(Json::arrayValue);
            }

            if (!root.isArray()) {
                status = JournalStatus::CORRUPT;
                LOG_WARNING(logger, LoggingSystem::LogCategory::JOURNAL,
                            "Journal is not a JSON array: " + journal_path.string());
                return Json::Value(Json::arrayValue);
            }

            status = JournalStatus::OK;
            return root;
        }

        std::optional<MoveRecord> RecordFromJson(const Json::Value& entry, Json::ArrayIndex index) const {
            if (!entry.isObject() ||
                !entry["original"].isString() || !entry["moved_to"].isString()) {
                LOG_WARNING(logger, LoggingSystem::LogCategory::JOURNAL,
                            "Dropping malformed journal entry #" + std::to_string(index) +
                            " in " + journal_path.string());
                return std::nullopt;
            }

            MoveRecord record;
            record.original = entry["original"].asString();
            record.moved_to = entry["moved_to"].asString();

            const Json::Value& size = entry["size"];
            if (size.isUInt64()) {
                record.size = size.asUInt64();
            }

            if (entry["time"].isString()) {
                record.time = entry["time"].asString();
            }

            // Старые записи без action считаются перемещёнными
            if (entry["action"].isString()) {
                record.action = Utils::StringToMoveAction(entry["action"].asString());
            }

            return record;
        }

        static Json::Value RecordToJson(const MoveRecord& record) {
            Json::Value entry(Json::objectValue);
            entry["original"] = record.original.string();
            entry["moved_to"] = record.moved_to.string();
            if (record.size) {
                entry["size"] = static_cast<Json::UInt64>(*record.size);
            } else {
                entry["size"] = Json::Value(Json::nullValue);
            }
            entry["time"] = record.time;
            entry["action"] = Utils::MoveActionToString(record.action);
            return entry;
        }

        void WriteArray(const Json::Value& root) const {
            Json::StreamWriterBuilder builder;
            builder["indentation"] = "  ";
            builder["enableYAMLCompatibility"] = true;
            const std::string content = Json::writeString(builder, root);

            // Пишем во временный файл и подменяем журнал целиком
            fs::path temp_path = journal_path;
            temp_path += ".tmp";

            {
                std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
                if (!file.is_open()) {
                    throw IOError("Cannot write journal " + temp_path.string(), temp_path,
                                  std::make_error_code(std::errc::permission_denied));
                }
                file << content;
                file.flush();
                if (!file) {
                    std::error_code cleanup_ec;
                    fs::remove(temp_path, cleanup_ec);
                    throw IOError("Failed writing journal " + temp_path.string(), temp_path,
                                  std::make_error_code(std::errc::io_error));
                }
            }

            std::error_code ec;
            fs::rename(temp_path, journal_path, ec);
            if (ec) {
                std::error_code cleanup_ec;
                fs::remove(temp_path, cleanup_ec);
                throw IOError("Cannot replace journal " + journal_path.string(), journal_path, ec);
            }
        }
    };

    Journal::Journal(const fs::path& quarantine_directory,
                     std::shared_ptr<LoggingSystem::Logger> logger,
                     const std::string& file_name)
        : pImpl(std::make_unique<Impl>(quarantine_directory, Utils::ResolveLogger(std::move(logger)), file_name)) {}

    Journal::~Journal() = default;

    std::vector<MoveRecord> Journal::Load(JournalStatus* status) const {
        JournalStatus read_status = JournalStatus::ABSENT;
        const Json::Value root = pImpl->ReadArray(read_status);
        if (status) {
            *status = read_status;
        }

        std::vector<MoveRecord> records;
        records.reserve(root.size());
        for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
            auto record = pImpl->RecordFromJson(root[i], i);
            if (record) {
                records.push_back(std::move(*record));
            }
        }
        return records;
    }

    void Journal::Append(const std::vector<MoveRecord>& records) {
        JournalStatus status = JournalStatus::ABSENT;
        Json::Value root = pImpl->ReadArray(status);

        if (status == JournalStatus::CORRUPT) {
            LOG_WARNING(pImpl->logger, LoggingSystem::LogCategory::JOURNAL,
                        "Overwriting corrupt journal " + pImpl->journal_path.string());
        }

        for (const auto& record : records) {
            root.append(Impl::RecordToJson(record));
        }

        pImpl->WriteArray(root);

        pImpl->logger->LogWithFields(LoggingSystem::LogLevel::DEBUG, LoggingSystem::LogCategory::JOURNAL,
                                     "Journal updated",
                                     {{"path", pImpl->journal_path.string()},
                                      {"appended", std::to_string(records.size())},
                                      {"total", std::to_string(root.size())}});
    }

    std::optional<std::size_t> Journal::CountRecords() const {
        JournalStatus status = JournalStatus::ABSENT;
        const Json::Value root = pImpl->ReadArray(status);
        if (status != JournalStatus::OK) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(root.size());
    }

    namespace Utils {

        std::string JournalStatusToString(JournalStatus status) {
            switch (status) {
                case JournalStatus::OK: return "ok";
                case JournalStatus::ABSENT: return "absent";
                case JournalStatus::CORRUPT: return "corrupt";
                default: return "unknown";
            }
        }
    }
}
