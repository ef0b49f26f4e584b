//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef JOURNAL_H
#define JOURNAL_H

#pragma once

#include "move_record.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>

namespace LoggingSystem {
    class Logger;
}

namespace QuarantineEngine {

    // Состояние файла журнала при чтении
    enum class JournalStatus {
        OK,
        ABSENT,
        CORRUPT
    };

    constexpr const char* DEFAULT_JOURNAL_FILE_NAME = "metadata.json";

    // Журнал карантина: один JSON-массив MoveRecord на каталог
    class Journal {
    public:
        explicit Journal(const std::filesystem::path& quarantine_directory,
                         std::shared_ptr<LoggingSystem::Logger> logger = nullptr,
                         const std::string& file_name = DEFAULT_JOURNAL_FILE_NAME);
        ~Journal();

        // Отсутствующий или повреждённый журнал даёт пустой список
        std::vector<MoveRecord> Load(JournalStatus* status = nullptr) const;

        // Чтение-дополнение-перезапись; бросает IOError при ошибке записи
        void Append(const std::vector<MoveRecord>& records);

        std::optional<std::size_t> CountRecords() const;


    private:
        class Impl;
        std::unique_ptr<Impl> pImpl;
    };

    namespace Utils {
        std::string JournalStatusToString(JournalStatus status);
    }
}

#endif // JOURNAL_H
