//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef QUARANTINE_DIRECTORY_H
#define QUARANTINE_DIRECTORY_H

#pragma once

#include "journal.h"
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <optional>
#include <filesystem>

namespace QuarantineEngine {

    constexpr const char* DEFAULT_QUARANTINE_PREFIX = "quarantine-";

    struct QuarantineListing {
        std::filesystem::path directory;
        std::optional<std::size_t> item_count; // пусто, если журнал не читается
    };

    // Каталоги quarantine-YYYYMMDD-HHMMSS внутри базового каталога
    class QuarantineDirectory {
    public:
        explicit QuarantineDirectory(const std::string& prefix = DEFAULT_QUARANTINE_PREFIX,
                                     const std::string& journal_file_name = DEFAULT_JOURNAL_FILE_NAME,
                                     std::shared_ptr<LoggingSystem::Logger> logger = nullptr);

        std::filesystem::path MakePath(const std::filesystem::path& base,
                                       const std::chrono::system_clock::time_point& time_point) const;

        // Бросает IOError; существующий каталог не ошибка
        void Create(const std::filesystem::path& directory) const;

        std::optional<std::filesystem::path> FindLatest(const std::filesystem::path& base) const;
        std::vector<QuarantineListing> List(const std::filesystem::path& base) const;

        bool IsQuarantineName(const std::string& name) const;

    private:
        std::vector<std::filesystem::path> Collect(const std::filesystem::path& base) const;

        std::string prefix;
        std::string journal_file_name;
        std::shared_ptr<LoggingSystem::Logger> logger;
    };
}

#endif // QUARANTINE_DIRECTORY_H
