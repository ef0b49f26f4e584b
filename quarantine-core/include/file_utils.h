//
// Created by WhySkyDie on 21.07.2025.
//

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <filesystem>
#include <optional>

namespace LoggingSystem {
    class Logger;
}

namespace FileUtils {

    // Утилиты для хэширования (SHA-256)
    class HashUtils {
    public:
        HashUtils();
        ~HashUtils();

        std::string CalculateFileHash(const std::filesystem::path& file_path);

        // Сравнение файлов по хэшу; false, если какой-то из файлов не читается
        bool CompareFilesByHash(const std::filesystem::path& file1,
                               const std::filesystem::path& file2);

        // Инкрементальное хэширование
        class IncrementalHasher {
        public:
            IncrementalHasher();
            ~IncrementalHasher();

            void Update(const void* data, std::size_t size);
            std::string Finalize();

        private:
            class Impl;
            std::unique_ptr<Impl> pImpl;
        };
    };

    // Утилиты для путей
    class PathUtils {
    public:
        // Абсолютный путь: родитель разрешается через симлинки, имя файла остаётся как есть
        static std::filesystem::path ResolvePath(const std::filesystem::path& path);

        // Путь занят, если существует сама запись (в т.ч. битый симлинк)
        static bool PathExists(const std::filesystem::path& path);

        // Относительный путь target внутри base, если target лежит под base
        static std::optional<std::filesystem::path> RelativeTo(const std::filesystem::path& target,
                                                                const std::filesystem::path& base);

        static bool HasComponentWithPrefix(const std::filesystem::path& relative_path,
                                           const std::string& prefix);

        // Журнал хранит пути строками JSON, поэтому байты пути должны быть корректным UTF-8
        static bool IsValidUtf8(const std::filesystem::path& path);
    };

    // Поиск пустых файлов
    struct ScanOptions {
        bool recursive = true;
        bool ignore_hidden = true;
        std::string hidden_marker = ".";
        // Каталоги с этим префиксом не обходятся (прошлые карантины)
        std::string skip_directory_prefix = "quarantine-";
    };

    struct ScanResult {
        std::vector<std::filesystem::path> empty_files;
        std::size_t entries_visited = 0;
        std::size_t entries_skipped = 0;
        // false, если обход прервался из-за ошибки; empty_files тогда неполный
        bool complete = true;
        std::string stop_reason;
    };

    class EmptyFileScanner {
    public:
        explicit EmptyFileScanner(const ScanOptions& options = ScanOptions(),
                                  std::shared_ptr<LoggingSystem::Logger> logger = nullptr);

        // root должен быть каталогом; порядок результатов = порядок обхода
        ScanResult Find(const std::filesystem::path& root) const;

    private:
        bool IsExcluded(const std::filesystem::path& relative_path, bool is_directory) const;

        ScanOptions options;
        std::shared_ptr<LoggingSystem::Logger> logger;
    };

    // Утилитарные функции
    namespace Utils {
        // Локальное время по формату strftime
        std::string FormatLocalTime(const std::chrono::system_clock::time_point& time_point,
                                    const std::string& format);

        std::optional<std::uintmax_t> TryGetFileSize(const std::filesystem::path& file_path);
    }
}
