//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef MOVE_RECORD_H
#define MOVE_RECORD_H

#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <filesystem>
#include <system_error>

namespace LoggingSystem {
    class Logger;
}

namespace QuarantineEngine {

    constexpr const char* DEFAULT_LOGGER_NAME = "quarantine";

    // Тип записи в журнале
    enum class MoveAction {
        MOVED,
        DRY_RUN
    };

    // Запись журнала: откуда и куда перемещён файл
    struct MoveRecord {
        std::filesystem::path original;
        std::filesystem::path moved_to;
        std::optional<std::uintmax_t> size;
        std::string time;
        MoveAction action;

        MoveRecord() : action(MoveAction::MOVED) {}
    };

    // Ошибка файловой операции
    class IOError : public std::runtime_error {
    public:
        IOError(const std::string& message, const std::filesystem::path& file_path,
                std::error_code error_code = std::error_code())
            : std::runtime_error(error_code ? message + ": " + error_code.message() : message),
              file_path(file_path), error_code(error_code) {}

        const std::filesystem::path& GetPath() const { return file_path; }
        std::error_code GetErrorCode() const { return error_code; }

    private:
        std::filesystem::path file_path;
        std::error_code error_code;
    };

    namespace Utils {
        std::string MoveActionToString(MoveAction action);
        // Всё, кроме "dry-run", считается перемещением
        MoveAction StringToMoveAction(const std::string& action_str);

        // Время записи: "YYYY-MM-DD HH:MM:SS", локальное
        std::string FormatRecordTime(const std::chrono::system_clock::time_point& time_point);

        // nullptr -> логгер "quarantine" из LoggerManager
        std::shared_ptr<LoggingSystem::Logger> ResolveLogger(std::shared_ptr<LoggingSystem::Logger> logger);
    }
}

#endif // MOVE_RECORD_H
