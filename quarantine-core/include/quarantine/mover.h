//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef MOVER_H
#define MOVER_H

#pragma once

#include "move_record.h"
#include <memory>
#include <filesystem>

namespace LoggingSystem {
    class Logger;
}

namespace QuarantineEngine {

    struct MoveOutcome {
        std::filesystem::path final_destination;
        MoveRecord record;
    };

    // Одно перемещение файла (в карантин или обратно)
    class Mover {
    public:
        explicit Mover(std::shared_ptr<LoggingSystem::Logger> logger = nullptr);

        // Бросает IOError; в dry_run ничего не меняет на диске.
        // Пути, не являющиеся корректным UTF-8, отклоняются до любых изменений
        MoveOutcome Move(const std::filesystem::path& source,
                         const std::filesystem::path& destination_directory,
                         bool preserve_structure,
                         const std::filesystem::path& structure_root,
                         bool dry_run) const;

        // rename, при EXDEV - CopyAcrossDevices
        void Relocate(const std::filesystem::path& source,
                      const std::filesystem::path& destination) const;

        // Копия с проверкой SHA-256 и удаление источника. Симлинк копируется как ссылка.
        // destination не должен существовать; при ошибке частичная копия удаляется
        void CopyAcrossDevices(const std::filesystem::path& source,
                               const std::filesystem::path& destination) const;

        // Куда попадёт файл без учёта коллизий
        static std::filesystem::path DestinationBase(const std::filesystem::path& source,
                                                     const std::filesystem::path& destination_directory,
                                                     bool preserve_structure,
                                                     const std::filesystem::path& structure_root);

    private:
        std::shared_ptr<LoggingSystem::Logger> logger;
    };
}

#endif // MOVER_H
