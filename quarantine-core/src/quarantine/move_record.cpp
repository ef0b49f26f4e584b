//
// Created by WhySkyDie on 21.07.2025.
//

#include "move_record.h"
#include "file_utils.h"
#include "logger.h"

namespace QuarantineEngine {

    namespace Utils {

        std::string MoveActionToString(MoveAction action) {
            switch (action) {
                case MoveAction::MOVED: return "moved";
                case MoveAction::DRY_RUN: return "dry-run";
                default: return "moved";
            }
        }

        MoveAction StringToMoveAction(const std::string& action_str) {
            if (action_str == "dry-run") return MoveAction::DRY_RUN;
            return MoveAction::MOVED;
        }

        std::string FormatRecordTime(const std::chrono::system_clock::time_point& time_point) {
            return FileUtils::Utils::FormatLocalTime(time_point, "%Y-%m-%d %H:%M:%S");
        }

        std::shared_ptr<LoggingSystem::Logger> ResolveLogger(std::shared_ptr<LoggingSystem::Logger> logger) {
            if (logger) {
                return logger;
            }
            return LoggingSystem::LoggerManager::Instance().GetLogger(DEFAULT_LOGGER_NAME);
        }
    }
}
