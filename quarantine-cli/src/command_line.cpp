//
// Created by WhySkyDie on 21.07.2025.
//

#include "command_line.h"
#include <sstream>

namespace QuarantineCli {

    ParseResult ParseCommandLine(const std::vector<std::string>& arguments) {
        ParseResult result;
        CommandLineOptions& options = result.options;
        bool target_seen = false;

        for (std::size_t i = 0; i < arguments.size(); ++i) {
            const std::string& arg = arguments[i];

            // Опции со значением
            auto take_value = [&](std::string& value) -> bool {
                if (i + 1 >= arguments.size()) {
                    result.error_message = "Option " + arg + " requires a value";
                    return false;
                }
                value = arguments[++i];
                return true;
            };

            std::string value;
            if (arg == "--help" || arg == "-h") {
                options.help = true;
            } else if (arg == "--no-recursive") {
                options.recursive = false;
            } else if (arg == "--dry-run") {
                options.dry_run = true;
            } else if (arg == "--yes") {
                options.assume_yes = true;
            } else if (arg == "--preserve-structure") {
                options.preserve_structure = true;
            } else if (arg == "--ignore-hidden") {
                options.ignore_hidden = true;
            } else if (arg == "--include-hidden") {
                options.ignore_hidden = false;
            } else if (arg == "--restore") {
                options.restore = true;
            } else if (arg == "--overwrite") {
                options.overwrite = true;
            } else if (arg == "--list-quarantines") {
                options.list_quarantines = true;
            } else if (arg == "--verbose" || arg == "-v") {
                options.verbose = true;
            } else if (arg == "--quarantine") {
                if (!take_value(value)) return result;
                options.quarantine = value;
            } else if (arg == "--config") {
                if (!take_value(value)) return result;
                options.config_file = value;
            } else if (arg == "--log-level") {
                if (!take_value(value)) return result;
                if (!LoggingSystem::Utils::IsValidLogLevel(value)) {
                    result.error_message = "Unknown log level: " + value;
                    return result;
                }
                options.log_level = value;
            } else if (arg == "--log-dir") {
                if (!take_value(value)) return result;
                options.log_directory = value;
            } else if (arg.size() > 1 && arg[0] == '-') {
                result.error_message = "Unknown option: " + arg;
                return result;
            } else if (!target_seen) {
                options.target = arg;
                target_seen = true;
            } else {
                result.error_message = "Unexpected argument: " + arg;
                return result;
            }
        }

        result.success = true;
        return result;
    }

    ParseResult ParseCommandLine(int argc, char* argv[]) {
        std::vector<std::string> arguments;
        for (int i = 1; i < argc; ++i) {
            arguments.emplace_back(argv[i]);
        }
        return ParseCommandLine(arguments);
    }

    void ApplyOverrides(const CommandLineOptions& options, AppConfig::Config& config) {
        if (options.recursive) config.recursive = *options.recursive;
        if (options.ignore_hidden) config.ignore_hidden = *options.ignore_hidden;
        if (options.dry_run) config.dry_run = *options.dry_run;
        if (options.assume_yes) config.assume_yes = *options.assume_yes;
        if (options.preserve_structure) config.preserve_structure = *options.preserve_structure;
        if (options.overwrite) config.overwrite_on_restore = *options.overwrite;

        if (options.log_level) config.log_level = *options.log_level;
        if (options.verbose) config.log_level = "DEBUG";
        if (options.log_directory) config.log_directory = *options.log_directory;
    }

    std::string Usage(const std::string& program_name) {
        std::ostringstream oss;
        oss << "Usage: " << program_name << " [target] [options]\n"
            << "Move empty files to a quarantine folder and restore them later.\n\n"
            << "  target                 Directory to scan (default: .)\n"
            << "  --no-recursive         Do not search recursively\n"
            << "  --dry-run              Show what would be moved or restored\n"
            << "  --yes                  Do not ask for confirmation; overwrite when restoring\n"
            << "  --quarantine PATH      Scan: base for the new quarantine folder; restore: folder to restore\n"
            << "  --preserve-structure   Keep folder structure inside the quarantine\n"
            << "  --ignore-hidden        Ignore hidden files and folders (default)\n"
            << "  --include-hidden       Include hidden files and folders\n"
            << "  --restore              Restore files (uses --quarantine or the latest one)\n"
            << "  --overwrite            Replace files that already exist when restoring\n"
            << "  --list-quarantines     List quarantine folders under target\n"
            << "  --config FILE          Read settings from a JSON file\n"
            << "  --log-level LEVEL      TRACE, DEBUG, INFO, WARNING, ERROR, FATAL, OFF\n"
            << "  --log-dir DIR          Also write logs to DIR\n"
            << "  --verbose              Same as --log-level DEBUG\n"
            << "  --help                 Show this help\n";
        return oss.str();
    }
}
