//
// Created by WhySkyDie on 21.07.2025.
//

#include "quarantine_directory.h"
#include "file_utils.h"
#include "logger.h"
#include <algorithm>

namespace QuarantineEngine {

    namespace fs = std::filesystem;

    QuarantineDirectory::QuarantineDirectory(const std::string& prefix,
                                             const std::string& journal_file_name,
                                             std::shared_ptr<LoggingSystem::Logger> logger)
        : prefix(prefix), journal_file_name(journal_file_name),
          logger(Utils::ResolveLogger(std::move(logger))) {}

    fs::path QuarantineDirectory::MakePath(const fs::path& base,
                                           const std::chrono::system_clock::time_point& time_point) const {
        return base / (prefix + FileUtils::Utils::FormatLocalTime(time_point, "%Y%m%d-%H%M%S"));
    }

    void QuarantineDirectory::Create(const fs::path& directory) const {
        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            throw IOError("Cannot create quarantine directory " + directory.string(), directory, ec);
        }

        if (!fs::is_directory(directory, ec)) {
            throw IOError("Quarantine path is not a directory: " + directory.string(), directory,
                          std::make_error_code(std::errc::not_a_directory));
        }

        LOG_DEBUG(logger, LoggingSystem::LogCategory::QUARANTINE,
                  "Quarantine directory ready: " + directory.string());
    }

    bool QuarantineDirectory::IsQuarantineName(const std::string& name) const {
        return name.size() >= prefix.size() && name.compare(0, prefix.size(), prefix) == 0;
    }

    std::vector<fs::path> QuarantineDirectory::Collect(const fs::path& base) const {
        std::vector<fs::path> directories;
        const fs::path resolved_base = FileUtils::PathUtils::ResolvePath(base);

        std::error_code ec;
        fs::directory_iterator it(resolved_base, ec);
        if (ec) {
            LOG_DEBUG(logger, LoggingSystem::LogCategory::QUARANTINE,
                      "Cannot list " + resolved_base.string() + ": " + ec.message());
            return directories;
        }

        const fs::directory_iterator end;
        while (it != end) {
            std::error_code entry_ec;
            if (it->is_directory(entry_ec) && IsQuarantineName(it->path().filename().string())) {
                directories.push_back(it->path());
            }
            it.increment(ec);
            if (ec) {
                break;
            }
        }

        // Имена содержат метку времени, лексикографический порядок = хронологический
        std::sort(directories.begin(), directories.end(),
                  [](const fs::path& a, const fs::path& b) {
                      return a.filename().string() < b.filename().string();
                  });
        return directories;
    }

    std::optional<fs::path> QuarantineDirectory::FindLatest(const fs::path& base) const {
        auto directories = Collect(base);
        if (directories.empty()) {
            return std::nullopt;
        }
        return FileUtils::PathUtils::ResolvePath(directories.back());
    }

    std::vector<QuarantineListing> QuarantineDirectory::List(const fs::path& base) const {
        std::vector<QuarantineListing> listings;
        for (const auto& directory : Collect(base)) {
            QuarantineListing listing;
            listing.directory = directory;
            listing.item_count = Journal(directory, logger, journal_file_name).CountRecords();
            listings.push_back(listing);
        }
        return listings;
    }
}
