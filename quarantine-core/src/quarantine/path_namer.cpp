//
// Created by WhySkyDie on 21.07.2025.
//

#include "path_namer.h"
#include "file_utils.h"

namespace QuarantineEngine {

    std::filesystem::path PathNamer::Candidate(const std::filesystem::path& path, unsigned long counter) {
        // ".env" целиком stem, расширения нет
        const std::string stem = path.stem().string();
        const std::string extension = path.extension().string();
        return path.parent_path() / (stem + "_" + std::to_string(counter) + extension);
    }

    std::filesystem::path PathNamer::Unique(const std::filesystem::path& path) {
        if (!FileUtils::PathUtils::PathExists(path)) {
            return path;
        }

        unsigned long counter = 1;
        std::filesystem::path unique_path;

        do {
            unique_path = Candidate(path, counter);
            counter++;
        } while (FileUtils::PathUtils::PathExists(unique_path));

        return unique_path;
    }
}
