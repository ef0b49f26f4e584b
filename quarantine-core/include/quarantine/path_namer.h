//
// Created by WhySkyDie on 21.07.2025.
//

#ifndef PATH_NAMER_H
#define PATH_NAMER_H

#pragma once

#include <filesystem>

namespace QuarantineEngine {

    // Подбор свободного имени: file.txt -> file_1.txt -> file_2.txt ...
    class PathNamer {
    public:
        // Ничего не создаёт; битый симлинк считается занятым путём
        static std::filesystem::path Unique(const std::filesystem::path& path);

        static std::filesystem::path Candidate(const std::filesystem::path& path, unsigned long counter);
    };
}

#endif // PATH_NAMER_H
