//
// Created by WhySkyDie on 21.07.2025.
//

#include "file_utils.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <ctime>
#include <cstdint>
#include <openssl/evp.h>

namespace FileUtils {

    // Реализация IncrementalHasher::Impl
    class HashUtils::IncrementalHasher::Impl {
    public:
        EVP_MD_CTX* context;
        bool finalized;

        Impl() : context(EVP_MD_CTX_new()), finalized(false) {
            if (!context) {
                throw std::runtime_error("Failed to create digest context");
            }

            if (EVP_DigestInit_ex(context, EVP_sha256(), nullptr) != 1) {
                EVP_MD_CTX_free(context);
                throw std::runtime_error("Failed to initialize digest");
            }
        }

        ~Impl() {
            EVP_MD_CTX_free(context);
        }

        void Update(const void* data, std::size_t size) {
            if (finalized) {
                throw std::runtime_error("Cannot update finalized hasher");
            }
            if (size > 0 && EVP_DigestUpdate(context, data, size) != 1) {
                throw std::runtime_error("Failed to update digest");
            }
        }

        std::string Finalize() {
            if (finalized) {
                throw std::runtime_error("Hasher already finalized");
            }

            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hash_length = 0;
            if (EVP_DigestFinal_ex(context, hash, &hash_length) != 1) {
                throw std::runtime_error("Failed to finalize digest");
            }
            finalized = true;

            // Конвертация в hex строку
            std::stringstream ss;
            for (unsigned int i = 0; i < hash_length; ++i) {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
            }
            return ss.str();
        }
    };

    // HashUtils
    HashUtils::HashUtils() = default;
    HashUtils::~HashUtils() = default;

    std::string HashUtils::CalculateFileHash(const std::filesystem::path& file_path) {
        std::ifstream file(file_path, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file for hashing: " + file_path.string());
        }

        IncrementalHasher hasher;

        const std::size_t buffer_size = 64 * 1024;
        std::vector<char> buffer(buffer_size);

        while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
            hasher.Update(buffer.data(), static_cast<std::size_t>(file.gcount()));
        }

        if (file.bad()) {
            throw std::runtime_error("Read error while hashing: " + file_path.string());
        }

        return hasher.Finalize();
    }

    bool HashUtils::CompareFilesByHash(const std::filesystem::path& file1,
                                      const std::filesystem::path& file2) {
        try {
            return CalculateFileHash(file1) == CalculateFileHash(file2);
        } catch (const std::exception&) {
            return false;
        }
    }

    // IncrementalHasher
    HashUtils::IncrementalHasher::IncrementalHasher()
        : pImpl(std::make_unique<Impl>()) {}

    HashUtils::IncrementalHasher::~IncrementalHasher() = default;

    void HashUtils::IncrementalHasher::Update(const void* data, std::size_t size) {
        pImpl->Update(data, size);
    }

    std::string HashUtils::IncrementalHasher::Finalize() {
        return pImpl->Finalize();
    }

    // PathUtils
    std::filesystem::path PathUtils::ResolvePath(const std::filesystem::path& path) {
        std::error_code ec;
        std::filesystem::path absolute_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return path;
        }

        absolute_path = absolute_path.lexically_normal();
        if (!absolute_path.has_filename() && absolute_path.has_relative_path()) {
            absolute_path = absolute_path.parent_path();
        }
        if (!absolute_path.has_relative_path()) {
            return absolute_path; // корень
        }

        std::filesystem::path parent = std::filesystem::weakly_canonical(absolute_path.parent_path(), ec);
        if (ec) {
            parent = absolute_path.parent_path();
        }
        return parent / absolute_path.filename();
    }

    bool PathUtils::PathExists(const std::filesystem::path& path) {
        std::error_code ec;
        return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
    }

    std::optional<std::filesystem::path> PathUtils::RelativeTo(const std::filesystem::path& target,
                                                                const std::filesystem::path& base) {
        std::filesystem::path relative = target.lexically_normal().lexically_relative(base.lexically_normal());
        if (relative.empty() || relative == ".") {
            return std::nullopt;
        }
        if (*relative.begin() == "..") {
            return std::nullopt;
        }
        return relative;
    }

    bool PathUtils::HasComponentWithPrefix(const std::filesystem::path& relative_path,
                                           const std::string& prefix) {
        if (prefix.empty()) {
            return false;
        }

        for (const auto& part : relative_path) {
            const std::string name = part.string();
            if (name == "." || name == "..") {
                continue;
            }
            if (name.compare(0, prefix.size(), prefix) == 0) {
                return true;
            }
        }
        return false;
    }

    bool PathUtils::IsValidUtf8(const std::filesystem::path& path) {
        const std::string& bytes = path.native();
        std::size_t i = 0;
        while (i < bytes.size()) {
            const auto lead = static_cast<unsigned char>(bytes[i]);
            std::size_t length = 0;
            std::uint32_t code_point = 0;
            if (lead < 0x80) {
                ++i;
                continue;
            } else if ((lead & 0xE0) == 0xC0) {
                length = 2;
                code_point = lead & 0x1F;
            } else if ((lead & 0xF0) == 0xE0) {
                length = 3;
                code_point = lead & 0x0F;
            } else if ((lead & 0xF8) == 0xF0) {
                length = 4;
                code_point = lead & 0x07;
            } else {
                return false;
            }

            if (i + length > bytes.size()) {
                return false;
            }
            for (std::size_t k = 1; k < length; ++k) {
                const auto next = static_cast<unsigned char>(bytes[i + k]);
                if ((next & 0xC0) != 0x80) {
                    return false;
                }
                code_point = (code_point << 6) | (next & 0x3F);
            }

            // Избыточные формы, суррогаты и значения вне Unicode
            static const std::uint32_t min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
            if (code_point < min_for_length[length] || code_point > 0x10FFFF ||
                (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                return false;
            }
            i += length;
        }
        return true;
    }

    // EmptyFileScanner
    EmptyFileScanner::EmptyFileScanner(const ScanOptions& options,
                                       std::shared_ptr<LoggingSystem::Logger> logger)
        : options(options), logger(std::move(logger)) {}

    bool EmptyFileScanner::IsExcluded(const std::filesystem::path& relative_path, bool is_directory) const {
        if (options.ignore_hidden && PathUtils::HasComponentWithPrefix(relative_path, options.hidden_marker)) {
            return true;
        }

        if (is_directory && !options.skip_directory_prefix.empty()) {
            const std::string name = relative_path.filename().string();
            if (name.compare(0, options.skip_directory_prefix.size(), options.skip_directory_prefix) == 0) {
                return true;
            }
        }
        return false;
    }

    ScanResult EmptyFileScanner::Find(const std::filesystem::path& root) const {
        namespace fs = std::filesystem;

        ScanResult result;
        const fs::path base = PathUtils::ResolvePath(root);

        std::error_code ec;
        if (!fs::is_directory(base, ec)) {
            result.complete = false;
            result.stop_reason = "scan root is not a directory: " + base.string();
            LOG_ERROR(logger, LoggingSystem::LogCategory::DISCOVERY,
                      "Scan root is not a directory: " + base.string());
            return result;
        }

        auto consider_entry = [&](const fs::directory_entry& entry) -> bool {
            ++result.entries_visited;
            const fs::path relative = entry.path().lexically_relative(base);

            std::error_code entry_ec;
            const bool is_symlink = entry.is_symlink(entry_ec);
            const bool is_directory = !is_symlink && entry.is_directory(entry_ec);

            if (is_directory) {
                // false = не спускаться внутрь
                return !IsExcluded(relative, true);
            }

            if (IsExcluded(relative, false)) {
                return false;
            }

            // is_regular_file следует по симлинку
            entry_ec.clear();
            if (!entry.is_regular_file(entry_ec)) {
                if (entry_ec) {
                    ++result.entries_skipped;
                }
                return false;
            }

            const std::uintmax_t size = fs::file_size(entry.path(), entry_ec);
            if (entry_ec) {
                ++result.entries_skipped;
                return false;
            }

            if (size == 0) {
                result.empty_files.push_back(entry.path());
            }
            return false;
        };

        if (options.recursive) {
            fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
            const fs::recursive_directory_iterator end;
            if (ec) {
                result.complete = false;
                result.stop_reason = ec.message();
                LOG_ERROR(logger, LoggingSystem::LogCategory::DISCOVERY,
                          "Cannot open " + base.string() + ": " + ec.message());
                return result;
            }

            while (it != end) {
                if (!consider_entry(*it)) {
                    it.disable_recursion_pending();
                }
                it.increment(ec);
                if (ec) {
                    ++result.entries_skipped;
                    result.complete = false;
                    result.stop_reason = ec.message();
                    LOG_WARNING(logger, LoggingSystem::LogCategory::DISCOVERY,
                                "Directory walk stopped early: " + ec.message());
                    break;
                }
            }
        } else {
            fs::directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
            const fs::directory_iterator end;
            if (ec) {
                result.complete = false;
                result.stop_reason = ec.message();
                LOG_ERROR(logger, LoggingSystem::LogCategory::DISCOVERY,
                          "Cannot open " + base.string() + ": " + ec.message());
                return result;
            }

            while (it != end) {
                consider_entry(*it);
                it.increment(ec);
                if (ec) {
                    ++result.entries_skipped;
                    result.complete = false;
                    result.stop_reason = ec.message();
                    LOG_WARNING(logger, LoggingSystem::LogCategory::DISCOVERY,
                                "Directory listing stopped early: " + ec.message());
                    break;
                }
            }
        }

        if (logger) {
            logger->LogWithFields(LoggingSystem::LogLevel::DEBUG, LoggingSystem::LogCategory::DISCOVERY,
                                  "Scan finished for " + base.string(),
                                  {{"visited", std::to_string(result.entries_visited)},
                                   {"skipped", std::to_string(result.entries_skipped)},
                                   {"empty", std::to_string(result.empty_files.size())}});
        }

        return result;
    }

    // Утилитарные функции
    namespace Utils {

        std::string FormatLocalTime(const std::chrono::system_clock::time_point& time_point,
                                    const std::string& format) {
            auto time_t = std::chrono::system_clock::to_time_t(time_point);
            std::tm tm_buf{};
            localtime_r(&time_t, &tm_buf);

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, format.c_str());
            return oss.str();
        }

        std::optional<std::uintmax_t> TryGetFileSize(const std::filesystem::path& file_path) {
            std::error_code ec;
            const std::uintmax_t size = std::filesystem::file_size(file_path, ec);
            if (ec) {
                return std::nullopt;
            }
            return size;
        }
    }
}
