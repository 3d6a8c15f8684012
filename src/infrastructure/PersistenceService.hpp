/**
 * @file PersistenceService.hpp
 * @brief Centralized file I/O primitives with atomic replace-on-write.
 */

#pragma once

#include <filesystem>
#include <string>

namespace novelstore::infrastructure {

/**
 * @class PersistenceService
 * @brief Blocking filesystem operations used by the project store.
 *
 * Every failure is raised as domain::IoError carrying the path and the
 * operation; nothing is swallowed here.
 */
class PersistenceService {
public:
    /**
     * @brief Replaces a file's content atomically (temp -> rename).
     * @param path Destination file; missing parent directories are created.
     * @param content The string content to write.
     */
    void writeText(const std::filesystem::path& path, const std::string& content);

    /**
     * @brief Reads a whole file.
     * @throws domain::IoError if the file cannot be opened or read.
     */
    std::string readText(const std::filesystem::path& path);

    /** @brief Creates the directory and its parents if needed. */
    void ensureDirectory(const std::filesystem::path& path);

    /** @brief Recursively deletes a path. A missing path is not an error. */
    void removeAll(const std::filesystem::path& path);

    bool exists(const std::filesystem::path& path);

    /** @brief True for leftovers of an interrupted writeText. */
    static bool IsTempFile(const std::filesystem::path& path);

private:
    static std::filesystem::path makeTempPath(const std::filesystem::path& finalPath);
};

} // namespace novelstore::infrastructure
