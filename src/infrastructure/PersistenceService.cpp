/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

#include "domain/StoreErrors.hpp"

namespace novelstore::infrastructure {

namespace fs = std::filesystem;
using domain::IoError;

fs::path PersistenceService::makeTempPath(const fs::path& finalPath) {
    // filename.<ticks>.tmp, unique per operation
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";
    return tempPath;
}

bool PersistenceService::IsTempFile(const fs::path& path) {
    return path.extension() == ".tmp";
}

void PersistenceService::writeText(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        ensureDirectory(path.parent_path());
    }

    fs::path tempPath = makeTempPath(path);
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw IoError("write", tempPath, "cannot open temp file");
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw IoError("write", tempPath, "write failed during output");
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        if (cleanup) {
            std::cerr << "[PersistenceService] Could not remove temp file " << tempPath
                      << ": " << cleanup.message() << std::endl;
        }
        throw IoError("rename", path, ec.message());
    }
}

std::string PersistenceService::readText(const fs::path& path) {
    std::ifstream inFile(path, std::ios::binary);
    if (!inFile) {
        throw IoError("read", path, "cannot open file");
    }
    std::stringstream buffer;
    buffer << inFile.rdbuf();
    if (inFile.bad()) {
        throw IoError("read", path, "read failed");
    }
    return buffer.str();
}

void PersistenceService::ensureDirectory(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw IoError("create_directories", path, ec.message());
    }
    if (!fs::is_directory(path, ec)) {
        throw IoError("create_directories", path, "path exists and is not a directory");
    }
}

void PersistenceService::removeAll(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        throw IoError("remove_all", path, ec.message());
    }
}

bool PersistenceService::exists(const fs::path& path) {
    std::error_code ec;
    bool result = fs::exists(path, ec);
    if (ec) {
        throw IoError("stat", path, ec.message());
    }
    return result;
}

} // namespace novelstore::infrastructure
