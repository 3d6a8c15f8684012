/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving store configuration (.novel/settings.json).
 *
 * Provides a unified way to access store tuning without scattering JSON
 * parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <string>

#include "infrastructure/PersistenceService.hpp"

namespace novelstore::infrastructure {

/**
 * @struct StoreConfig
 * @brief Tunables of a project store; every field has a usable default.
 */
struct StoreConfig {
    std::string defaultVolumeTitle = "Volume 1";
    std::string defaultChangeSummary = "Auto-save";
    bool persistIndexOnContentUpdate = false; ///< Re-write project.json after every content update.
    int jsonIndent = 4;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json under the project's metadata directory.
     * @param projectRoot Absolute path to the project root.
     * @return Defaults for a missing or unreadable file; recognised keys override them.
     */
    static StoreConfig Load(const std::filesystem::path& projectRoot);

    /**
     * @brief Writes the config atomically, preserving keys this version does not know.
     * @return false if the file could not be written (the error is logged).
     */
    static bool Save(const std::filesystem::path& projectRoot, const StoreConfig& config, PersistenceService& persistence);
};

} // namespace novelstore::infrastructure
