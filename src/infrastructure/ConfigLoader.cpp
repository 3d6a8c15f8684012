/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "domain/StoreErrors.hpp"
#include "infrastructure/ProjectLayout.hpp"

namespace novelstore::infrastructure {

namespace fs = std::filesystem;

StoreConfig ConfigLoader::Load(const fs::path& projectRoot) {
    StoreConfig config;
    fs::path configPath = ProjectLayout::GetConfigFile(projectRoot);
    if (!fs::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        config.defaultVolumeTitle = j.value("default_volume_title", config.defaultVolumeTitle);
        config.defaultChangeSummary = j.value("default_change_summary", config.defaultChangeSummary);
        config.persistIndexOnContentUpdate = j.value("persist_index_on_content_update", config.persistIndexOnContentUpdate);
        config.jsonIndent = j.value("json_indent", config.jsonIndent);
        if (config.jsonIndent < -1) {
            config.jsonIndent = -1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json, using defaults: " << e.what() << std::endl;
        return StoreConfig{};
    }

    return config;
}

bool ConfigLoader::Save(const fs::path& projectRoot, const StoreConfig& config, PersistenceService& persistence) {
    fs::path configPath = ProjectLayout::GetConfigFile(projectRoot);
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (fs::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) j = nlohmann::json::object();
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["default_volume_title"] = config.defaultVolumeTitle;
    j["default_change_summary"] = config.defaultChangeSummary;
    j["persist_index_on_content_update"] = config.persistIndexOnContentUpdate;
    j["json_indent"] = config.jsonIndent;

    try {
        persistence.writeText(configPath, j.dump(4));
    } catch (const domain::IoError& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace novelstore::infrastructure
