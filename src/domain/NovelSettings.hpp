/**
 * @file NovelSettings.hpp
 * @brief Reference material kept alongside the manuscript (cast, world, plot).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/Identifiers.hpp"

namespace novelstore::domain {

struct CharacterProfile {
    std::string name;
    std::optional<std::uint32_t> age;
    std::string appearance;
    std::string personality;
    std::string background;
    std::string goals;
    std::map<std::string, std::string> relationships; ///< other character name -> relation
};

struct WorldSetting {
    std::string name;        ///< e.g. "Magic System", "Geography"
    std::string description;
    std::vector<std::string> rules;
};

struct PlotPoint {
    std::string title;
    std::string description;
    std::vector<ChapterId> chapterIds;
    std::size_t order = 0;
};

/**
 * @struct NovelSettings
 * @brief Inert data; each list is persisted as its own document.
 */
struct NovelSettings {
    std::vector<CharacterProfile> characters;
    std::vector<WorldSetting> world;
    std::vector<PlotPoint> plotPoints;
};

} // namespace novelstore::domain
