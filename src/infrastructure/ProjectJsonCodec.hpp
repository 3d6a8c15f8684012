/**
 * @file ProjectJsonCodec.hpp
 * @brief JSON mapping for every persisted document of a project.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/NovelProject.hpp"

namespace novelstore::infrastructure {

/**
 * @class ProjectJsonCodec
 * @brief Static helpers converting domain objects to and from nlohmann::json.
 *
 * Decoders take the path the document came from so that any failure can be
 * reported as domain::ParseError (Reason::Malformed) naming the file.
 */
class ProjectJsonCodec {
public:
    using json = nlohmann::json;

    /** @brief Parses raw text. @throws domain::ParseError if it is not JSON. */
    static json Parse(const std::string& text, const std::filesystem::path& source);

    // --- Chapters ---
    static json ChapterToJson(const domain::Chapter& chapter); ///< Content is not included.
    static domain::Chapter ChapterFromJson(const json& j, const std::filesystem::path& source);

    static json VersionToJson(const domain::ChapterVersion& version);
    static domain::ChapterVersion VersionFromJson(const json& j, const std::filesystem::path& source);

    // --- Project index ---
    static json VolumeToJson(const domain::Volume& volume);

    /** @brief Root metadata: everything except chapter content and the settings lists. */
    static json ProjectToJson(const domain::NovelProject& project);

    /** @brief Decodes root metadata. rootPath is left empty for the caller to set. */
    static domain::NovelProject ProjectFromJson(const json& j, const std::filesystem::path& source);

    // --- Settings documents ---
    static json CharactersToJson(const std::vector<domain::CharacterProfile>& characters);
    static std::vector<domain::CharacterProfile> CharactersFromJson(const json& j, const std::filesystem::path& source);
    static json WorldToJson(const std::vector<domain::WorldSetting>& world);
    static std::vector<domain::WorldSetting> WorldFromJson(const json& j, const std::filesystem::path& source);
    static json PlotToJson(const std::vector<domain::PlotPoint>& plot);
    static std::vector<domain::PlotPoint> PlotFromJson(const json& j, const std::filesystem::path& source);
};

} // namespace novelstore::infrastructure
